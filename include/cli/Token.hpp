#pragma once

#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace lc::cli {

enum class TokenType { Word, Flag };

struct Token {
    TokenType type;
    std::string text;
};

inline bool looks_negative_number(std::string_view s) {
    if (s.size() < 2 || s[0] != '-') return false;
    bool dot = false, digit = false;
    for (size_t i = 1; i < s.size(); ++i) {
        const char c = s[i];
        if (c >= '0' && c <= '9') { digit = true; continue; }
        if (c == '.' && !dot) { dot = true; continue; }
        return false;
    }
    return digit;
}

inline void pushFlag(std::vector<Token>& out, std::string k) {
    while (!k.empty() && k[0] == '-') k.erase(k.begin());
    out.push_back({TokenType::Flag, std::move(k)});
}

inline void pushWord(std::vector<Token>& out, std::string v) {
    out.push_back({TokenType::Word, std::move(v)});
}

/*
 * Expand a short cluster "-abc". A value-taking short flag swallows the rest of the
 * cluster as its glued value, so "-j4" is {j, 4} and "-Aj4" is {A, j, 4}.
 */
inline void expand_bundle(std::string_view bundle, std::vector<Token>& out,
                          const std::unordered_set<std::string>& valueFlags) {
    for (size_t i = 0; i < bundle.size(); ++i) {
        std::string key(1, bundle[i]);
        const bool takesValue = valueFlags.contains(key);
        pushFlag(out, std::move(key));
        if (takesValue && i + 1 < bundle.size()) {
            pushWord(out, std::string(bundle.substr(i + 1)));
            return;
        }
    }
}

// argv is already split by the shell; only flag syntax is interpreted here
inline std::vector<Token> tokenize(const std::vector<std::string>& args,
                                   const std::unordered_set<std::string>& valueFlags = {}) {
    std::vector<Token> out;
    out.reserve(args.size() + 4);

    bool stop_flags = false;
    for (const auto& arg : args) {
        if (stop_flags || arg == "-" || looks_negative_number(arg) || arg.empty() || arg[0] != '-') {
            pushWord(out, arg);
            continue;
        }

        // Sentinel "--" arrives as a Word so the parser can see it
        if (arg == "--") {
            stop_flags = true;
            pushWord(out, arg);
            continue;
        }

        if (arg.starts_with("--")) {
            const auto body = std::string_view(arg).substr(2);
            if (const auto eq = body.find('='); eq != std::string_view::npos) {
                pushFlag(out, std::string(body.substr(0, eq)));
                pushWord(out, std::string(body.substr(eq + 1)));
            } else {
                pushFlag(out, std::string(body));
            }
            continue;
        }

        expand_bundle(std::string_view(arg).substr(1), out, valueFlags);
    }

    return out;
}

}
