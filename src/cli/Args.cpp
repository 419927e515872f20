#include "cli/Args.hpp"
#include "cli/Parser.hpp"

#include <charconv>
#include <unordered_map>
#include <unordered_set>

using namespace lc::cli;

namespace {

enum class Opt { ByExt, Threads, Config, Json, Verbose, Help, Version };

const std::unordered_map<std::string, Opt> kAliases = {
    {"A", Opt::ByExt}, {"by-ext", Opt::ByExt},
    {"j", Opt::Threads}, {"threads", Opt::Threads},
    {"c", Opt::Config}, {"config", Opt::Config},
    {"json", Opt::Json},
    {"v", Opt::Verbose}, {"verbose", Opt::Verbose},
    {"h", Opt::Help}, {"help", Opt::Help},
    {"V", Opt::Version}, {"version", Opt::Version}
};

const std::unordered_set<std::string> kValueFlags = {"j", "threads", "c", "config"};

std::string display(const std::string& key) {
    return (key.size() == 1 ? "-" : "--") + key;
}

std::string requireValue(const FlagKV& kv) {
    if (!kv.value) throw ArgsError("a value is required for '" + display(kv.key) + "' but none was supplied");
    return *kv.value;
}

}

unsigned int lc::cli::parseThreads(const std::string& value) {
    unsigned int n = 0;
    const auto* first = value.data();
    const auto* last = value.data() + value.size();
    const auto [ptr, ec] = std::from_chars(first, last, n);
    if (value.empty() || ec != std::errc() || ptr != last)
        throw ArgsError("invalid value '" + value + "' for '--threads <THREADS>': expected an unsigned integer");
    return n;
}

Args Args::parse(const int argc, char** argv) {
    std::vector<std::string> args;
    args.reserve(argc > 1 ? argc - 1 : 0);
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    return parse(args);
}

Args Args::parse(const std::vector<std::string>& args) {
    const auto call = parseTokens(tokenize(args, kValueFlags), kValueFlags);

    Args out;
    for (const auto& kv : call.options) {
        const auto it = kAliases.find(kv.key);
        if (it == kAliases.end()) throw ArgsError("unexpected argument '" + display(kv.key) + "' found");

        switch (it->second) {
            case Opt::ByExt: out.by_ext = true; break;
            case Opt::Threads: out.threads = parseThreads(requireValue(kv)); break;
            case Opt::Config: out.config_path = requireValue(kv); break;
            case Opt::Json: out.json = true; break;
            case Opt::Verbose: out.verbose = true; break;
            case Opt::Help: out.help = true; break;
            case Opt::Version: out.version = true; break;
        }
    }

    if (out.help || out.version) return out;

    if (call.positionals.empty())
        throw ArgsError("the following required arguments were not provided: <DIRECTORY>");
    if (call.positionals.size() > 1)
        throw ArgsError("unexpected argument '" + call.positionals[1] + "' found");

    out.directory = call.positionals.front();
    return out;
}

std::string lc::cli::usage(const std::string& program) {
    return "Usage: " + program + " [OPTIONS] <DIRECTORY>\n"
           "\n"
           "Count empty and non-empty lines of every file under DIRECTORY.\n"
           "\n"
           "Options:\n"
           "  -A, --by-ext             Report counts per file extension\n"
           "  -j, --threads <THREADS>  Worker threads; 1 or less counts sequentially [default: 1]\n"
           "      --json               Print the result as JSON\n"
           "  -c, --config <PATH>      YAML config file [env: LINECOUNT_CONFIG]\n"
           "  -v, --verbose            Debug logging on stderr\n"
           "  -h, --help               Print help\n"
           "  -V, --version            Print version\n";
}
