#pragma once

#include <optional>
#include <string>
#include <vector>

namespace lc::cli {

struct FlagKV {
    std::string key;
    std::optional<std::string> value;
};

struct CommandCall {
    std::vector<FlagKV> options;
    std::vector<std::string> positionals;

    [[nodiscard]] bool has(const std::string& key) const {
        for (const auto& [k, _] : options) if (k == key) return true;
        return false;
    }

    [[nodiscard]] std::optional<std::string> value(const std::string& key) const {
        for (const auto& [k, v] : options) if (k == key) return v;
        return std::nullopt;
    }
};

}
