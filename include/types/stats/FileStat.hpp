#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <variant>
#include <nlohmann/json_fwd.hpp>

namespace lc::types {

struct FileStat {
    uint64_t non_empty_lines{}, empty_lines{};

    [[nodiscard]] uint64_t total() const { return non_empty_lines + empty_lines; }

    // 0.0 when there are no lines at all
    [[nodiscard]] double percentEmpty() const;

    FileStat& operator+=(const FileStat& other);

    bool operator==(const FileStat& other) const = default;
};

FileStat operator+(FileStat lhs, const FileStat& rhs);

// Keyed by the text after the final '.' of the file name, "" for none
using ExtensionStats = std::unordered_map<std::string, FileStat>;

using AggregateResult = std::variant<FileStat, ExtensionStats>;

enum class CountMode { Global, ByExtension };

std::string to_string(CountMode mode);

void to_json(nlohmann::json& j, const FileStat& stat);

}
