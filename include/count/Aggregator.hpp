#pragma once

#include "types/stats/FileStat.hpp"

#include <filesystem>
#include <string>

namespace lc::count {

class Aggregator {
public:
    static types::FileStat combine(const types::FileStat& a, const types::FileStat& b);

    // Combines into an existing entry or inserts a fresh one
    static void fold(types::ExtensionStats& into, const std::string& ext, const types::FileStat& stat);

    static void merge(types::ExtensionStats& into, const types::ExtensionStats& from);

    // Both sides must hold the same alternative
    static void merge(types::AggregateResult& into, const types::AggregateResult& from);

    // Folds a single file's stat into a running result of either mode
    static void accumulate(types::AggregateResult& into, const std::filesystem::path& path, const types::FileStat& stat);

    static types::AggregateResult identity(types::CountMode mode);

    static types::FileStat total(const types::ExtensionStats& stats);

    static types::FileStat total(const types::AggregateResult& result);

    // Text after the final '.' of the file name; "" when there is none
    static std::string extensionOf(const std::filesystem::path& path);

    static double percentEmpty(const types::FileStat& stat) { return stat.percentEmpty(); }
};

}
