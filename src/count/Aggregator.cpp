#include "count/Aggregator.hpp"

#include <stdexcept>
#include <variant>

using namespace lc::count;
using namespace lc::types;

FileStat Aggregator::combine(const FileStat& a, const FileStat& b) {
    return a + b;
}

void Aggregator::fold(ExtensionStats& into, const std::string& ext, const FileStat& stat) {
    if (const auto it = into.find(ext); it != into.end()) it->second += stat;
    else into.emplace(ext, stat);
}

void Aggregator::merge(ExtensionStats& into, const ExtensionStats& from) {
    for (const auto& [ext, stat] : from) fold(into, ext, stat);
}

void Aggregator::merge(AggregateResult& into, const AggregateResult& from) {
    if (into.index() != from.index())
        throw std::invalid_argument("[Aggregator] Cannot merge a global result with a by-extension result");

    if (auto* stat = std::get_if<FileStat>(&into)) *stat += std::get<FileStat>(from);
    else merge(std::get<ExtensionStats>(into), std::get<ExtensionStats>(from));
}

void Aggregator::accumulate(AggregateResult& into, const std::filesystem::path& path, const FileStat& stat) {
    if (auto* sum = std::get_if<FileStat>(&into)) *sum += stat;
    else fold(std::get<ExtensionStats>(into), extensionOf(path), stat);
}

AggregateResult Aggregator::identity(const CountMode mode) {
    if (mode == CountMode::ByExtension) return ExtensionStats{};
    return FileStat{};
}

FileStat Aggregator::total(const ExtensionStats& stats) {
    FileStat sum;
    for (const auto& [_, stat] : stats) sum += stat;
    return sum;
}

FileStat Aggregator::total(const AggregateResult& result) {
    if (const auto* stat = std::get_if<FileStat>(&result)) return *stat;
    return total(std::get<ExtensionStats>(result));
}

std::string Aggregator::extensionOf(const std::filesystem::path& path) {
    // path::extension() keeps the dot and treats ".bashrc" as a stem
    const auto ext = path.extension().string();
    return ext.empty() ? ext : ext.substr(1);
}
