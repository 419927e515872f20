#include "cli/Report.hpp"

#include <algorithm>
#include <variant>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

using namespace lc::types;

std::vector<std::string> lc::cli::sortedExtensions(const ExtensionStats& stats) {
    std::vector<std::string> keys;
    keys.reserve(stats.size());
    for (const auto& [ext, _] : stats) keys.push_back(ext);
    std::ranges::sort(keys);
    return keys;
}

std::string lc::cli::formatText(const FileStat& stat) {
    return fmt::format("There are {} lines of code.\n"
                       "There are {} empty lines.\n"
                       "{:.2f}% of the lines are empty.\n",
                       stat.non_empty_lines, stat.empty_lines, stat.percentEmpty());
}

std::string lc::cli::formatText(const std::string& ext, const FileStat& stat) {
    return fmt::format("There are {} lines of code in \"{}\" files.\n"
                       "There are {} empty lines in \"{}\" files.\n"
                       "{:.2f}% of the lines in \"{}\" files are empty.\n",
                       stat.non_empty_lines, ext, stat.empty_lines, ext, stat.percentEmpty(), ext);
}

std::string lc::cli::formatText(const AggregateResult& result) {
    if (const auto* stat = std::get_if<FileStat>(&result)) return formatText(*stat);

    const auto& byExt = std::get<ExtensionStats>(result);
    std::string out;
    for (const auto& ext : sortedExtensions(byExt)) out += formatText(ext, byExt.at(ext));
    return out;
}

nlohmann::json lc::cli::toJson(const AggregateResult& result) {
    if (const auto* stat = std::get_if<FileStat>(&result)) return *stat;

    const auto& byExt = std::get<ExtensionStats>(result);
    nlohmann::json exts = nlohmann::json::object();
    for (const auto& ext : sortedExtensions(byExt)) exts[ext] = byExt.at(ext);
    return {{"by_extension", exts}};
}

void lc::cli::printReport(const AggregateResult& result, const ReportFormat format, std::FILE* out) {
    if (format == ReportFormat::Json) fmt::print(out, "{}\n", toJson(result).dump(2));
    else fmt::print(out, "{}", formatText(result));
    std::fflush(out);
}
