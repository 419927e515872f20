#pragma once

#include "types/stats/FileStat.hpp"

#include <cstdio>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace lc::cli {

enum class ReportFormat { Text, Json };

// Extensions in display order
std::vector<std::string> sortedExtensions(const types::ExtensionStats& stats);

std::string formatText(const types::FileStat& stat);
std::string formatText(const std::string& ext, const types::FileStat& stat);
std::string formatText(const types::AggregateResult& result);

nlohmann::json toJson(const types::AggregateResult& result);

void printReport(const types::AggregateResult& result, ReportFormat format, std::FILE* out = stdout);

}
