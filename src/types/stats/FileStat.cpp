#include "types/stats/FileStat.hpp"

#include <nlohmann/json.hpp>

using namespace lc::types;

double FileStat::percentEmpty() const {
    const auto lines = total();
    if (lines == 0) return 0.0;
    return static_cast<double>(empty_lines) / static_cast<double>(lines) * 100.0;
}

FileStat& FileStat::operator+=(const FileStat& other) {
    non_empty_lines += other.non_empty_lines;
    empty_lines += other.empty_lines;
    return *this;
}

FileStat lc::types::operator+(FileStat lhs, const FileStat& rhs) {
    lhs += rhs;
    return lhs;
}

std::string lc::types::to_string(const CountMode mode) {
    switch (mode) {
        case CountMode::Global: return "global";
        case CountMode::ByExtension: return "by-extension";
        default: return "unknown";
    }
}

void lc::types::to_json(nlohmann::json& j, const FileStat& stat) {
    j = {
        {"lines_of_code", stat.non_empty_lines},
        {"empty_lines", stat.empty_lines},
        {"percent_empty", stat.percentEmpty()}
    };
}
