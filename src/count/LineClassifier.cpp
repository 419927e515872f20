#include "count/LineClassifier.hpp"
#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"
#include "util/utf8.hpp"

#include <fstream>
#include <stdexcept>
#include <string>

using namespace lc::count;
using namespace lc::types;
using namespace lc::config;
using namespace lc::logging;

FileStat LineClassifier::classify(const std::filesystem::path& path) {
    return classify(path, {.validate_utf8 = ConfigRegistry::get().counting.validate_utf8});
}

FileStat LineClassifier::classify(const std::filesystem::path& path, const ClassifierOptions& opts) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) throw std::runtime_error("[LineClassifier] Unable to open file: " + path.string());

    FileStat stat;
    std::string line;
    uint64_t lineNo = 0;

    while (std::getline(in, line)) {
        ++lineNo;
        const auto scan = util::scanLine(line, opts.validate_utf8);
        if (!scan.valid) {
            LogRegistry::counting()->debug("[LineClassifier] Discarding {}: invalid UTF-8 on line {}", path.string(), lineNo);
            return {};
        }

        if (scan.blank) ++stat.empty_lines;
        else ++stat.non_empty_lines;
    }

    if (in.bad()) {
        LogRegistry::counting()->debug("[LineClassifier] Discarding {}: read error after line {}", path.string(), lineNo);
        return {};
    }

    return stat;
}
