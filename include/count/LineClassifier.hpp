#pragma once

#include "types/stats/FileStat.hpp"

#include <filesystem>

namespace lc::count {

struct ClassifierOptions {
    bool validate_utf8 = true;
};

class LineClassifier {
public:
    // Uses the counting section of the registered config
    static types::FileStat classify(const std::filesystem::path& path);

    /*
     * Counts the '\n'-separated lines of a file; a line is empty when it is
     * whitespace-only after trimming. Throws std::runtime_error if the file cannot
     * be opened. A read error or a malformed line discards the whole file and
     * returns {0, 0}, even when earlier lines were already counted.
     */
    static types::FileStat classify(const std::filesystem::path& path, const ClassifierOptions& opts);
};

}
