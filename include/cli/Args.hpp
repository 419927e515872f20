#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace lc::cli {

// Invalid or missing command-line arguments
struct ArgsError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct Args {
    std::filesystem::path directory;
    std::optional<bool> by_ext;            // unset: take the config default
    std::optional<unsigned int> threads;   // unset: take the config default
    std::optional<std::filesystem::path> config_path;
    bool json = false;
    bool verbose = false;
    bool help = false;
    bool version = false;

    static Args parse(int argc, char** argv);

    // args excludes the program name
    static Args parse(const std::vector<std::string>& args);
};

std::string usage(const std::string& program = "linecount");

unsigned int parseThreads(const std::string& value);

}
