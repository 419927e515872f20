// CLI
#include "cli/Args.hpp"
#include "cli/Report.hpp"

// Counting
#include "discovery/Discoverer.hpp"
#include "count/LineCounter.hpp"

// Misc
#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"

// Libraries
#include <fmt/core.h>
#include <nlohmann/json.hpp>

#ifndef LINECOUNT_VERSION
#define LINECOUNT_VERSION "0.0.0"
#endif

using namespace lc::cli;
using namespace lc::config;
using namespace lc::count;
using namespace lc::discovery;
using namespace lc::logging;
using namespace lc::types;

namespace {

void raiseToDebug(LogLevelsConfig& levels) {
    levels.console_log_level = spdlog::level::debug;
    auto& sub = levels.subsystem_levels;
    sub.linecount = sub.discovery = sub.counting = sub.concurrency = sub.config = spdlog::level::debug;
}

}

int main(int argc, char** argv) {
    Args args;
    try {
        args = Args::parse(argc, argv);
    } catch (const ArgsError& e) {
        fmt::print(stderr, "error: {}\n\n{}", e.what(), usage());
        return 2;
    }

    if (args.help) {
        fmt::print("{}", usage());
        return 0;
    }

    if (args.version) {
        fmt::print("linecount {}\n", LINECOUNT_VERSION);
        return 0;
    }

    Config cfg;
    try {
        if (const auto path = ConfigRegistry::resolvePath(args.config_path)) cfg = loadConfig(*path);
    } catch (const std::exception& e) {
        fmt::print(stderr, "error: {}\n", e.what());
        return 2;
    }

    if (args.verbose) raiseToDebug(cfg.logging.levels);

    try {
        ConfigRegistry::init(cfg);
        LogRegistry::init();

        LogRegistry::config()->debug("[main] Effective config: {}", nlohmann::json(ConfigRegistry::get()).dump());

        const auto& counting = ConfigRegistry::get().counting;
        const auto mode = args.by_ext.value_or(counting.by_extension) ? CountMode::ByExtension : CountMode::Global;
        const auto threads = args.threads.value_or(counting.threads);

        const auto files = Discoverer::discover(args.directory);
        LogRegistry::linecount()->info("[main] Counting {} files under {} ({}, {} threads)",
                                       files.size(), args.directory.string(), to_string(mode), threads);

        const auto result = LineCounter::run(files, mode, threads);
        printReport(result, args.json ? ReportFormat::Json : ReportFormat::Text);
    } catch (const std::exception& e) {
        if (LogRegistry::isInitialized()) LogRegistry::linecount()->error("[main] {}", e.what());
        else fmt::print(stderr, "error: {}\n", e.what());
        return 1;
    }

    return 0;
}
