#include "logging/LogRegistry.hpp"
#include "config/ConfigRegistry.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <filesystem>
#include <stdexcept>
#include <vector>

namespace lc::logging {

void LogRegistry::init() {
    init(config::ConfigRegistry::get().logging);
}

void LogRegistry::init(const config::LoggingConfig& cnf) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    // stdout carries the report, so console logging goes to stderr
    const auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    consoleSink->set_level(cnf.levels.console_log_level);
    consoleSink->set_color_mode(spdlog::color_mode::automatic);
    consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");

    std::vector<spdlog::sink_ptr> sinks{consoleSink};

    if (!cnf.log_dir.empty()) {
        namespace fs = std::filesystem;
        if (!fs::exists(cnf.log_dir)) fs::create_directories(cnf.log_dir);

        const auto log_file = cnf.log_dir / "linecount.log";
        const auto rotatingSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(log_file.string(), 1024 * 1024 * 10, 5);
        rotatingSink->set_level(cnf.levels.file_log_level);
        sinks.push_back(rotatingSink);
    }

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;

    makeLogger("linecount", sub_levels.linecount);
    makeLogger("discovery", sub_levels.discovery);
    makeLogger("counting", sub_levels.counting);
    makeLogger("concurrency", sub_levels.concurrency);
    makeLogger("config", sub_levels.config);

    initialized_ = true;
    if (!cnf.log_dir.empty()) linecount()->debug("[LogRegistry] Initialized, LogDir: {}", cnf.log_dir.string());
}

std::shared_ptr<spdlog::logger> LogRegistry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

bool LogRegistry::isInitialized() { return initialized_; }

}
