#pragma once

#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace lc::config {

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum linecount    = spdlog::level::info;   // Startup, totals, fatal errors
    spdlog::level::level_enum discovery    = spdlog::level::warn;   // Unreadable directories, symlink cycles
    spdlog::level::level_enum counting     = spdlog::level::warn;   // Discarded files
    spdlog::level::level_enum concurrency  = spdlog::level::warn;   // Pool lifecycle and task failures
    spdlog::level::level_enum config       = spdlog::level::warn;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::warn;
    spdlog::level::level_enum file_log_level = spdlog::level::info;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir;  // empty disables the file sink
    LogLevelsConfig levels;
};

struct CountingConfig {
    unsigned int threads = 1;
    bool by_extension = false;
    bool validate_utf8 = true;
    unsigned int tasks_per_worker = 4;
};

struct DiscoveryConfig {
    bool follow_symlinks = true;
};

struct Config {
    LoggingConfig logging;
    CountingConfig counting;
    DiscoveryConfig discovery;
};

Config loadConfig(const std::filesystem::path& path);

void to_json(nlohmann::json& j, const Config& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void to_json(nlohmann::json& j, const LogLevelsConfig& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);
void to_json(nlohmann::json& j, const CountingConfig& c);
void to_json(nlohmann::json& j, const DiscoveryConfig& c);

} // namespace lc::config
