#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <stdexcept>
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace lc::config {

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;

    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("[Config] Failed to load " + path.string() + ": " + e.what());
    }

    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw std::runtime_error("[Config] Top level of " + path.string() + " must be a mapping");

    try {
        YAML::decodeSection(root, "logging", cfg.logging, "logging");
        YAML::decodeSection(root, "counting", cfg.counting, "counting");
        YAML::decodeSection(root, "discovery", cfg.discovery, "discovery");
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("[Config] Invalid value in " + path.string() + ": " + e.what());
    }

    return cfg;
}

static std::string levelName(const spdlog::level::level_enum lvl) {
    const auto sv = spdlog::level::to_string_view(lvl);
    return {sv.data(), sv.size()};
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"logging", c.logging},
        {"counting", c.counting},
        {"discovery", c.discovery}
    };
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"log_dir", c.log_dir.string()},
        {"log_levels", c.levels}
    };
}

void to_json(nlohmann::json& j, const LogLevelsConfig& c) {
    j = {
        {"console_log_level", levelName(c.console_log_level)},
        {"file_log_level", levelName(c.file_log_level)},
        {"subsystem_levels", c.subsystem_levels}
    };
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    j = {
        {"linecount", levelName(c.linecount)},
        {"discovery", levelName(c.discovery)},
        {"counting", levelName(c.counting)},
        {"concurrency", levelName(c.concurrency)},
        {"config", levelName(c.config)}
    };
}

void to_json(nlohmann::json& j, const CountingConfig& c) {
    j = {
        {"threads", c.threads},
        {"by_extension", c.by_extension},
        {"validate_utf8", c.validate_utf8},
        {"tasks_per_worker", c.tasks_per_worker}
    };
}

void to_json(nlohmann::json& j, const DiscoveryConfig& c) {
    j = {{"follow_symlinks", c.follow_symlinks}};
}

} // namespace lc::config
