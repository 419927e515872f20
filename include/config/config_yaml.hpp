#pragma once

#include "config/Config.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace lc::config;

template <typename T> T getOrDefault(const Node& node, const std::string& key, const T& def) {
    return node[key] ? node[key].as<T>() : def;
}

// A missing or null section keeps the defaults; anything but a mapping is rejected
template <typename T> void decodeSection(const Node& parent, const std::string& key, T& out, const std::string& name) {
    const auto node = parent[key];
    if (!node || node.IsNull()) return;
    if (!convert<T>::decode(node, out)) throw std::runtime_error("[Config] Section '" + name + "' must be a mapping");
}

static spdlog::level::level_enum levelOr(const Node& node, const spdlog::level::level_enum def) {
    if (!node) return def;
    const auto lvl = spdlog::level::from_str(node.as<std::string>());
    // from_str falls back to "off" for unknown names
    if (lvl == spdlog::level::off && node.as<std::string>() != "off") return def;
    return lvl;
}

template<>
struct convert<SubsystemLogLevelsConfig> {
    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        const SubsystemLogLevelsConfig def;
        rhs.linecount   = levelOr(node["linecount"], def.linecount);
        rhs.discovery   = levelOr(node["discovery"], def.discovery);
        rhs.counting    = levelOr(node["counting"], def.counting);
        rhs.concurrency = levelOr(node["concurrency"], def.concurrency);
        rhs.config      = levelOr(node["config"], def.config);
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        const LogLevelsConfig def;
        rhs.console_log_level = levelOr(node["console_log_level"], def.console_log_level);
        rhs.file_log_level = levelOr(node["file_log_level"], def.file_log_level);
        decodeSection(node, "subsystem_levels", rhs.subsystem_levels, "logging.log_levels.subsystem_levels");
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = getOrDefault<std::string>(node, "log_dir", "");
        decodeSection(node, "log_levels", rhs.levels, "logging.log_levels");
        return true;
    }
};

template<>
struct convert<CountingConfig> {
    static bool decode(const Node& node, CountingConfig& rhs) {
        if (!node.IsMap()) return false;
        const CountingConfig def;
        rhs.threads = getOrDefault(node, "threads", def.threads);
        rhs.by_extension = getOrDefault(node, "by_extension", def.by_extension);
        rhs.validate_utf8 = getOrDefault(node, "validate_utf8", def.validate_utf8);
        rhs.tasks_per_worker = std::max(getOrDefault(node, "tasks_per_worker", def.tasks_per_worker), 1u);
        return true;
    }
};

template<>
struct convert<DiscoveryConfig> {
    static bool decode(const Node& node, DiscoveryConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.follow_symlinks = getOrDefault(node, "follow_symlinks", DiscoveryConfig{}.follow_symlinks);
        return true;
    }
};

} // namespace YAML
