#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace lc::config { struct LoggingConfig; }

namespace lc::logging {

class LogRegistry {
public:
    // Initialize all loggers with sinks/levels from the registered config.
    static void init();
    static void init(const config::LoggingConfig& cnf);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> linecount()   { return get("linecount"); }
    static std::shared_ptr<spdlog::logger> discovery()   { return get("discovery"); }
    static std::shared_ptr<spdlog::logger> counting()    { return get("counting"); }
    static std::shared_ptr<spdlog::logger> concurrency() { return get("concurrency"); }
    static std::shared_ptr<spdlog::logger> config()      { return get("config"); }

    [[nodiscard]] static bool isInitialized();

private:
    static inline bool initialized_ = false;
};

} // namespace lc::logging
