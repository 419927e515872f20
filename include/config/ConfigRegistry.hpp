#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <mutex>
#include <optional>

namespace lc::config {

class ConfigRegistry {
public:
    static constexpr const char* ENV_CONFIG_PATH = "LINECOUNT_CONFIG";

    // Loads from path, else $LINECOUNT_CONFIG, else built-in defaults
    static void init(const std::optional<std::filesystem::path>& path = std::nullopt);
    static void init(Config config);

    static const Config& get();

    [[nodiscard]] static bool isInitialized();

    static std::optional<std::filesystem::path> resolvePath(const std::optional<std::filesystem::path>& path);

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

} // namespace lc::config
