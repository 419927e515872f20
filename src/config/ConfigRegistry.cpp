#include "config/ConfigRegistry.hpp"

#include <cstdlib>
#include <stdexcept>

namespace lc::config {

std::optional<std::filesystem::path> ConfigRegistry::resolvePath(const std::optional<std::filesystem::path>& path) {
    if (path) return path;
    if (const char* env = std::getenv(ENV_CONFIG_PATH); env && *env) return std::filesystem::path(env);
    return std::nullopt;
}

void ConfigRegistry::init(const std::optional<std::filesystem::path>& path) {
    const auto resolved = resolvePath(path);
    init(resolved ? loadConfig(*resolved) : Config{});
}

void ConfigRegistry::init(Config config) {
    std::call_once(init_flag_, [&]() {
        config_ = std::move(config);
        initialized_ = true;
    });
}

const Config& ConfigRegistry::get() {
    ensureInitialized();
    return config_;
}

bool ConfigRegistry::isInitialized() { return initialized_; }

void ConfigRegistry::ensureInitialized() {
    if (!initialized_)
        throw std::runtime_error("ConfigRegistry accessed before initialization. Call ConfigRegistry::init() first.");
}

} // namespace lc::config
