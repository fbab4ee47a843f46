#include "config/ConfigRegistry.hpp"

#include <cstdlib>
#include <stdexcept>
#include <fmt/format.h>

namespace ms::config {

std::filesystem::path ConfigRegistry::defaultPath() {
    if (const char* env = std::getenv("MIRRORSYNC_CONFIG"); env && *env) return env;
    return homeDir() / ".mirrorsync" / "config.yaml";
}

void ConfigRegistry::init(const std::optional<std::filesystem::path>& path) {
    std::call_once(init_flag_, [&]() {
        if (path) {
            if (!std::filesystem::exists(*path))
                throw std::runtime_error(fmt::format("Config file not found: {}", path->string()));
            config_ = loadConfig(*path);
        } else if (const auto def = defaultPath(); std::filesystem::exists(def)) {
            config_ = loadConfig(def);
        } else {
            config_ = defaultConfig();
        }
        initialized_ = true;
    });
}

void ConfigRegistry::initForTesting(Config cfg) {
    config_ = std::move(cfg);
    initialized_ = true;
}

const Config& ConfigRegistry::get() {
    ensureInitialized();
    return config_;
}

void ConfigRegistry::ensureInitialized() {
    if (!initialized_)
        throw std::runtime_error("ConfigRegistry accessed before initialization. Call ConfigRegistry::init() first.");
}

} // namespace ms::config
