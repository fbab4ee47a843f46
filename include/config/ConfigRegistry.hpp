#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <mutex>
#include <optional>

namespace ms::config {

class ConfigRegistry {
public:
    // explicit path must exist; otherwise MIRRORSYNC_CONFIG or ~/.mirrorsync/config.yaml is used when present
    static void init(const std::optional<std::filesystem::path>& path = std::nullopt);
    static void initForTesting(Config cfg);
    static const Config& get();

    [[nodiscard]] static std::filesystem::path defaultPath();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

} // namespace ms::config
