#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <thread>
#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

namespace ms::config {

unsigned int MirrorConfig::effectiveWorkers() const {
    if (max_workers > 0) return max_workers;
    const unsigned int hw = std::thread::hardware_concurrency();
    return std::max(hw > 1 ? hw - 1 : 1u, 1u);
}

std::filesystem::path homeDir() {
    if (const char* home = std::getenv("HOME"); home && *home) return home;
    return std::filesystem::temp_directory_path();
}

std::filesystem::path expandHome(const std::string& p) {
    if (p == "~") return homeDir();
    if (p.starts_with("~/")) return homeDir() / p.substr(2);
    return p;
}

Config defaultConfig() {
    Config cfg;
    cfg.logging.log_dir = homeDir() / ".mirrorsync" / "logs";
    cfg.mirror.session_dir = homeDir() / ".mirrorsync" / "session";
    return cfg;
}

Config loadConfig(const std::filesystem::path& path) {
    Config cfg = defaultConfig();
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(fmt::format("Failed to load config {}: {}", path.string(), e.what()));
    }

    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);
    if (auto node = root["mirror"]) YAML::convert<MirrorConfig>::decode(node, cfg.mirror);

    if (auto node = root["aliases"]) {
        if (!node.IsMap()) throw std::runtime_error("Config section 'aliases' must be a map");
        for (const auto& kv : node) {
            const auto name = kv.first.as<std::string>();
            AliasConfig alias;
            if (!YAML::convert<AliasConfig>::decode(kv.second, alias))
                throw std::runtime_error(fmt::format("Alias '{}' is missing a url", name));
            cfg.aliases.emplace(name, std::move(alias));
        }
    }

    return cfg;
}

}
