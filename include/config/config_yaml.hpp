#pragma once

#include "config/Config.hpp"

#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace ms::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

static spdlog::level::level_enum levelOr(const Node& node, const spdlog::level::level_enum def) {
    if (!node) return def;
    const auto lvl = spdlog::level::from_str(node.as<std::string>());
    // from_str maps unknown names to "off"
    if (lvl == spdlog::level::off && node.as<std::string>() != "off")
        throw ParserException(node.Mark(), "invalid log level: " + node.as<std::string>());
    return lvl;
}

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["mirrorsync"] = to_std_string(spdlog::level::to_string_view(rhs.mirrorsync));
        node["sync"]       = to_std_string(spdlog::level::to_string_view(rhs.sync));
        node["storage"]    = to_std_string(spdlog::level::to_string_view(rhs.storage));
        node["cloud"]      = to_std_string(spdlog::level::to_string_view(rhs.cloud));
        node["watch"]      = to_std_string(spdlog::level::to_string_view(rhs.watch));
        node["session"]    = to_std_string(spdlog::level::to_string_view(rhs.session));
        node["config"]     = to_std_string(spdlog::level::to_string_view(rhs.config));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.mirrorsync = levelOr(node["mirrorsync"], rhs.mirrorsync);
        rhs.sync       = levelOr(node["sync"], rhs.sync);
        rhs.storage    = levelOr(node["storage"], rhs.storage);
        rhs.cloud      = levelOr(node["cloud"], rhs.cloud);
        rhs.watch      = levelOr(node["watch"], rhs.watch);
        rhs.session    = levelOr(node["session"], rhs.session);
        rhs.config     = levelOr(node["config"], rhs.config);
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"] = convert<SubsystemLogLevelsConfig>::encode(rhs.subsystem_levels);
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = levelOr(node["console_log_level"], rhs.console_log_level);
        rhs.file_log_level = levelOr(node["file_log_level"], rhs.file_log_level);
        if (const auto sub = node["subsystem_levels"])
            convert<SubsystemLogLevelsConfig>::decode(sub, rhs.subsystem_levels);
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["levels"] = convert<LogLevelsConfig>::encode(rhs.levels);
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        if (const auto dir = node["log_dir"]) rhs.log_dir = expandHome(dir.as<std::string>());
        if (const auto levels = node["levels"]) convert<LogLevelsConfig>::decode(levels, rhs.levels);
        return true;
    }
};

template<>
struct convert<MirrorConfig> {
    static Node encode(const MirrorConfig& rhs) {
        Node node;
        node["max_workers"] = rhs.max_workers;
        node["queue_capacity"] = rhs.queue_capacity;
        node["sessions"] = rhs.sessions;
        node["session_dir"] = rhs.session_dir.string();
        node["watch_poll_interval_ms"] = rhs.watch_poll_interval_ms;
        node["multipart_threshold_mb"] = rhs.multipart_threshold_bytes / (1024 * 1024);
        node["part_size_mb"] = rhs.part_size_bytes / (1024 * 1024);
        return node;
    }

    static bool decode(const Node& node, MirrorConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.max_workers = node["max_workers"].as<unsigned int>(0);
        rhs.queue_capacity = node["queue_capacity"].as<size_t>(1024);
        rhs.sessions = node["sessions"].as<bool>(true);
        if (const auto dir = node["session_dir"]; dir && !dir.as<std::string>().empty())
            rhs.session_dir = expandHome(dir.as<std::string>());
        rhs.watch_poll_interval_ms = node["watch_poll_interval_ms"].as<unsigned int>(250);
        rhs.multipart_threshold_bytes = node["multipart_threshold_mb"].as<uintmax_t>(64) * 1024 * 1024;
        rhs.part_size_bytes = std::max<uintmax_t>(node["part_size_mb"].as<uintmax_t>(16) * 1024 * 1024,
                                                  MIN_PART_SIZE_BYTES);
        if (rhs.queue_capacity == 0) rhs.queue_capacity = 1;
        return true;
    }
};

template<>
struct convert<AliasConfig> {
    static Node encode(const AliasConfig& rhs) {
        Node node;
        node["url"] = rhs.url;
        node["access_key"] = rhs.access_key;
        node["secret_key"] = rhs.secret_key;
        node["region"] = rhs.region;
        return node;
    }

    static bool decode(const Node& node, AliasConfig& rhs) {
        if (!node.IsMap() || !node["url"]) return false;
        rhs.url = node["url"].as<std::string>();
        while (!rhs.url.empty() && rhs.url.back() == '/') rhs.url.pop_back();
        rhs.access_key = node["access_key"].as<std::string>("");
        rhs.secret_key = node["secret_key"].as<std::string>("");
        rhs.region = node["region"].as<std::string>("us-east-1");
        return true;
    }
};

}
