#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <spdlog/spdlog.h>

namespace ms::config {

constexpr static uintmax_t MIN_PART_SIZE_BYTES = 5 * 1024 * 1024; // S3 minimum part size

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum mirrorsync = spdlog::level::info;
    spdlog::level::level_enum sync = spdlog::level::info;
    spdlog::level::level_enum storage = spdlog::level::info;
    spdlog::level::level_enum cloud = spdlog::level::info;
    spdlog::level::level_enum watch = spdlog::level::info;
    spdlog::level::level_enum session = spdlog::level::info;
    spdlog::level::level_enum config = spdlog::level::info;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::warn;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir;
    LogLevelsConfig levels;
};

struct MirrorConfig {
    unsigned int max_workers = 0; // 0 = max(hardware_concurrency - 1, 1)
    size_t queue_capacity = 1024;
    bool sessions = true;
    std::filesystem::path session_dir;
    unsigned int watch_poll_interval_ms = 250;
    uintmax_t multipart_threshold_bytes = 64 * 1024 * 1024;
    uintmax_t part_size_bytes = 16 * 1024 * 1024;

    [[nodiscard]] unsigned int effectiveWorkers() const;
};

struct AliasConfig {
    std::string url;
    std::string access_key;
    std::string secret_key;
    std::string region = "us-east-1";
};

// Process-wide display switches, fixed once at startup and passed by reference.
struct DisplayConfig {
    bool quiet = false;
    bool json = false;
    bool debug = false;
    bool color = true;
};

struct Config {
    LoggingConfig logging;
    MirrorConfig mirror;
    std::map<std::string, AliasConfig> aliases;
};

[[nodiscard]] std::filesystem::path homeDir();
[[nodiscard]] std::filesystem::path expandHome(const std::string& p);

// Built-in defaults with the home-relative directories filled in.
[[nodiscard]] Config defaultConfig();

Config loadConfig(const std::filesystem::path& path);

}
