#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace ms::log {

class Registry {
public:
    // Initialize all loggers with sinks/levels taken from ConfigRegistry.
    // logDir overrides logging.log_dir (tests point it at a temp dir).
    static void init(const std::optional<std::filesystem::path>& logDir = std::nullopt, bool debug = false);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> mirrorsync() { return get("mirrorsync"); }
    static std::shared_ptr<spdlog::logger> sync()       { return get("sync"); }
    static std::shared_ptr<spdlog::logger> storage()    { return get("storage"); }
    static std::shared_ptr<spdlog::logger> cloud()      { return get("cloud"); }
    static std::shared_ptr<spdlog::logger> watch()      { return get("watch"); }
    static std::shared_ptr<spdlog::logger> session()    { return get("session"); }
    static std::shared_ptr<spdlog::logger> config()     { return get("config"); }

    [[nodiscard]] static bool isInitialized();

    static void shutdown();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::filesystem::path log_dir_;
    static inline std::filesystem::path main_log_path_;

    static inline std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;
};

}
