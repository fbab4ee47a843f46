#include "log/Registry.hpp"
#include "config/ConfigRegistry.hpp"

#include <filesystem>
#include <stdexcept>

using namespace ms::log;

void Registry::init(const std::optional<std::filesystem::path>& logDir, const bool debug) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    const auto& cnf = config::ConfigRegistry::get().logging;

    log_dir_ = logDir ? *logDir : cnf.log_dir;
    main_log_path_ = log_dir_ / "mirrorsync.log";

    namespace fs = std::filesystem;
    std::error_code ec;
    if (!fs::exists(log_dir_, ec)) fs::create_directories(log_dir_, ec);
    if (ec) throw std::runtime_error(
        fmt::format("[LogRegistry] Failed to create log directory {}: {}", log_dir_.string(), ec.message()));

    // console goes to stderr, stdout belongs to progress and json output
    console_sink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink_->set_level(debug ? spdlog::level::debug : cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        main_log_path_.string(), main_max_bytes_, main_max_files_);
    main_file_sink_->set_level(cnf.levels.file_log_level);
    main_file_sink_->set_pattern(LOG_FORMAT);

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(
            name, spdlog::sinks_init_list{console_sink_, main_file_sink_});
        logger->set_level(debug ? spdlog::level::debug : lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("mirrorsync", sub_levels.mirrorsync);
    makeLogger("sync",       sub_levels.sync);
    makeLogger("storage",    sub_levels.storage);
    makeLogger("cloud",      sub_levels.cloud);
    makeLogger("watch",      sub_levels.watch);
    makeLogger("session",    sub_levels.session);
    makeLogger("config",     sub_levels.config);

    initialized_ = true;
    mirrorsync()->debug("[LogRegistry] Initialized, writing to {}", main_log_path_.string());
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] Registry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

bool Registry::isInitialized() { return initialized_; }

void Registry::shutdown() {
    if (!initialized_) return;
    spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& lg) { lg->flush(); });
    spdlog::drop_all();
    console_sink_.reset();
    main_file_sink_.reset();
    initialized_ = false;
}
