#include "log/Registry.hpp"

#include <filesystem>
#include <vector>

namespace ad::log {

void Registry::init(const config::LoggingConfig& cfg) {
    if (initialized_) {
        spdlog::warn("[log::Registry] Already initialized, ignoring second init()");
        return;
    }

    console_sink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink_->set_level(cfg.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    std::vector<spdlog::sink_ptr> sinks{console_sink_};

    if (!cfg.log_dir.empty()) {
        log_dir_ = cfg.log_dir;
        main_log_path_ = log_dir_ / "archdiff.log";

        namespace fs = std::filesystem;
        if (!fs::exists(log_dir_)) fs::create_directories(log_dir_);

        main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            main_log_path_.string(), main_max_bytes_, main_max_files_);
        main_file_sink_->set_level(cfg.levels.file_log_level);
        main_file_sink_->set_pattern(LOG_FORMAT);
        sinks.push_back(main_file_sink_);
    }

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cfg.levels.subsystem_levels;
    makeLogger("archdiff",  sub_levels.archdiff);
    makeLogger("ignore",    sub_levels.ignore);
    makeLogger("pkgdb",     sub_levels.pkgdb);
    makeLogger("inventory", sub_levels.inventory);
    makeLogger("hash",      sub_levels.hash);
    makeLogger("reconcile", sub_levels.reconcile);
    makeLogger("sync",      sub_levels.sync);
    makeLogger("shell",     sub_levels.shell);

    initialized_ = true;
    get("archdiff")->debug("[log::Registry] Initialized");
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[log::Registry] Registry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[log::Registry] Logger not found: " + name);
    }
    return logger;
}

void Registry::setQuietSkips(const bool quiet) { quiet_skips_ = quiet; }

bool Registry::quietSkips() { return quiet_skips_; }

}
