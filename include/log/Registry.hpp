#pragma once

#include "config/Config.hpp"

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>

namespace ad::log {

class Registry {
public:
    // Initialize all loggers with sinks/levels.
    static void init(const config::LoggingConfig& cfg);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> archdiff()   { return get("archdiff"); }
    static std::shared_ptr<spdlog::logger> ignore()     { return get("ignore"); }
    static std::shared_ptr<spdlog::logger> pkgdb()      { return get("pkgdb"); }
    static std::shared_ptr<spdlog::logger> inventory()  { return get("inventory"); }
    static std::shared_ptr<spdlog::logger> hash()       { return get("hash"); }
    static std::shared_ptr<spdlog::logger> reconcile()  { return get("reconcile"); }
    static std::shared_ptr<spdlog::logger> sync()       { return get("sync"); }
    static std::shared_ptr<spdlog::logger> shell()      { return get("shell"); }

    // Permission-denied skips go through here so --quiet can silence them.
    static void setQuietSkips(bool quiet);
    [[nodiscard]] static bool quietSkips();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;
    static inline bool quiet_skips_ = false;

    static inline std::filesystem::path log_dir_;
    static inline std::filesystem::path main_log_path_;

    // stdout belongs to the path listings; the console sink writes to stderr
    static inline std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 3;
};

}
