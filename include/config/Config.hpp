#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace ad::config {

inline const std::filesystem::path DEFAULT_CONFIG_PATH = "/etc/archdiff/config.yaml";

struct PathsConfig {
    std::filesystem::path root = "/";
    std::filesystem::path dbpath = "/var/lib/pacman";
    std::filesystem::path repo = "/usr/share/archdiff";
    std::filesystem::path ignore = "/etc/archdiff/ignore";   // rule file or directory of rule files
};

enum class RepoListerType { Walk, Git };

struct RepoConfig {
    RepoListerType lister = RepoListerType::Walk;
    std::string git_binary = "git";
};

struct ScanConfig {
    bool strict = false;   // permission errors during the walk become fatal
    bool quiet = false;    // silence skip-and-log warnings
    bool quick = false;    // append quick_ignore to the rule set

    // High-churn trees owned wholesale by packages; skipping them makes iteration fast.
    std::vector<std::string> quick_ignore = {
        "/usr/bin",
        "/usr/include",
        "/usr/lib",
        "/usr/lib32",
        "/usr/share",
        "/var/cache/pacman/pkg",
        "/var/lib/pacman",
    };

    // Inline rules, appended after the rule files.
    std::vector<std::string> ignore;
};

struct SyncConfig {
    bool dry_run = false;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum archdiff  = spdlog::level::info;   // Run lifecycle
    spdlog::level::level_enum ignore    = spdlog::level::warn;   // Rule loading
    spdlog::level::level_enum pkgdb     = spdlog::level::warn;   // Local database parsing
    spdlog::level::level_enum inventory = spdlog::level::warn;   // Tree walks, skipped nodes
    spdlog::level::level_enum hash      = spdlog::level::warn;   // Unreadable files
    spdlog::level::level_enum reconcile = spdlog::level::warn;
    spdlog::level::level_enum sync      = spdlog::level::info;   // One line per copy
    spdlog::level::level_enum shell     = spdlog::level::warn;   // Argument parsing edge cases
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir;   // empty = console only
    LogLevelsConfig levels;
};

struct Config {
    PathsConfig paths;
    RepoConfig repo;
    ScanConfig scan;
    SyncConfig sync;
    LoggingConfig logging;
};

Config loadConfig(const std::filesystem::path& path);

// Missing file at the default location yields built-in defaults.
Config loadConfigOrDefault(const std::filesystem::path& path = DEFAULT_CONFIG_PATH);

std::string to_string(RepoListerType type);
RepoListerType repoListerFromString(const std::string& s);

} // namespace ad::config
