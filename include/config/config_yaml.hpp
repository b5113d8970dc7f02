#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace ad::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<std::filesystem::path> {
    static Node encode(const std::filesystem::path& rhs) { return Node(rhs.string()); }

    static bool decode(const Node& node, std::filesystem::path& rhs) {
        if (!node.IsScalar()) return false;
        rhs = node.as<std::string>();
        return true;
    }
};

template<>
struct convert<PathsConfig> {
    static Node encode(const PathsConfig& rhs) {
        Node node;
        node["root"] = rhs.root;
        node["dbpath"] = rhs.dbpath;
        node["repo"] = rhs.repo;
        node["ignore"] = rhs.ignore;
        return node;
    }

    static bool decode(const Node& node, PathsConfig& rhs) {
        if (!node.IsMap()) return false;
        const PathsConfig def;
        rhs.root = node["root"].as<std::filesystem::path>(def.root);
        rhs.dbpath = node["dbpath"].as<std::filesystem::path>(def.dbpath);
        rhs.repo = node["repo"].as<std::filesystem::path>(def.repo);
        rhs.ignore = node["ignore"].as<std::filesystem::path>(def.ignore);
        return true;
    }
};

template<>
struct convert<RepoConfig> {
    static Node encode(const RepoConfig& rhs) {
        Node node;
        node["lister"] = ad::config::to_string(rhs.lister);
        node["git_binary"] = rhs.git_binary;
        return node;
    }

    static bool decode(const Node& node, RepoConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.lister = repoListerFromString(node["lister"].as<std::string>("walk"));
        rhs.git_binary = node["git_binary"].as<std::string>("git");
        return true;
    }
};

template<>
struct convert<ScanConfig> {
    static Node encode(const ScanConfig& rhs) {
        Node node;
        node["strict"] = rhs.strict;
        node["quiet"] = rhs.quiet;
        node["quick"] = rhs.quick;
        node["quick_ignore"] = rhs.quick_ignore;
        node["ignore"] = rhs.ignore;
        return node;
    }

    static bool decode(const Node& node, ScanConfig& rhs) {
        if (!node.IsMap()) return false;
        const ScanConfig def;
        rhs.strict = node["strict"].as<bool>(false);
        rhs.quiet = node["quiet"].as<bool>(false);
        rhs.quick = node["quick"].as<bool>(false);
        rhs.quick_ignore = node["quick_ignore"].as<std::vector<std::string>>(def.quick_ignore);
        rhs.ignore = node["ignore"].as<std::vector<std::string>>(def.ignore);
        return true;
    }
};

template<>
struct convert<SyncConfig> {
    static Node encode(const SyncConfig& rhs) {
        Node node;
        node["dry_run"] = rhs.dry_run;
        return node;
    }

    static bool decode(const Node& node, SyncConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.dry_run = node["dry_run"].as<bool>(false);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["archdiff"]  = to_std_string(spdlog::level::to_string_view(rhs.archdiff));
        node["ignore"]    = to_std_string(spdlog::level::to_string_view(rhs.ignore));
        node["pkgdb"]     = to_std_string(spdlog::level::to_string_view(rhs.pkgdb));
        node["inventory"] = to_std_string(spdlog::level::to_string_view(rhs.inventory));
        node["hash"]      = to_std_string(spdlog::level::to_string_view(rhs.hash));
        node["reconcile"] = to_std_string(spdlog::level::to_string_view(rhs.reconcile));
        node["sync"]      = to_std_string(spdlog::level::to_string_view(rhs.sync));
        node["shell"]     = to_std_string(spdlog::level::to_string_view(rhs.shell));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.archdiff = spdlog::level::from_str(node["archdiff"].as<std::string>("info"));
        rhs.ignore = spdlog::level::from_str(node["ignore"].as<std::string>("warn"));
        rhs.pkgdb = spdlog::level::from_str(node["pkgdb"].as<std::string>("warn"));
        rhs.inventory = spdlog::level::from_str(node["inventory"].as<std::string>("warn"));
        rhs.hash = spdlog::level::from_str(node["hash"].as<std::string>("warn"));
        rhs.reconcile = spdlog::level::from_str(node["reconcile"].as<std::string>("warn"));
        rhs.sync = spdlog::level::from_str(node["sync"].as<std::string>("info"));
        rhs.shell = spdlog::level::from_str(node["shell"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir;
        node["levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::filesystem::path>(std::filesystem::path{});
        if (node["levels"]) rhs.levels = node["levels"].as<LogLevelsConfig>();
        return true;
    }
};

}
