#include "config/Config.hpp"
#include "config/config_yaml.hpp"
#include "error/Exceptions.hpp"

#include <yaml-cpp/yaml.h>
#include <fmt/core.h>

namespace ad::config {

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    YAML::Node root;

    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::BadFile&) {
        throw error::IOError(fmt::format("Failed to open config file: {}", path.string()));
    } catch (const YAML::Exception& e) {
        throw error::IOError(fmt::format("Failed to parse config file {}: {}", path.string(), e.what()));
    }

    if (!root || root.IsNull()) return cfg;

    try {
        if (const auto node = root["paths"]) cfg.paths = node.as<PathsConfig>();
        if (const auto node = root["repo"]) cfg.repo = node.as<RepoConfig>();
        if (const auto node = root["scan"]) cfg.scan = node.as<ScanConfig>();
        if (const auto node = root["sync"]) cfg.sync = node.as<SyncConfig>();
        if (const auto node = root["logging"]) cfg.logging = node.as<LoggingConfig>();
    } catch (const YAML::Exception& e) {
        throw error::IOError(fmt::format("Invalid value in config file {}: {}", path.string(), e.what()));
    } catch (const std::invalid_argument& e) {
        throw error::IOError(fmt::format("Invalid value in config file {}: {}", path.string(), e.what()));
    }

    return cfg;
}

Config loadConfigOrDefault(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return {};
    return loadConfig(path);
}

std::string to_string(const RepoListerType type) {
    switch (type) {
    case RepoListerType::Walk: return "walk";
    case RepoListerType::Git: return "git";
    }
    return "walk";
}

RepoListerType repoListerFromString(const std::string& s) {
    if (s == "walk") return RepoListerType::Walk;
    if (s == "git") return RepoListerType::Git;
    throw std::invalid_argument("Unknown repo lister: " + s);
}

} // namespace ad::config
