#include "shell/GlobalOptions.hpp"
#include "shell/util/argsHelpers.hpp"

#include <stdexcept>

namespace ad::shell {

namespace {

std::filesystem::path requirePath(const CommandCall& call, const std::string& key) {
    const auto v = optVal(call, key);
    if (!v || v->empty()) throw std::invalid_argument("Option --" + key + " requires a value");
    return *v;
}

}

config::Config loadConfigFor(const CommandCall& call) {
    if (hasKey(call, "config")) return config::loadConfig(requirePath(call, "config"));
    return config::loadConfigOrDefault();
}

void applyGlobalOptions(config::Config& cfg, const CommandCall& call) {
    if (hasKey(call, "root")) cfg.paths.root = requirePath(call, "root");
    if (hasKey(call, "dbpath")) cfg.paths.dbpath = requirePath(call, "dbpath");
    if (hasKey(call, "repo")) cfg.paths.repo = requirePath(call, "repo");
    if (hasKey(call, "ignore")) cfg.paths.ignore = requirePath(call, "ignore");

    if (hasFlag(call, "git")) cfg.repo.lister = config::RepoListerType::Git;
    if (hasFlag(call, std::vector<std::string>{"quick", "q"})) cfg.scan.quick = true;
    if (hasFlag(call, "strict")) cfg.scan.strict = true;
    if (hasFlag(call, std::vector<std::string>{"quiet", "s"})) cfg.scan.quiet = true;
    if (hasFlag(call, std::vector<std::string>{"dry-run", "n"})) cfg.sync.dry_run = true;
    if (hasFlag(call, std::vector<std::string>{"verbose", "v"})) {
        cfg.logging.levels.console_log_level = spdlog::level::debug;
        auto& sub = cfg.logging.levels.subsystem_levels;
        for (auto* lvl : {&sub.archdiff, &sub.ignore, &sub.pkgdb, &sub.inventory,
                          &sub.hash, &sub.reconcile, &sub.sync, &sub.shell})
            *lvl = spdlog::level::debug;
    }
}

}
