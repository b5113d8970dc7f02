#include "sync/Planner.hpp"
#include "reconcile/model/Diff.hpp"
#include "fs/model/Path.hpp"
#include "error/Exceptions.hpp"
#include "log/Registry.hpp"

#include <sys/stat.h>
#include <algorithm>
#include <cerrno>
#include <fmt/core.h>

using namespace ad::sync;
using namespace ad::sync::model;
using namespace ad::fs::model;
using namespace ad::log;

std::string ad::sync::model::to_string(const ActionType type) {
    switch (type) {
    case ActionType::LiveToRepo: return "live->repo";
    case ActionType::RepoToLive: return "repo->live";
    }
    return "unknown";
}

Planner::Stamp Planner::modifiedAt(const std::filesystem::path& path, std::error_code& ec) {
    ec.clear();
    struct stat st{};
    if (::lstat(path.c_str(), &st) == 0)
        return std::chrono::seconds(st.st_mtim.tv_sec) + std::chrono::nanoseconds(st.st_mtim.tv_nsec);

    const int err = errno;
    if (err == ENOENT || err == ENOTDIR) return std::nullopt;
    if (err == EACCES || err == EPERM) {
        ec.assign(err, std::generic_category());
        return std::nullopt;
    }
    throw error::IOError(fmt::format("Failed to stat {}: {}", path.string(), std::generic_category().message(err)));
}

std::optional<ActionType> Planner::decideForBoth(const Stamp& live, const Stamp& repo) {
    if (!live && !repo) return std::nullopt;
    if (live && !repo) return ActionType::LiveToRepo;
    if (!live && repo) return ActionType::RepoToLive;
    if (*live > *repo) return ActionType::LiveToRepo;
    if (*repo > *live) return ActionType::RepoToLive;
    return std::nullopt;
}

std::vector<Action> Planner::build(const Path& paths, const reconcile::model::Diff& diff) {
    std::vector<Action> plan;
    const auto keys = diff.report();
    plan.reserve(keys.size());

    const auto makeAction = [&](const ActionType type, const std::string& key) {
        const auto live = paths.absPath(key, PathType::LIVE_ROOT);
        const auto repo = paths.absPath(key, PathType::REPO_ROOT);
        if (type == ActionType::LiveToRepo) return Action{type, key, live, repo};
        return Action{type, key, repo, live};
    };

    for (const auto& key : keys) {
        if (std::ranges::binary_search(diff.missingInRepo, key)) {
            plan.push_back(makeAction(ActionType::LiveToRepo, key));
            continue;
        }

        std::error_code lec, rec;
        const auto liveStamp = modifiedAt(paths.absPath(key, PathType::LIVE_ROOT), lec);
        const auto repoStamp = modifiedAt(paths.absPath(key, PathType::REPO_ROOT), rec);
        if (lec || rec) {
            if (!Registry::quietSkips())
                Registry::sync()->warn("[Planner] Skipping {}: {}", key, (lec ? lec : rec).message());
            continue;
        }

        if (const auto type = decideForBoth(liveStamp, repoStamp)) {
            plan.push_back(makeAction(*type, key));
            continue;
        }

        Registry::sync()->warn("[Planner] {} differs but both copies share a modification time, leaving it alone", key);
    }

    Registry::sync()->debug("[Planner] Planned {} copies for {} reported paths", plan.size(), keys.size());
    return plan;
}
