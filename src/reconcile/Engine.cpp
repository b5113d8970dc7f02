#include "reconcile/Engine.hpp"
#include "crypto/ContentHasher.hpp"
#include "error/Exceptions.hpp"
#include "fs/model/Path.hpp"
#include "ignore/Matcher.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>

using namespace ad::inventory;
using namespace ad::fs::model;
using namespace ad::crypto::hash;
using namespace ad::log;

namespace ad::reconcile {

namespace {

void logSkip(const std::filesystem::path& path, const char* what) {
    if (!Registry::quietSkips())
        Registry::reconcile()->warn("[Engine] Skipping {}: permission denied while {}", path.string(), what);
}

bool isPermissionError(const std::error_code& ec) {
    return ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted;
}

struct LinkState {
    bool isLink = false;
    std::filesystem::path target;
};

// A missing path is not a link. Permission errors are left in ec, anything else throws.
LinkState linkState(const std::filesystem::path& path, std::error_code& ec) {
    namespace sfs = std::filesystem;

    const auto st = sfs::symlink_status(path, ec);
    if (st.type() == sfs::file_type::not_found) {
        ec.clear();
        return {};
    }
    if (!ec && !sfs::is_symlink(st)) return {};

    LinkState out;
    if (!ec) out = {.isLink = true, .target = sfs::read_symlink(path, ec)};
    if (ec && !isPermissionError(ec))
        throw error::IOError(fmt::format("Failed to inspect {}: {}", path.string(), ec.message()));
    return out;
}

}

PathSet unpackaged(const PathSet& live, const PathSet& owned) {
    PathSet out;
    for (const auto& p : live)
        if (!owned.contains(p)) out.insert(p);
    return out;
}

PathSet modifiedBackups(const Context& ctx, const BackupMap& backups) {
    PathSet out;
    for (const auto& [key, expected] : backups) {
        if (ctx.matcher.matches(key)) continue;

        const auto live = ctx.paths.absPath(key, PathType::LIVE_ROOT);
        const auto digest = ctx.hasher.digest(live);
        if (digest.notFound()) continue;
        if (digest.permissionDenied()) {
            logSkip(live, "hashing backup file");
            continue;
        }
        if (digest.hex != expected) out.insert(key);
    }

    Registry::reconcile()->debug("[Engine] {} of {} backup files modified", out.size(), backups.size());
    return out;
}

PathSet divergedFromRepo(const Context& ctx, const PathSet& repo) {
    PathSet out;
    for (const auto& key : repo) {
        if (ctx.matcher.matches(key)) continue;

        const auto live = ctx.paths.absPath(key, PathType::LIVE_ROOT);
        const auto stored = ctx.paths.absPath(key, PathType::REPO_ROOT);

        // Symlinks are compared by target; a relative link resolves differently in each tree.
        std::error_code lec, rec;
        const auto liveLink = linkState(live, lec);
        const auto repoLink = linkState(stored, rec);
        if (lec || rec) {
            logSkip(lec ? live : stored, "reading symlink");
            continue;
        }
        if (liveLink.isLink || repoLink.isLink) {
            if (!liveLink.isLink || !repoLink.isLink || liveLink.target != repoLink.target) out.insert(key);
            continue;
        }

        const auto liveDigest = ctx.hasher.digest(live);
        if (liveDigest.permissionDenied()) {
            logSkip(live, "comparing with repository");
            continue;
        }

        const auto repoDigest = ctx.hasher.digest(stored);
        if (repoDigest.permissionDenied()) {
            logSkip(stored, "comparing with live tree");
            continue;
        }

        if (liveDigest.status != repoDigest.status || liveDigest.hex != repoDigest.hex) out.insert(key);
    }

    Registry::reconcile()->debug("[Engine] {} of {} repository files diverged", out.size(), repo.size());
    return out;
}

PathSet missingInRepo(const PathSet& modified, const PathSet& unpackaged, const PathSet& repo) {
    PathSet out;
    for (const auto* set : {&modified, &unpackaged})
        for (const auto& p : *set)
            if (!repo.contains(p)) out.insert(p);
    return out;
}

PathSet deletedPackaged(const Context& ctx, const PathSet& owned) {
    PathSet out;
    for (const auto& key : owned) {
        if (ctx.matcher.matches(key)) continue;

        const auto live = ctx.paths.absPath(key, PathType::LIVE_ROOT);
        std::error_code ec;
        const auto st = std::filesystem::symlink_status(live, ec);
        if (st.type() == std::filesystem::file_type::not_found) {
            out.insert(key);
        } else if (!ec) {
            continue;
        } else if (isPermissionError(ec)) {
            logSkip(live, "checking for deleted file");
        } else {
            throw error::IOError(fmt::format("Failed to stat {}: {}", live.string(), ec.message()));
        }
    }
    return out;
}

model::Diff Engine::run(const Inventories& inv) const {
    const auto unpkg = unpackaged(inv.live, inv.owned);
    const auto modified = modifiedBackups(ctx_, inv.backups);
    const auto diverged = divergedFromRepo(ctx_, inv.repo);
    const auto missing = missingInRepo(modified, unpkg, inv.repo);

    model::Diff diff{
        .modifiedBackup = sorted(modified),
        .unpackaged = sorted(unpkg),
        .missingInRepo = sorted(missing),
        .divergedFromRepo = sorted(diverged),
    };

    Registry::reconcile()->info("[Engine] {} missing in repo, {} diverged from repo",
                                diff.missingInRepo.size(), diff.divergedFromRepo.size());
    return diff;
}

}
