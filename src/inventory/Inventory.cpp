#include "inventory/Inventory.hpp"
#include "inventory/RepoLister.hpp"
#include "fs/model/Path.hpp"
#include "ignore/Matcher.hpp"
#include "pkgdb/Database.hpp"
#include "log/Registry.hpp"

#include <algorithm>

using namespace ad::fs::model;
using namespace ad::log;

namespace ad::inventory {

PathSet buildPackageOwnedFiles(const pkgdb::Database& db) {
    PathSet owned;
    for (const auto& pkg : db.packages())
        owned.insert(pkg.files.begin(), pkg.files.end());

    Registry::inventory()->debug("[Inventory] {} package-owned files across {} packages", owned.size(), db.packages().size());
    return owned;
}

BackupMap buildBackupRecords(const pkgdb::Database& db) {
    BackupMap backups;
    for (const auto& pkg : db.packages()) {
        for (const auto& [path, hash] : pkg.backups) {
            const auto [it, inserted] = backups.emplace(path, hash);
            if (!inserted && it->second != hash)
                Registry::inventory()->debug("[Inventory] {} claimed as backup by more than one package, keeping first hash", path);
        }
    }

    Registry::inventory()->debug("[Inventory] {} backup records", backups.size());
    return backups;
}

PathSet buildLiveFilesystemFiles(const Path& paths, const ignore::Matcher& matcher, const fs::Walker::Options& opts) {
    PathSet live;
    if (matcher.matches("/")) {
        Registry::inventory()->warn("[Inventory] Live root {} is ignored as a whole", paths.liveRoot.string());
        return live;
    }

    size_t pruned = 0;
    const fs::Walker walker(opts);
    const auto files = walker.files(paths.liveRoot, [&](const fs::Walker::Entry& entry) {
        if (!matcher.matches(paths.relPath(entry.path, PathType::LIVE_ROOT))) return false;
        ++pruned;
        return true;
    });

    live.reserve(files.size());
    for (const auto& f : files) live.insert(paths.relPath(f, PathType::LIVE_ROOT));

    Registry::inventory()->debug("[Inventory] {} live files under {}, {} entries ignored",
                                 live.size(), paths.liveRoot.string(), pruned);
    return live;
}

PathSet buildRepoFiles(const RepoLister& lister) {
    auto repo = lister.list();
    Registry::inventory()->debug("[Inventory] {} repository files ({} lister)", repo.size(), lister.name());
    return repo;
}

std::vector<std::string> sorted(const PathSet& set) {
    std::vector<std::string> out(set.begin(), set.end());
    std::ranges::sort(out);
    return out;
}

}
