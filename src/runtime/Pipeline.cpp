#include "runtime/Pipeline.hpp"
#include "crypto/ContentHasher.hpp"
#include "inventory/RepoLister.hpp"
#include "pkgdb/Database.hpp"
#include "log/Registry.hpp"

#include <algorithm>

using namespace ad::runtime;
using namespace ad::inventory;
using namespace ad::reconcile;
using namespace ad::log;

Pipeline::Pipeline(config::Config cfg,
                   std::shared_ptr<const pkgdb::Database> db,
                   std::shared_ptr<const crypto::ContentHasher> hasher)
    : cfg_(std::move(cfg)),
      paths_(cfg_.paths.root, cfg_.paths.repo),
      matcher_(buildMatcher(cfg_)),
      db_(std::move(db)),
      hasher_(hasher ? std::move(hasher) : std::make_shared<crypto::Md5Hasher>()) {}

ad::ignore::Matcher Pipeline::buildMatcher(const config::Config& cfg) {
    auto matcher = ignore::Matcher::fromSource(cfg.paths.ignore);
    if (!cfg.scan.ignore.empty()) matcher = matcher.extend(cfg.scan.ignore, "scan.ignore");
    if (cfg.scan.quick) matcher = matcher.extend(cfg.scan.quick_ignore, "scan.quick_ignore");

    Registry::ignore()->debug("[Pipeline] {} ignore rules in effect", matcher.size());
    for (const auto& rule : matcher.rules())
        Registry::ignore()->trace("[Pipeline] {} rule: {}", ignore::isGlob(ignore::text(rule)) ? "glob" : "prefix",
                                  ignore::text(rule));
    return matcher;
}

Context Pipeline::context() const {
    return {paths_, matcher_, *hasher_};
}

std::shared_ptr<const ad::pkgdb::Database> Pipeline::database() const {
    if (db_) return db_;
    return std::make_shared<pkgdb::LocalDatabase>(cfg_.paths.dbpath);
}

std::unique_ptr<RepoLister> Pipeline::repoLister() const {
    const fs::Walker::Options opts{.strict = cfg_.scan.strict};
    switch (cfg_.repo.lister) {
    case config::RepoListerType::Git: return std::make_unique<GitLister>(paths_.repoRoot, cfg_.repo.git_binary);
    case config::RepoListerType::Walk: break;
    }
    return std::make_unique<WalkLister>(paths_.repoRoot, opts);
}

PathSet Pipeline::live() const {
    return buildLiveFilesystemFiles(paths_, matcher_, {.strict = cfg_.scan.strict});
}

PathSet Pipeline::repo() const {
    return buildRepoFiles(*repoLister());
}

std::vector<std::string> Pipeline::list(const model::Category category) const {
    using model::Category;

    switch (category) {
    case Category::Owned: return sorted(buildPackageOwnedFiles(*database()));
    case Category::Backup: {
        std::vector<std::string> keys;
        for (const auto& [path, hash] : buildBackupRecords(*database())) keys.push_back(path);
        std::ranges::sort(keys);
        return keys;
    }
    case Category::Live: return sorted(live());
    case Category::Repo: return sorted(repo());
    case Category::ModifiedBackup: return sorted(modifiedBackups(context(), buildBackupRecords(*database())));
    case Category::Unpackaged: {
        const auto db = database();
        return sorted(unpackaged(live(), buildPackageOwnedFiles(*db)));
    }
    case Category::MissingInRepo: {
        const auto db = database();
        const auto modified = modifiedBackups(context(), buildBackupRecords(*db));
        return sorted(missingInRepo(modified, unpackaged(live(), buildPackageOwnedFiles(*db)), repo()));
    }
    case Category::DivergedFromRepo: return sorted(divergedFromRepo(context(), repo()));
    case Category::Deleted: return sorted(deletedPackaged(context(), buildPackageOwnedFiles(*database())));
    }
    return {};
}

model::Diff Pipeline::diff() const {
    const auto db = database();
    const auto owned = buildPackageOwnedFiles(*db);
    const auto backups = buildBackupRecords(*db);
    const auto liveFiles = live();
    const auto repoFiles = repo();

    return Engine(context()).run({owned, backups, liveFiles, repoFiles});
}

std::string Pipeline::toLive(const std::string& key) const {
    return paths_.absPath(key, fs::model::PathType::LIVE_ROOT).string();
}

std::vector<std::string> Pipeline::toLive(const std::vector<std::string>& keys) const {
    std::vector<std::string> out;
    out.reserve(keys.size());
    for (const auto& k : keys) out.push_back(toLive(k));
    return out;
}
