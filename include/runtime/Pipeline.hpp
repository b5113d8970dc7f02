#pragma once

#include "config/Config.hpp"
#include "fs/model/Path.hpp"
#include "ignore/Matcher.hpp"
#include "inventory/Inventory.hpp"
#include "reconcile/Engine.hpp"
#include "reconcile/model/Diff.hpp"

#include <memory>
#include <string>
#include <vector>

namespace ad::pkgdb { class Database; }
namespace ad::crypto { class ContentHasher; }
namespace ad::inventory { class RepoLister; }

namespace ad::runtime {

// Wires the stages together for one run. Nothing is cached: every call computes
// exactly the inventories it needs, once, and hands them to the next stage.
class Pipeline {
public:
    // Compiles the ignore rules up front; throws error::MalformedIgnoreRule.
    // Without a database or hasher the pacman local database and MD5 are used.
    explicit Pipeline(config::Config cfg,
                      std::shared_ptr<const pkgdb::Database> db = nullptr,
                      std::shared_ptr<const crypto::ContentHasher> hasher = nullptr);

    // Rule source, then inline scan.ignore rules, then quick_ignore when scan.quick is set.
    static ignore::Matcher buildMatcher(const config::Config& cfg);

    [[nodiscard]] const config::Config& config() const { return cfg_; }
    [[nodiscard]] const fs::model::Path& paths() const { return paths_; }
    [[nodiscard]] const ignore::Matcher& matcher() const { return matcher_; }
    [[nodiscard]] reconcile::Context context() const;

    // Throws error::PackageDatabaseUnavailable.
    [[nodiscard]] std::shared_ptr<const pkgdb::Database> database() const;
    [[nodiscard]] std::unique_ptr<inventory::RepoLister> repoLister() const;

    // Sorted canonical keys of one category.
    [[nodiscard]] std::vector<std::string> list(reconcile::model::Category category) const;

    [[nodiscard]] reconcile::model::Diff diff() const;

    // Canonical keys to live-tree paths, as printed.
    [[nodiscard]] std::string toLive(const std::string& key) const;
    [[nodiscard]] std::vector<std::string> toLive(const std::vector<std::string>& keys) const;

private:
    const config::Config cfg_;
    const fs::model::Path paths_;
    const ignore::Matcher matcher_;
    std::shared_ptr<const pkgdb::Database> db_;
    std::shared_ptr<const crypto::ContentHasher> hasher_;

    [[nodiscard]] inventory::PathSet live() const;
    [[nodiscard]] inventory::PathSet repo() const;
};

}
