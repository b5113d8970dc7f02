#pragma once

#include "inventory/Inventory.hpp"
#include "reconcile/model/Diff.hpp"

namespace ad::fs::model { struct Path; }
namespace ad::ignore { class Matcher; }
namespace ad::crypto { class ContentHasher; }

namespace ad::reconcile {

// Everything a comparison needs besides the inventories themselves.
struct Context {
    const fs::model::Path& paths;
    const ignore::Matcher& matcher;
    const crypto::ContentHasher& hasher;
};

// Live files no package owns.
inventory::PathSet unpackaged(const inventory::PathSet& live, const inventory::PathSet& owned);

// Backup files whose live content no longer matches the recorded hash.
// Ignored paths are never hashed; files missing from the live tree count as unchanged.
inventory::PathSet modifiedBackups(const Context& ctx, const inventory::BackupMap& backups);

// Repository files whose live copy differs. A copy missing on one side is a difference;
// an unreadable copy is skipped.
inventory::PathSet divergedFromRepo(const Context& ctx, const inventory::PathSet& repo);

// (modified ∪ unpackaged) \ repo
inventory::PathSet missingInRepo(const inventory::PathSet& modified,
                                 const inventory::PathSet& unpackaged,
                                 const inventory::PathSet& repo);

// Package-owned, not ignored, and gone from the live tree.
inventory::PathSet deletedPackaged(const Context& ctx, const inventory::PathSet& owned);

struct Inventories {
    const inventory::PathSet& owned;
    const inventory::BackupMap& backups;
    const inventory::PathSet& live;
    const inventory::PathSet& repo;
};

class Engine {
public:
    explicit Engine(const Context& ctx) : ctx_(ctx) {}

    [[nodiscard]] model::Diff run(const Inventories& inv) const;

private:
    Context ctx_;
};

}
