#include "reconcile/model/Diff.hpp"

#include <algorithm>
#include <iterator>

namespace ad::reconcile::model {

std::optional<Category> categoryFromString(const std::string_view s) {
    if (s == "owned" || s == "package") return Category::Owned;
    if (s == "backup") return Category::Backup;
    if (s == "live" || s == "all") return Category::Live;
    if (s == "repo") return Category::Repo;
    if (s == "modified" || s == "modified-backup") return Category::ModifiedBackup;
    if (s == "unpackaged") return Category::Unpackaged;
    if (s == "missing" || s == "missing-in-repo") return Category::MissingInRepo;
    if (s == "diverged" || s == "diverged-from-repo") return Category::DivergedFromRepo;
    if (s == "deleted") return Category::Deleted;
    return std::nullopt;
}

std::string to_string(const Category c) {
    switch (c) {
    case Category::Owned: return "owned";
    case Category::Backup: return "backup";
    case Category::Live: return "live";
    case Category::Repo: return "repo";
    case Category::ModifiedBackup: return "modified";
    case Category::Unpackaged: return "unpackaged";
    case Category::MissingInRepo: return "missing";
    case Category::DivergedFromRepo: return "diverged";
    case Category::Deleted: return "deleted";
    }
    return "unknown";
}

std::vector<std::string> Diff::report() const {
    std::vector<std::string> out;
    out.reserve(missingInRepo.size() + divergedFromRepo.size());
    std::ranges::set_union(missingInRepo, divergedFromRepo, std::back_inserter(out));
    return out;
}

std::vector<Annotated> Diff::annotated() const {
    std::vector<Annotated> out;
    out.reserve(missingInRepo.size() + divergedFromRepo.size());

    for (const auto& p : missingInRepo) {
        const bool backup = std::ranges::binary_search(modifiedBackup, p);
        out.push_back({backup ? 'B' : '?', p});
    }
    for (const auto& p : divergedFromRepo) out.push_back({'R', p});

    std::ranges::stable_sort(out, {}, &Annotated::path);
    return out;
}

}
