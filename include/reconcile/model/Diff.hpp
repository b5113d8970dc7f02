#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ad::reconcile::model {

enum class Category {
    Owned,
    Backup,
    Live,
    Repo,
    ModifiedBackup,
    Unpackaged,
    MissingInRepo,
    DivergedFromRepo,
    Deleted
};

// Accepts the long names ("missing-in-repo") and the short ones ("missing").
std::optional<Category> categoryFromString(std::string_view s);
std::string to_string(Category c);

// One status line: 'B' modified backup missing in repo, '?' unpackaged missing in repo, 'R' diverged from repo.
struct Annotated {
    char code;
    std::string path;

    bool operator==(const Annotated&) const = default;
};

// Result of one reconciliation. Every list is sorted ascending and free of duplicates.
struct Diff {
    const std::vector<std::string> modifiedBackup;
    const std::vector<std::string> unpackaged;
    const std::vector<std::string> missingInRepo;
    const std::vector<std::string> divergedFromRepo;

    // missingInRepo ∪ divergedFromRepo, sorted.
    [[nodiscard]] std::vector<std::string> report() const;

    [[nodiscard]] std::vector<Annotated> annotated() const;
};

}
