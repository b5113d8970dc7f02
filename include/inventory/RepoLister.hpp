#pragma once

#include "inventory/Inventory.hpp"
#include "fs/Walker.hpp"

#include <filesystem>
#include <string>

namespace ad::inventory {

// Lists the files the shadow repository tracks, as canonical keys relative to its root.
class RepoLister {
public:
    virtual ~RepoLister() = default;

    [[nodiscard]] virtual PathSet list() const = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

// Plain tree walk. The top-level .git directory is VCS metadata and is never listed.
class WalkLister final : public RepoLister {
public:
    explicit WalkLister(std::filesystem::path repoRoot, fs::Walker::Options opts = {});

    [[nodiscard]] PathSet list() const override;
    [[nodiscard]] std::string name() const override { return "walk"; }

private:
    std::filesystem::path repoRoot_;
    fs::Walker::Options opts_;
};

// Runs `git ls-files -z` inside the repository; only tracked files are listed.
// Throws error::RepoListingFailed when git cannot be run or exits non-zero.
class GitLister final : public RepoLister {
public:
    explicit GitLister(std::filesystem::path repoRoot, std::string gitBinary = "git");

    [[nodiscard]] PathSet list() const override;
    [[nodiscard]] std::string name() const override { return "git"; }

private:
    std::filesystem::path repoRoot_;
    std::string gitBinary_;
};

}
