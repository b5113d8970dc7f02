#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace ad::fs {

class Walker {
public:
    struct Entry {
        std::filesystem::path path;
        bool is_directory;
    };

    struct Options {
        bool strict = false;   // a permission error aborts the walk instead of skipping the node
    };

    // Returning true drops the entry; for a directory the whole subtree is pruned.
    using SkipFn = std::function<bool(const Entry&)>;

    explicit Walker(Options opts);
    Walker();

    // Non-directory entries under root (symlinks are reported, never followed).
    // Visit order follows the directory listing, callers sort if they need to.
    [[nodiscard]] std::vector<std::filesystem::path> files(const std::filesystem::path& root, const SkipFn& skip = nullptr) const;

private:
    Options opts_;

    void onError(const std::filesystem::path& path, const std::error_code& ec) const;
};

}
