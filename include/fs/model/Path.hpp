#pragma once

#include <filesystem>
#include <string>

namespace ad::fs::model {

enum class PathType {
    LIVE_ROOT,
    REPO_ROOT
};

// Canonical keys are absolute, '/'-separated and relative to a root:
// "/etc/pacman.conf" names <liveRoot>/etc/pacman.conf and <repoRoot>/etc/pacman.conf.
struct Path {
    const std::filesystem::path liveRoot, repoRoot;

    Path(const std::filesystem::path& liveRoot, const std::filesystem::path& repoRoot);

    [[nodiscard]] std::filesystem::path absPath(const std::string& key, const PathType& type) const;

    /// Strips the root of the given type and returns the canonical key.
    /// Paths outside the root fall back to their filename.
    [[nodiscard]] std::string relPath(const std::filesystem::path& absPath, const PathType& type) const;

    [[nodiscard]] const std::filesystem::path& root(const PathType& type) const;
};

inline std::filesystem::path makeAbsolute(const std::filesystem::path& path) {
    if (path.empty()) return "/";
    if (path.is_absolute()) return path.lexically_normal();
    return std::filesystem::path("/") / path.lexically_normal();
}

inline std::filesystem::path stripLeadingSlash(const std::filesystem::path& path) {
    if (path.empty()) return "/";
    auto norm = path.lexically_normal();
    if (norm.empty() || norm == "/") return "/";
    if (norm.string().front() == '/') return { norm.string().substr(1) };
    return norm;
}

// "etc/a.conf", "/etc/a.conf", "/etc//a.conf" and "/etc/./a.conf" all map to "/etc/a.conf".
inline std::string canonicalKey(const std::string& path) {
    auto key = makeAbsolute(path).string();
    while (key.size() > 1 && key.back() == '/') key.pop_back();
    return key;
}

inline std::string trim(const std::string& str) {
    const auto strBegin = str.find_first_not_of(" \t\n\r");
    if (strBegin == std::string::npos) return ""; // no content

    const auto strEnd = str.find_last_not_of(" \t\n\r");
    const auto strRange = strEnd - strBegin + 1;

    return str.substr(strBegin, strRange);
}

}
