#include "fs/model/Path.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace ad::fs::model;
using namespace ad::log;

static std::filesystem::path normalizeRoot(const std::filesystem::path& root) {
    if (root.empty()) return "/";
    return canonicalKey(std::filesystem::absolute(root).lexically_normal().string());
}

Path::Path(const std::filesystem::path& liveRoot, const std::filesystem::path& repoRoot)
    : liveRoot(normalizeRoot(liveRoot)),
      repoRoot(normalizeRoot(repoRoot)) {

    Registry::inventory()->debug("[Path] Initialized paths:\nliveRoot: {}\nrepoRoot: {}",
                                 this->liveRoot.string(), this->repoRoot.string());
}

const std::filesystem::path& Path::root(const PathType& type) const {
    switch (type) {
    case PathType::LIVE_ROOT: return liveRoot;
    case PathType::REPO_ROOT: return repoRoot;
    default:
        throw std::invalid_argument("Invalid PathType");
    }
}

std::filesystem::path Path::absPath(const std::string& key, const PathType& type) const {
    const auto& base = root(type);
    if (key.empty() || key == "/") return base;
    return base / stripLeadingSlash(key);
}

std::string Path::relPath(const std::filesystem::path& absPath, const PathType& type) const {
    const auto rel = absPath.lexically_normal().lexically_relative(root(type));
    if (rel.empty() || rel.string().starts_with("..")) return canonicalKey(absPath.filename().string());
    if (rel == ".") return "/";
    return canonicalKey(rel.string());
}
