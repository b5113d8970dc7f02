#include "pkgdb/Database.hpp"
#include "error/Exceptions.hpp"
#include "fs/model/Path.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <exception>
#include <fstream>
#include <fmt/core.h>

using namespace ad::pkgdb;
using namespace ad::pkgdb::model;
using namespace ad::log;
using namespace ad::error;

namespace {

// Calls fn(section, line) for every non-empty line inside a %SECTION% block.
template <typename Fn>
void forEachSectionLine(const std::filesystem::path& file, Fn&& fn) {
    std::ifstream in(file);
    if (!in) throw PackageDatabaseUnavailable("Failed to open package record: " + file.string());

    std::string section;
    for (std::string line; std::getline(in, line);) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) {
            section.clear();
            continue;
        }
        if (line.size() > 2 && line.front() == '%' && line.back() == '%') {
            section = line.substr(1, line.size() - 2);
            continue;
        }
        if (!section.empty()) fn(section, line);
    }

    if (in.bad()) throw PackageDatabaseUnavailable("Failed to read package record: " + file.string());
}

}

Package LocalDatabase::readPackage(const std::filesystem::path& pkgDir) {
    Package pkg;

    const auto desc = pkgDir / "desc";
    if (std::error_code ec; std::filesystem::exists(desc, ec)) {
        forEachSectionLine(desc, [&](const std::string& section, const std::string& line) {
            if (section == "NAME") pkg.name = line;
            else if (section == "VERSION") pkg.version = line;
        });
    }
    if (pkg.name.empty()) pkg.name = pkgDir.filename().string();

    const auto files = pkgDir / "files";
    if (std::error_code ec; !std::filesystem::exists(files, ec))
        throw PackageDatabaseUnavailable(fmt::format("Package '{}' has no files record at {}", pkg.name, files.string()));

    forEachSectionLine(files, [&](const std::string& section, const std::string& line) {
        if (section == "FILES") {
            if (line.back() == '/') return;   // directory entry
            pkg.files.push_back(fs::model::canonicalKey(line));
        } else if (section == "BACKUP") {
            const auto tab = line.find('\t');
            if (tab == std::string::npos) {
                Registry::pkgdb()->warn("[LocalDatabase] Malformed backup entry in {}: '{}'", files.string(), line);
                return;
            }
            pkg.backups.push_back({fs::model::canonicalKey(line.substr(0, tab)), line.substr(tab + 1)});
        }
    });

    return pkg;
}

LocalDatabase::LocalDatabase(const std::filesystem::path& dbpath) : local_(dbpath / "local") {
    namespace sfs = std::filesystem;

    std::error_code ec;
    if (!sfs::is_directory(local_, ec))
        throw PackageDatabaseUnavailable(fmt::format("Package database not found at {}", local_.string()));

    std::vector<sfs::path> dirs;
    for (sfs::directory_iterator it(local_, ec); !ec && it != sfs::directory_iterator(); it.increment(ec))
        if (std::error_code dec; it->is_directory(dec)) dirs.push_back(it->path());

    if (ec)
        throw PackageDatabaseUnavailable(fmt::format("Failed to read package database {}: {}", local_.string(), ec.message()));

    std::ranges::sort(dirs);
    packages_.reserve(dirs.size());
    for (const auto& dir : dirs) {
        try {
            packages_.push_back(readPackage(dir));
        } catch (const PackageDatabaseUnavailable&) {
            std::throw_with_nested(PackageDatabaseUnavailable(
                fmt::format("Failed to load package database {}", local_.string())));
        }
    }

    Registry::pkgdb()->debug("[LocalDatabase] Loaded {} packages from {}", packages_.size(), local_.string());
}
