#pragma once

#include "fs/Walker.hpp"

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace ad::fs::model { struct Path; }
namespace ad::ignore { class Matcher; }
namespace ad::pkgdb { class Database; }

namespace ad::inventory {

class RepoLister;

// Every set below is keyed by canonical path ("/etc/a.conf").
using PathSet = std::unordered_set<std::string>;
using BackupMap = std::unordered_map<std::string, std::string>;   // canonical path -> pristine md5

// Union of every installed package's file list. No ignore filtering.
PathSet buildPackageOwnedFiles(const pkgdb::Database& db);

// Backup (config) files with the hash recorded at install time.
BackupMap buildBackupRecords(const pkgdb::Database& db);

// Walks the live root. Ignored directories are pruned, ignored files dropped.
PathSet buildLiveFilesystemFiles(const fs::model::Path& paths,
                                 const ignore::Matcher& matcher,
                                 const fs::Walker::Options& opts = {});

PathSet buildRepoFiles(const RepoLister& lister);

[[nodiscard]] std::vector<std::string> sorted(const PathSet& set);

}
