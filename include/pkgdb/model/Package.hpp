#pragma once

#include <string>
#include <vector>

namespace ad::pkgdb::model {

struct BackupFile {
    std::string path;   // canonical key, e.g. "/etc/pacman.conf"
    std::string hash;   // md5 recorded at install time
};

struct Package {
    std::string name;
    std::string version;
    std::vector<std::string> files;   // canonical keys, directories excluded
    std::vector<BackupFile> backups;
};

}
