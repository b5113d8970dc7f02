#pragma once

#include <filesystem>
#include <string>

namespace ad::crypto::hash {

struct Digest {
    enum class Status { OK, NOT_FOUND, PERMISSION_DENIED };

    Status status = Status::OK;
    std::string hex;   // lowercase hex, empty unless status == OK

    [[nodiscard]] bool ok() const { return status == Status::OK; }
    [[nodiscard]] bool notFound() const { return status == Status::NOT_FOUND; }
    [[nodiscard]] bool permissionDenied() const { return status == Status::PERMISSION_DENIED; }
};

// Streams the file through MD5, the digest pacman records for backup files.
// Missing files and refused reads come back as a status; any other failure
// throws error::IOError.
Digest md5(const std::filesystem::path& filepath);

std::string toHex(const unsigned char* bytes, size_t len);

}
