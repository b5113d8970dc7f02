#pragma once

#include "crypto/util/hash.hpp"

#include <filesystem>

namespace ad::crypto {

class ContentHasher {
public:
    virtual ~ContentHasher() = default;

    [[nodiscard]] virtual hash::Digest digest(const std::filesystem::path& path) const = 0;
};

class Md5Hasher final : public ContentHasher {
public:
    [[nodiscard]] hash::Digest digest(const std::filesystem::path& path) const override { return hash::md5(path); }
};

}
