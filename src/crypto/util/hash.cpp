#include "crypto/util/hash.hpp"
#include "error/Exceptions.hpp"
#include "log/Registry.hpp"

#include <openssl/evp.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <memory>
#include <fmt/core.h>

namespace ad::crypto::hash {

namespace {

constexpr size_t BLOCK_SIZE = 64 * 1024;

struct FdGuard {
    int fd = -1;
    explicit FdGuard(const int fd) : fd(fd) {}
    ~FdGuard() { if (fd >= 0) ::close(fd); }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;
};

struct EvpCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

}

std::string toHex(const unsigned char* bytes, const size_t len) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(digits[bytes[i] >> 4]);
        out.push_back(digits[bytes[i] & 0x0f]);
    }
    return out;
}

Digest md5(const std::filesystem::path& filepath) {
    // O_NONBLOCK so a FIFO cannot stall the open; it is rejected below
    const FdGuard file(::open(filepath.c_str(), O_RDONLY | O_CLOEXEC | O_NONBLOCK));
    if (file.fd < 0) {
        const int err = errno;
        if (err == ENOENT || err == ENOTDIR) return {Digest::Status::NOT_FOUND, {}};
        if (err == EACCES || err == EPERM) {
            log::Registry::hash()->debug("[hash] Permission denied opening {}", filepath.string());
            return {Digest::Status::PERMISSION_DENIED, {}};
        }
        throw error::IOError(fmt::format("Failed to open file for hashing: {}: {}", filepath.string(), std::strerror(err)));
    }

    struct stat st{};
    if (::fstat(file.fd, &st) != 0)
        throw error::IOError(fmt::format("Failed to stat file for hashing: {}: {}", filepath.string(), std::strerror(errno)));
    if (!S_ISREG(st.st_mode))
        throw error::IOError("Not a regular file, refusing to hash: " + filepath.string());

    const std::unique_ptr<EVP_MD_CTX, EvpCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1)
        throw error::IOError("Failed to initialize MD5 digest context");

    std::unique_ptr<unsigned char[]> buffer(new unsigned char[BLOCK_SIZE]);
    for (;;) {
        const ssize_t n = ::read(file.fd, buffer.get(), BLOCK_SIZE);
        if (n == 0) break;
        if (n < 0) {
            if (errno == EINTR) continue;
            const int err = errno;
            if (err == EACCES || err == EPERM) {
                log::Registry::hash()->debug("[hash] Permission denied reading {}", filepath.string());
                return {Digest::Status::PERMISSION_DENIED, {}};
            }
            throw error::IOError(fmt::format("Failed to read file for hashing: {}: {}", filepath.string(), std::strerror(err)));
        }
        if (EVP_DigestUpdate(ctx.get(), buffer.get(), static_cast<size_t>(n)) != 1)
            throw error::IOError("MD5 digest update failed for " + filepath.string());
    }

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int mdLen = 0;
    if (EVP_DigestFinal_ex(ctx.get(), md, &mdLen) != 1)
        throw error::IOError("MD5 digest finalization failed for " + filepath.string());

    log::Registry::hash()->trace("[hash] {} {}", toHex(md, mdLen), filepath.string());
    return {Digest::Status::OK, toHex(md, mdLen)};
}

}
