#include "fs/Walker.hpp"
#include "error/Exceptions.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>
#include <system_error>

namespace ad::fs {

Walker::Walker(const Options opts) : opts_(opts) {}

Walker::Walker() : opts_{} {}

void Walker::onError(const std::filesystem::path& path, const std::error_code& ec) const {
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
        if (opts_.strict)
            throw error::IOError(fmt::format("Permission denied while walking {}: {}", path.string(), ec.message()));
        if (!log::Registry::quietSkips())
            log::Registry::inventory()->warn("[Walker] Skipping {}: {}", path.string(), ec.message());
        return;
    }

    // Vanished between listing and stat; nothing to report.
    if (ec == std::errc::no_such_file_or_directory) return;

    throw error::IOError(fmt::format("Failed to walk {}: {}", path.string(), ec.message()));
}

std::vector<std::filesystem::path> Walker::files(const std::filesystem::path& root, const SkipFn& skip) const {
    namespace sfs = std::filesystem;

    std::vector<sfs::path> out;
    std::vector<sfs::path> pending{root};

    std::error_code ec;
    const auto rootStatus = sfs::symlink_status(root, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory)
            throw error::IOError(fmt::format("Walk root does not exist: {}", root.string()));
        onError(root, ec);
        return out;
    }
    if (!sfs::is_directory(rootStatus))
        throw error::IOError(fmt::format("Walk root is not a directory: {}", root.string()));

    while (!pending.empty()) {
        const auto dir = std::move(pending.back());
        pending.pop_back();

        sfs::directory_iterator it(dir, ec);
        if (ec) {
            onError(dir, ec);
            ec.clear();
            continue;
        }

        for (; it != sfs::directory_iterator(); it.increment(ec)) {
            if (ec) break;

            const auto& de = *it;
            std::error_code sec;
            const bool isDir = sfs::is_directory(de.symlink_status(sec));
            if (sec) {
                onError(de.path(), sec);
                continue;
            }

            const Entry entry{de.path(), isDir};
            if (skip && skip(entry)) continue;

            if (isDir) pending.push_back(de.path());
            else out.push_back(de.path());
        }

        if (ec) {
            onError(dir, ec);
            ec.clear();
        }
    }

    return out;
}

}
