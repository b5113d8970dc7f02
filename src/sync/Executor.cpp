#include "sync/Executor.hpp"
#include "sync/model/Action.hpp"
#include "error/Exceptions.hpp"
#include "log/Registry.hpp"

#include <filesystem>
#include <ostream>
#include <fmt/core.h>

using namespace ad::sync;
using namespace ad::log;

namespace {

bool isPermissionError(const std::error_code& ec) {
    return ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted;
}

}

Executor::Result Executor::run(const std::vector<model::Action>& plan, const bool dryRun, std::ostream& out) {
    Result result;

    for (const auto& a : plan) {
        if (dryRun) {
            out << "cp " << a.source.string() << ' ' << a.destination.string() << '\n';
            continue;
        }

        if (dispatch(a)) {
            ++result.copied;
            Registry::sync()->info("[Executor] {} {} -> {}", model::to_string(a.type), a.source.string(), a.destination.string());
        } else {
            ++result.skipped;
        }
    }

    if (!dryRun)
        Registry::sync()->debug("[Executor] {} copied, {} skipped", result.copied, result.skipped);
    return result;
}

bool Executor::dispatch(const model::Action& action) {
    namespace sfs = std::filesystem;

    const auto fail = [&](const std::error_code& ec, const char* step) {
        if (isPermissionError(ec)) {
            if (!Registry::quietSkips())
                Registry::sync()->warn("[Executor] Skipping {}: {} failed: {}", action.key, step, ec.message());
            return false;
        }
        throw error::IOError(fmt::format("Failed to copy {} to {} ({}): {}",
                                         action.source.string(), action.destination.string(), step, ec.message()));
    };

    std::error_code ec;
    const auto srcStatus = sfs::symlink_status(action.source, ec);
    if (ec) return fail(ec, "stat source");

    if (const auto parent = action.destination.parent_path(); !parent.empty()) {
        sfs::create_directories(parent, ec);
        if (ec) return fail(ec, "create parent directories");
    }

    // Never write through a link sitting at the destination
    if (const auto dstStatus = sfs::symlink_status(action.destination, ec); sfs::is_symlink(dstStatus) ||
        (sfs::exists(dstStatus) && sfs::is_symlink(srcStatus))) {
        sfs::remove(action.destination, ec);
        if (ec) return fail(ec, "replace destination");
    }
    ec.clear();

    if (sfs::is_symlink(srcStatus)) {
        sfs::copy_symlink(action.source, action.destination, ec);
        if (ec) return fail(ec, "copy symlink");
        return true;
    }

    sfs::copy_file(action.source, action.destination, sfs::copy_options::overwrite_existing, ec);
    if (ec) return fail(ec, "copy file");
    return true;
}
