#pragma once

#include "sync/model/Action.hpp"

#include <chrono>
#include <optional>
#include <system_error>
#include <vector>

namespace ad::fs::model { struct Path; }
namespace ad::reconcile::model { struct Diff; }

namespace ad::sync {

struct Planner {
    // nullopt means the file does not exist.
    using Stamp = std::optional<std::chrono::nanoseconds>;

    // One action per reported path, in report order. Missing-in-repo entries go live -> repo,
    // diverged entries go from the newer copy to the older one.
    static std::vector<model::Action> build(const fs::model::Path& paths, const reconcile::model::Diff& diff);

    // Newest wins; a missing side is the oldest. Equal stamps yield no action.
    static std::optional<model::ActionType> decideForBoth(const Stamp& live, const Stamp& repo);

    // lstat modification time; a symlink is stamped itself, not its target.
    // A refused stat is reported through ec, any other failure but "not found" throws error::IOError.
    static Stamp modifiedAt(const std::filesystem::path& path, std::error_code& ec);
};

}
