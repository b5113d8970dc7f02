#pragma once

#include <filesystem>
#include <string>

namespace ad::sync::model {

enum class ActionType {
    LiveToRepo,
    RepoToLive,
};

struct Action {
    ActionType type{ActionType::LiveToRepo};
    std::string key;                      // canonical path
    std::filesystem::path source;
    std::filesystem::path destination;

    bool operator==(const Action&) const = default;
};

std::string to_string(ActionType type);

}
