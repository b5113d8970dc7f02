#pragma once

#include "shell/CommandUsage.hpp"

#include <string>
#include <unordered_set>

namespace ad::shell {

struct Usage {
    static CommandUsage ls();
    static CommandUsage status();
    static CommandUsage sync();
    static CommandUsage help();

    static std::vector<Entry> global();
    static CommandBook all();

    // Global flags that take a value (--root <dir>).
    static const std::unordered_set<std::string>& valueFlags();

    // Every global flag spelling, without dashes.
    static const std::unordered_set<std::string>& globalFlags();
};

}
