#pragma once

#include "shell/types.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace ad::shell {

class CommandUsage;

class Router {
public:
    void registerCommand(const CommandUsage& usage, CommandHandler handler);

    // Routes an already parsed call. Unknown commands and unknown flags come back as exit code 2.
    [[nodiscard]] CommandResult execute(const CommandCall& call) const;

    [[nodiscard]] bool knows(const std::string& nameOrAlias) const;

private:
    std::unordered_map<std::string, CommandInfo> commands_;
    std::unordered_map<std::string, std::string> aliasMap_; // alias -> canonical

    [[nodiscard]] std::string canonicalFor(const std::string& nameOrAlias) const;

    static std::string normalize(const std::string& s);
    static std::string pretty_flag(const std::string& a);
};

}
