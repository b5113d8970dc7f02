#pragma once

#include "shell/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ad::shell {

CommandResult invalid(std::string msg);
CommandResult ok(std::string out);

std::optional<std::string> optVal(const CommandCall& c, const std::vector<std::string>& keys);
std::optional<std::string> optVal(const CommandCall& c, const std::string& key);

[[nodiscard]] bool hasFlag(const CommandCall& c, const std::string& key);
[[nodiscard]] bool hasFlag(const CommandCall& c, const std::vector<std::string>& keys);

[[nodiscard]] bool hasKey(const CommandCall& c, const std::string& key);

// One path per line, trailing newline after each.
std::string joinLines(const std::vector<std::string>& lines);

}
