#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace ad::shell {

// A simple labeled entry (option/positional), with optional aliases.
struct Entry {
    std::string label;                  // primary, e.g. "--dry-run"
    std::string desc;
    std::vector<std::string> aliases;   // e.g. {"-n"}
};

// Example: {"archdiff ls unpackaged --quick", "Untracked files outside /usr"}
struct Example {
    std::string cmd;
    std::string note;
};

class CommandUsage {
public:
    std::string command;                         // e.g. "status"
    std::vector<std::string> command_aliases;    // e.g. {"st"}
    std::string description;
    std::optional<std::string> synopsis;         // if empty, synthesized

    std::vector<Entry> positionals;              // ordered; appear in synopsis
    std::vector<Entry> optional;                 // two-col section
    std::vector<Example> examples;

    int term_width = 100;
    std::size_t max_key_col = 30;

    [[nodiscard]] const std::string& primary() const { return command; }

    // Every flag spelling this command accepts, without leading dashes.
    [[nodiscard]] std::vector<std::string> flagKeys() const;

    [[nodiscard]] std::string toText() const;

    // One line for the command overview.
    [[nodiscard]] std::string basicStr() const;

private:
    [[nodiscard]] std::string buildSynopsis_() const;
    [[nodiscard]] static std::string normalizePositional_(const std::string& s);
};

// The whole tool: global options plus every command.
class CommandBook {
public:
    std::string title;
    std::vector<Entry> global;
    std::vector<CommandUsage> commands;

    [[nodiscard]] std::string toText() const;
};

std::string stripDashes(const std::string& s);

}
