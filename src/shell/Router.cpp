#include "shell/Router.hpp"
#include "shell/CommandUsage.hpp"
#include "shell/Usage.hpp"
#include "shell/util/argsHelpers.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>
#include <cctype>

using namespace ad::shell;
using namespace ad::log;

void Router::registerCommand(const CommandUsage& usage, CommandHandler handler) {
    const std::string key = normalize(usage.primary());

    CommandInfo info{usage.description.empty() ? "No description provided." : usage.description, std::move(handler), {}, {}};

    for (const std::string& alias : usage.command_aliases) {
        const auto a = normalize(alias);
        if (aliasMap_.contains(a) && aliasMap_.at(a) != key) {
            Registry::shell()->warn("[Router] Alias '{}' already mapped to '{}'; skipping duplicate for '{}'",
                                    a, aliasMap_.at(a), key);
            continue;
        }
        info.aliases.insert(a);
        aliasMap_[a] = key;
    }

    for (auto& flag : usage.flagKeys()) info.flags.insert(std::move(flag));

    commands_[key] = std::move(info);
}

std::string Router::canonicalFor(const std::string& nameOrAlias) const {
    std::string n = normalize(nameOrAlias);
    if (commands_.contains(n)) return n;
    if (aliasMap_.contains(n)) return aliasMap_.at(n);
    return n; // unknown; let caller error
}

bool Router::knows(const std::string& nameOrAlias) const {
    return commands_.contains(canonicalFor(nameOrAlias));
}

CommandResult Router::execute(const CommandCall& call) const {
    const auto book = Usage::all().toText();

    if (call.name.empty()) return ok(book);

    const auto canonical = canonicalFor(call.name);
    if (!commands_.contains(canonical))
        return {2, "", fmt::format("Unknown command: {}\n\n{}", call.name, book)};

    const auto& info = commands_.at(canonical);
    for (const auto& [key, value] : call.options) {
        if (Usage::globalFlags().contains(key) || info.flags.contains(key)) continue;
        return invalid(fmt::format("Unknown option {} for '{}'\n\n{}", pretty_flag(key), canonical, book));
    }

    Registry::shell()->debug("[Router] Executing command: '{}'", canonical);
    return info.handler(call);
}

std::string Router::normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (const unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

std::string Router::pretty_flag(const std::string& a) {
    if (a.size() == 1) return fmt::format("-{}", a);
    return fmt::format("--{}", a);
}
