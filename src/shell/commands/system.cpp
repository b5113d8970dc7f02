#include "shell/commands.hpp"
#include "shell/Router.hpp"
#include "shell/Usage.hpp"
#include "shell/util/argsHelpers.hpp"

#include <algorithm>
#include <fmt/core.h>

namespace ad::shell {

static CommandResult handle_help(const CommandCall& call) {
    const auto book = Usage::all();
    if (call.positionals.empty()) return ok(book.toText());

    const auto& topic = call.positionals.front();
    for (const auto& c : book.commands) {
        if (c.command == topic || std::ranges::find(c.command_aliases, topic) != c.command_aliases.end())
            return ok(c.toText());
    }
    return invalid(fmt::format("No help for unknown command: {}\n\n{}", topic, book.toText()));
}

void registerSystemCommands(Router& r) {
    r.registerCommand(Usage::help(), handle_help);
}

}
