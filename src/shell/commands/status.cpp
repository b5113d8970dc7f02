#include "shell/commands.hpp"
#include "shell/Router.hpp"
#include "shell/Usage.hpp"
#include "shell/util/argsHelpers.hpp"
#include "runtime/Pipeline.hpp"

#include <fmt/core.h>

namespace ad::shell {

static CommandResult handle_status(const CommandCall& call, const PipelineFactory& pipeline) {
    if (!call.positionals.empty())
        return invalid(fmt::format("status takes no arguments\n\n{}", Usage::status().toText()));

    const auto p = pipeline();
    const auto diff = p->diff();

    if (!hasFlag(call, std::vector<std::string>{"annotate", "a"}))
        return ok(joinLines(p->toLive(diff.report())));

    std::vector<std::string> lines;
    for (const auto& [code, key] : diff.annotated())
        lines.push_back(fmt::format("{} {}", code, p->toLive(key)));
    return ok(joinLines(lines));
}

void registerStatusCommands(Router& r, const PipelineFactory& pipeline) {
    r.registerCommand(Usage::status(), [pipeline](const CommandCall& call) { return handle_status(call, pipeline); });
}

}
