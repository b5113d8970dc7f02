#include "shell/commands.hpp"
#include "shell/Router.hpp"
#include "shell/Usage.hpp"
#include "shell/util/argsHelpers.hpp"
#include "runtime/Pipeline.hpp"
#include "config/ConfigRegistry.hpp"

#include <fmt/core.h>

namespace ad::shell {

PipelineFactory defaultPipelineFactory() {
    return [] { return std::make_shared<const runtime::Pipeline>(config::ConfigRegistry::get()); };
}

static CommandResult handle_ls(const CommandCall& call, const PipelineFactory& pipeline) {
    if (call.positionals.size() != 1)
        return invalid(fmt::format("ls expects exactly one category\n\n{}", Usage::ls().toText()));

    const auto category = reconcile::model::categoryFromString(call.positionals.front());
    if (!category)
        return invalid(fmt::format("Unknown category: {}\n\n{}", call.positionals.front(), Usage::ls().toText()));

    const auto p = pipeline();
    return ok(joinLines(p->toLive(p->list(*category))));
}

void registerInventoryCommands(Router& r, const PipelineFactory& pipeline) {
    r.registerCommand(Usage::ls(), [pipeline](const CommandCall& call) { return handle_ls(call, pipeline); });
}

}
