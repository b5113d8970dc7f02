#include "shell/commands.hpp"
#include "shell/Router.hpp"
#include "shell/Usage.hpp"
#include "shell/util/argsHelpers.hpp"
#include "runtime/Pipeline.hpp"
#include "sync/Planner.hpp"
#include "sync/Executor.hpp"
#include "log/Registry.hpp"

#include <sstream>
#include <fmt/core.h>

using namespace ad::log;

namespace ad::shell {

static CommandResult handle_sync(const CommandCall& call, const PipelineFactory& pipeline) {
    if (!call.positionals.empty())
        return invalid(fmt::format("sync takes no arguments\n\n{}", Usage::sync().toText()));

    const auto p = pipeline();
    const bool dryRun = p->config().sync.dry_run || hasFlag(call, std::vector<std::string>{"dry-run", "n"});

    const auto plan = sync::Planner::build(p->paths(), p->diff());

    std::ostringstream out;
    const auto result = sync::Executor::run(plan, dryRun, out);

    if (!dryRun)
        Registry::archdiff()->info("[sync] {} files copied, {} skipped", result.copied, result.skipped);

    return ok(out.str());
}

void registerSyncCommands(Router& r, const PipelineFactory& pipeline) {
    r.registerCommand(Usage::sync(), [pipeline](const CommandCall& call) { return handle_sync(call, pipeline); });
}

}
