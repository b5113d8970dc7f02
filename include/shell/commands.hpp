#pragma once

#include <functional>
#include <memory>

namespace ad::runtime { class Pipeline; }

namespace ad::shell {

class Router;

// Builds the pipeline for a command; by default from the installed ConfigRegistry.
using PipelineFactory = std::function<std::shared_ptr<const runtime::Pipeline>()>;

PipelineFactory defaultPipelineFactory();

void registerInventoryCommands(Router& r, const PipelineFactory& pipeline);
void registerStatusCommands(Router& r, const PipelineFactory& pipeline);
void registerSyncCommands(Router& r, const PipelineFactory& pipeline);
void registerSystemCommands(Router& r);

inline void registerAllCommands(Router& r, const PipelineFactory& pipeline = defaultPipelineFactory()) {
    registerInventoryCommands(r, pipeline);
    registerStatusCommands(r, pipeline);
    registerSyncCommands(r, pipeline);
    registerSystemCommands(r);
}

}
