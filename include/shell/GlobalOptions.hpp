#pragma once

#include "config/Config.hpp"
#include "shell/types.hpp"

namespace ad::shell {

// Loads the configuration the call asks for. An explicit --config must exist.
config::Config loadConfigFor(const CommandCall& call);

// Command-line flags win over the file.
void applyGlobalOptions(config::Config& cfg, const CommandCall& call);

}
