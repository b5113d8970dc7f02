// Shell
#include "shell/Parser.hpp"
#include "shell/Router.hpp"
#include "shell/Usage.hpp"
#include "shell/GlobalOptions.hpp"
#include "shell/commands.hpp"
#include "shell/util/argsHelpers.hpp"

// Misc
#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

#include <exception>
#include <string>
#include <vector>
#include <fmt/core.h>

using namespace ad::config;
using namespace ad::shell;
using namespace ad::log;

namespace {

// Prints e and every exception nested inside it, outermost first.
void printChain(const std::exception& e, const int depth = 0) {
    if (depth == 0) fmt::print(stderr, "archdiff: {}\n", e.what());
    else fmt::print(stderr, "{:>{}}caused by: {}\n", "", depth * 2, e.what());

    try {
        std::rethrow_if_nested(e);
    } catch (const std::exception& nested) {
        printChain(nested, depth + 1);
    }
}

}

int main(int argc, char** argv) {
    const std::vector<std::string> args(argv + 1, argv + argc);
    auto call = parseTokens(tokenize(args), Usage::valueFlags());

    try {
        auto cfg = loadConfigFor(call);
        applyGlobalOptions(cfg, call);

        ConfigRegistry::init(cfg);
        Registry::init(cfg.logging);
        Registry::setQuietSkips(cfg.scan.quiet);

        Registry::archdiff()->debug("[main] root={} dbpath={} repo={} ignore={}",
                                    cfg.paths.root.string(), cfg.paths.dbpath.string(),
                                    cfg.paths.repo.string(), cfg.paths.ignore.string());

        // "archdiff status --help" is "archdiff help status"
        if (hasFlag(call, std::vector<std::string>{"help", "h"})) {
            CommandCall help{.name = "help"};
            if (!call.name.empty() && call.name != "help") help.positionals.push_back(call.name);
            else help.positionals = call.positionals;
            call = std::move(help);
        }

        Router router;
        registerAllCommands(router);

        const auto result = router.execute(call);
        fmt::print("{}", result.stdout_text);
        if (!result.stderr_text.empty()) fmt::print(stderr, "{}\n", result.stderr_text);
        return result.exit_code;
    } catch (const std::invalid_argument& e) {
        fmt::print(stderr, "archdiff: {}\n\n{}", e.what(), Usage::all().toText());
        return 2;
    } catch (const std::exception& e) {
        printChain(e);
        return 1;
    }
}
