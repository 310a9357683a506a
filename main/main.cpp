#include "cli/Parser.hpp"
#include "cli/Router.hpp"
#include "cli/argsHelpers.hpp"
#include "cli/commands.hpp"
#include "cli/signals.hpp"
#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

#include <filesystem>
#include <string>
#include <vector>
#include <fmt/core.h>

using namespace cw::cli;
using namespace cw::config;
using namespace cw::log;

static void printResult(const CommandResult& res) {
    if (!res.stdout_text.empty()) fmt::print("{}", res.stdout_text);
    if (!res.stderr_text.empty()) {
        fmt::print(stderr, "{}", res.stderr_text);
        if (res.stderr_text.back() != '\n') fmt::print(stderr, "\n");
    }
}

int main(const int argc, char** argv) {
    try {
        Router router;
        registerCommands(router);

        const std::vector<std::string> args(argv + 1, argv + argc);
        const auto call = parseArgs(args, router.switches());

        if (const auto path = optVal(call, "config")) {
            if (!std::filesystem::exists(*path)) {
                fmt::print(stderr, "chunkwise: config file not found: {}\n", *path);
                return 2;
            }
            ConfigRegistry::init(std::filesystem::path(*path));
        } else {
            ConfigRegistry::init();
        }

        Registry::init();
        installSignalHandlers();

        const auto res = router.execute(call);
        printResult(res);

        Registry::shutdown();
        return res.exit_code;
    } catch (const std::exception& e) {
        Registry::chunkwise()->error("[main] {}", e.what());
        fmt::print(stderr, "chunkwise: {}\n", e.what());
        return 1;
    }
}
