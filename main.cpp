#include "config/ConfigRegistry.hpp"
#include "drive/Driver.hpp"
#include "drive/store/GoogleDriveStore.hpp"
#include "log/Registry.hpp"
#include "shell/Parser.hpp"
#include "shell/Router.hpp"
#include "shell/commands.hpp"
#include "shell/util/argsHelpers.hpp"

#include <fmt/core.h>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <optional>

using namespace dt;
using namespace dt::config;
using namespace dt::shell;

namespace {

void initRegistries(const std::optional<std::string>& configPath) {
    if (configPath) {
        if (!std::filesystem::exists(*configPath))
            throw std::runtime_error("config file not found: " + *configPath);
        ConfigRegistry::init(std::filesystem::path(*configPath));
    } else {
        ConfigRegistry::init();
    }

    try {
        log::Registry::init();
    } catch (const std::filesystem::filesystem_error& e) {
        // Unprivileged users cannot create the default log directory
        const auto fallback = std::filesystem::temp_directory_path() / "drivetree";
        fmt::print(stderr, "drivetree: {}; logging to {}\n", e.what(), fallback.string());
        log::Registry::init(fallback);
    }
}

}

int main(const int argc, char** argv) {
    const std::vector<std::string> args(argv + 1, argv + argc);
    const auto call = parseArgs(args, SWITCHES);

    try {
        initRegistries(optVal(call, "config"));
    } catch (const std::exception& e) {
        fmt::print(stderr, "drivetree: failed to initialize: {}\n", e.what());
        return 1;
    }

    const auto& cnf = ConfigRegistry::get();
    const auto rootOverride = optVal(call, "root");

    auto session = std::make_shared<Session>();
    session->in = &std::cin;
    session->out = &std::cout;

    std::once_flag driverOnce;
    std::shared_ptr<drive::Driver> driver;
    session->driver = [&] {
        std::call_once(driverOnce, [&] {
            auto store = std::make_shared<drive::store::GoogleDriveStore>(
                cnf.store, drive::store::GoogleDriveStore::loadAccessToken(cnf.store), cnf.io.pipe_buffer_size);

            auto driverCnf = cnf.driver;
            if (rootOverride) driverCnf.root_directory = *rootOverride;
            driver = std::make_shared<drive::Driver>(std::move(store), driverCnf, cnf.io);
            log::Registry::drivetree()->debug("[main] Driver ready, root=`{}'", driverCnf.root_directory);
        });
        return driver;
    };

    Router router;
    registerAllCommands(router, session);

    CommandCall dispatched = call;
    if (dispatched.name.empty() || hasFlag(call, "help") || hasFlag(call, "h")) {
        dispatched.positionals.clear();
        if (!dispatched.name.empty() && dispatched.name != "help") dispatched.positionals.push_back(dispatched.name);
        dispatched.name = "help";
    }

    log::Registry::drivetree()->debug("[main] Running '{}'", dispatched.name);
    const auto result = router.execute(dispatched);

    if (!result.stdout_text.empty()) fmt::print("{}", result.stdout_text);
    if (!result.stderr_text.empty()) fmt::print(stderr, "drivetree: {}\n", result.stderr_text);
    return result.exit_code;
}
