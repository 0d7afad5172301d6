#include "shell/commands.hpp"
#include "shell/Router.hpp"
#include "shell/util/argsHelpers.hpp"
#include "config/ConfigRegistry.hpp"

#include <nlohmann/json.hpp>

using namespace dt::config;

namespace dt::shell {

void registerSystemCommands(Router& r, const std::shared_ptr<Session>&) {
    r.registerCommand({"help", {"?"}, "help [command]", "Show usage for all commands or one command", 0, 1},
        [&r](const CommandCall& call) {
            return ok(call.positionals.empty() ? r.renderHelp() : r.renderHelp(call.positionals[0]));
        });

    r.registerCommand({"config", {}, "config", "Print the effective configuration as JSON", 0, 0},
        [](const CommandCall&) {
            const nlohmann::json j = ConfigRegistry::get();
            CommandResult res = ok(j.dump(2) + "\n");
            res.data = j;
            res.has_data = true;
            return res;
        });
}

}
