#pragma once

#include <functional>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>
#include <nlohmann/json.hpp>

namespace dt::shell {

struct FlagKV {
    std::string key;
    std::optional<std::string> value;
};

struct CommandCall {
    std::string name;
    std::vector<FlagKV> options;
    std::vector<std::string> positionals;
};

struct CommandResult {
    int exit_code = 0;                 // 0 = success
    std::string stdout_text;           // CLI stdout
    std::string stderr_text;           // CLI stderr
    nlohmann::json data;               // optional machine-readable payload
    bool has_data = false;
};

using CommandHandler = std::function<CommandResult(const CommandCall&)>;

struct CommandUsage {
    std::string name;
    std::unordered_set<std::string> aliases;
    std::string synopsis;                // e.g. "mv <old-path> <new-path>"
    std::string description;
    size_t min_positionals = 0, max_positionals = 0;
};

struct CommandInfo {
    CommandUsage usage;
    CommandHandler handler;
};

}
