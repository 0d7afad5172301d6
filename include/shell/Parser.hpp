#pragma once

#include "shell/types.hpp"

#include <string>
#include <unordered_set>
#include <vector>

namespace dt::shell {

// Upsert a flag (last wins)
inline void setOpt(CommandCall& c, const std::string& key, const std::optional<std::string>& val) {
    for (auto& [k, v] : c.options) if (k == key) { v = val; return; }
    c.options.push_back(FlagKV{key, val});
}

/**
 * Builds a call from argv-style words. The first non-flag word is the command name. "--key value",
 * "--key=value" and "-k value" set options; keys listed in switches never consume a value. A bare
 * "--" ends option parsing so later words are positional even when they start with '-'.
 */
CommandCall parseArgs(const std::vector<std::string>& args, const std::unordered_set<std::string>& switches = {});

}
