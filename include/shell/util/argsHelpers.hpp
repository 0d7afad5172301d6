#pragma once

#include "shell/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace dt::shell {

CommandResult invalid(std::string msg);
CommandResult ok(std::string out);
CommandResult failed(std::string msg);

std::optional<std::string> optVal(const CommandCall& c, const std::string& key);
std::optional<std::string> optVal(const CommandCall& c, const std::vector<std::string>& keys);

[[nodiscard]] bool hasFlag(const CommandCall& c, const std::string& key);
[[nodiscard]] bool hasFlag(const CommandCall& c, const std::vector<std::string>& keys);

// Positional at index, or fallback when absent
std::string positionalOr(const CommandCall& c, size_t index, std::string fallback = {});

}
