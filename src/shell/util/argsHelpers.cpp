#include "shell/util/argsHelpers.hpp"

#include <algorithm>

namespace dt::shell {

CommandResult invalid(std::string msg) { return {2, "", std::move(msg)}; }
CommandResult ok(std::string out) { return {0, std::move(out), ""}; }
CommandResult failed(std::string msg) { return {1, "", std::move(msg)}; }

std::optional<std::string> optVal(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options) if (k == key) return v.value_or(std::string{});
    return std::nullopt;
}

std::optional<std::string> optVal(const CommandCall& c, const std::vector<std::string>& keys) {
    for (const auto& k : keys) if (const auto v = optVal(c, k)) return v;
    return std::nullopt;
}

bool hasFlag(const CommandCall& c, const std::string& key) {
    return std::ranges::any_of(c.options, [&key](const auto& kv) { return kv.key == key; });
}

bool hasFlag(const CommandCall& c, const std::vector<std::string>& keys) {
    for (const auto& k : keys) if (hasFlag(c, k)) return true;
    return false;
}

std::string positionalOr(const CommandCall& c, const size_t index, std::string fallback) {
    return index < c.positionals.size() ? c.positionals[index] : std::move(fallback);
}

}
