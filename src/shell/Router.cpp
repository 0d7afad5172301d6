#include "shell/Router.hpp"
#include "shell/util/argsHelpers.hpp"
#include "drive/errors.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <algorithm>
#include <cctype>
#include <exception>
#include <vector>

using namespace dt::shell;
using namespace dt::log;

namespace {

// Appends the chain of nested exceptions, outermost first
void appendNested(std::string& out, const std::exception& e) {
    try {
        std::rethrow_if_nested(e);
    } catch (const std::exception& nested) {
        out += fmt::format("\n  caused by: {}", nested.what());
        appendNested(out, nested);
    }
}

}

void Router::registerCommand(CommandUsage usage, CommandHandler handler) {
    const std::string key = normalize(usage.name);

    for (const auto& alias : usage.aliases) {
        const auto a = normalize(alias);
        if (aliasMap_.contains(a) && aliasMap_.at(a) != key) {
            Registry::shell()->warn("[Router] Alias '{}' already mapped to '{}'; skipping duplicate for '{}'",
                                    a, aliasMap_.at(a), key);
            continue;
        }
        aliasMap_[a] = key;
        Registry::shell()->debug("[Router] Alias '{}' mapped to '{}'", a, key);
    }

    commands_[key] = CommandInfo{std::move(usage), std::move(handler)};
}

std::string Router::canonicalFor(const std::string& nameOrAlias) const {
    std::string n = normalize(nameOrAlias);
    if (commands_.contains(n)) return n;
    if (aliasMap_.contains(n)) return aliasMap_.at(n);
    return n; // unknown; let caller error
}

bool Router::contains(const std::string& nameOrAlias) const {
    return commands_.contains(canonicalFor(nameOrAlias));
}

CommandResult Router::execute(const CommandCall& call) const {
    if (call.name.empty()) return invalid("No command provided.\n\n" + renderHelp());

    const auto canonical = canonicalFor(call.name);
    if (!commands_.contains(canonical))
        return invalid(fmt::format("Unknown command or alias: {}\n\n{}", call.name, renderHelp()));

    const auto& [usage, handler] = commands_.at(canonical);
    const auto n = call.positionals.size();
    if (n < usage.min_positionals || n > usage.max_positionals)
        return invalid(fmt::format("usage: drivetree {}", usage.synopsis));

    Registry::shell()->debug("[Router] Executing command: '{}' ({} positionals)", canonical, n);

    try {
        return handler(call);
    } catch (const drive::DriveError& e) {
        std::string msg = e.what();
        appendNested(msg, e);
        Registry::shell()->debug("[Router] {} failed: {}", canonical, msg);
        return failed(std::move(msg));
    } catch (const std::exception& e) {
        Registry::shell()->error("[Router] {} failed: {}", canonical, e.what());
        return failed(e.what());
    }
}

std::string Router::renderHelp() const {
    std::vector<const CommandUsage*> usages;
    usages.reserve(commands_.size());
    for (const auto& [_, info] : commands_) usages.push_back(&info.usage);
    std::ranges::sort(usages, {}, &CommandUsage::name);

    size_t width = 0;
    for (const auto* u : usages) width = std::max(width, u->synopsis.size());

    std::string out = "usage: drivetree [--config <path>] [--root <path>] <command> [args...]\n\ncommands:\n";
    for (const auto* u : usages) out += fmt::format("  {:<{}}  {}\n", u->synopsis, width, u->description);
    return out;
}

std::string Router::renderHelp(const std::string& nameOrAlias) const {
    const auto canonical = canonicalFor(nameOrAlias);
    if (!commands_.contains(canonical)) return renderHelp();

    const auto& usage = commands_.at(canonical).usage;
    std::string out = fmt::format("usage: drivetree {}\n\n{}\n", usage.synopsis, usage.description);
    if (!usage.aliases.empty()) {
        std::vector<std::string> aliases(usage.aliases.begin(), usage.aliases.end());
        std::ranges::sort(aliases);
        out += fmt::format("\naliases: {}\n", fmt::join(aliases, ", "));
    }
    return out;
}

std::string Router::normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (const unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}
