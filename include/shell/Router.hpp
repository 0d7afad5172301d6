#pragma once

#include "shell/types.hpp"

#include <string>
#include <unordered_map>

namespace dt::shell {

class Router {
public:
    void registerCommand(CommandUsage usage, CommandHandler handler);

    // Dispatches by name or alias after checking the positional count. Exceptions thrown by a
    // handler become a failed result carrying the message.
    CommandResult execute(const CommandCall& call) const;

    [[nodiscard]] std::string renderHelp() const;
    [[nodiscard]] std::string renderHelp(const std::string& nameOrAlias) const;

    [[nodiscard]] bool contains(const std::string& nameOrAlias) const;

private:
    std::unordered_map<std::string, CommandInfo> commands_;
    std::unordered_map<std::string, std::string> aliasMap_; // alias -> canonical

    std::string canonicalFor(const std::string& nameOrAlias) const;

    static std::string normalize(const std::string& s);
};

}
