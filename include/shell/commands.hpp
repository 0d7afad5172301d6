#pragma once

#include <functional>
#include <iosfwd>
#include <memory>
#include <string>
#include <unordered_set>

namespace dt::drive {
class Driver;
}

namespace dt::shell {

class Router;

// State shared by command handlers. The driver is built on first use so commands that never
// touch the store (help, config) run without credentials.
struct Session {
    std::function<std::shared_ptr<drive::Driver>()> driver;
    std::istream* in = nullptr;    // content source for put without a local file
    std::ostream* out = nullptr;   // content sink for get without a local file
};

// Options that never take a value
inline const std::unordered_set<std::string> SWITCHES = {"json", "replace", "help", "h"};

void registerDriveCommands(Router& r, const std::shared_ptr<Session>& session);
void registerSystemCommands(Router& r, const std::shared_ptr<Session>& session);

inline void registerAllCommands(Router& r, const std::shared_ptr<Session>& session) {
    registerDriveCommands(r, session);
    registerSystemCommands(r, session);
}

}
