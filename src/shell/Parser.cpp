#include "shell/Parser.hpp"

namespace dt::shell {

namespace {

bool isFlag(const std::string& s) {
    return s.size() > 1 && s[0] == '-' && s != "--";
}

std::string stripDashes(const std::string& s) {
    size_t i = 0; while (i < s.size() && s[i] == '-') ++i;
    return s.substr(i);
}

}

CommandCall parseArgs(const std::vector<std::string>& args, const std::unordered_set<std::string>& switches) {
    CommandCall call;
    bool stopFlags = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const auto& word = args[i];

        if (!stopFlags && word == "--") {
            stopFlags = true;
            continue;
        }

        if (!stopFlags && isFlag(word)) {
            auto key = stripDashes(word);
            if (const auto eq = key.find('='); eq != std::string::npos) {
                setOpt(call, key.substr(0, eq), key.substr(eq + 1));
                continue;
            }
            if (!switches.contains(key) && i + 1 < args.size() && !isFlag(args[i + 1]) && args[i + 1] != "--") {
                setOpt(call, key, args[i + 1]);
                ++i;
            } else {
                setOpt(call, key, std::nullopt);
            }
            continue;
        }

        if (call.name.empty()) call.name = word;
        else call.positionals.push_back(word);
    }

    return call;
}

}
