#pragma once

#include <cstdlib>
#include <filesystem>

namespace dt::paths {

inline constexpr auto DEFAULT_CONFIG_PATH = "/etc/drivetree/config.yaml";
inline constexpr auto DEFAULT_LOG_DIR = "/var/log/drivetree";

inline bool& testMode() {
    static bool testing = false;
    return testing;
}

inline std::filesystem::path getConfigPath() {
    if (const char* env = std::getenv("DRIVETREE_CONFIG"); env && *env) return env;
    return DEFAULT_CONFIG_PATH;
}

inline std::filesystem::path getLogPath() {
    if (testMode()) return std::filesystem::temp_directory_path() / "drivetree-test-logs";
    return DEFAULT_LOG_DIR;
}

inline void setLogPathForTesting() { testMode() = true; }

}
