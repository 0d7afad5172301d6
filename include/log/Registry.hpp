#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace dt::log {

class Registry {
public:
    // Initialize all loggers with sinks/levels from ConfigRegistry.
    static void init();
    static void init(const std::filesystem::path& logDir);

    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    static std::shared_ptr<spdlog::logger> drivetree() { return get("drivetree"); }
    static std::shared_ptr<spdlog::logger> drive()     { return get("drive"); }
    static std::shared_ptr<spdlog::logger> store()     { return get("store"); }
    static std::shared_ptr<spdlog::logger> io()        { return get("io"); }
    static std::shared_ptr<spdlog::logger> shell()     { return get("shell"); }

    [[nodiscard]] static bool isInitialized();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;
    static inline std::filesystem::path main_log_path_;

    static inline std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;
};

}
