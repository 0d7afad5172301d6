#include "log/Registry.hpp"
#include "config/ConfigRegistry.hpp"
#include "config/paths.hpp"

#include <stdexcept>

namespace dt::log {

void Registry::init() {
    const auto& cnf = config::ConfigRegistry::get().logging;
    init(paths::testMode() || cnf.log_dir.empty() ? paths::getLogPath() : cnf.log_dir);
}

void Registry::init(const std::filesystem::path& logDir) {
    if (initialized_) {
        spdlog::warn("[Registry] Already initialized, ignoring second init()");
        return;
    }

    main_log_path_ = logDir / "drivetree.log";

    namespace fs = std::filesystem;
    if (!fs::exists(logDir)) fs::create_directories(logDir);

    const auto& cnf = config::ConfigRegistry::get().logging;

    console_sink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        main_log_path_.string(), main_max_bytes_, main_max_files_);
    main_file_sink_->set_level(cnf.levels.file_log_level);
    main_file_sink_->set_pattern(LOG_FORMAT);

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(
            name, spdlog::sinks_init_list{console_sink_, main_file_sink_});
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("drivetree", sub_levels.drivetree);
    makeLogger("drive",     sub_levels.drive);
    makeLogger("store",     sub_levels.store);
    makeLogger("io",        sub_levels.io);
    makeLogger("shell",     sub_levels.shell);

    initialized_ = true;
    get("drivetree")->debug("[Registry] Initialized, writing to {}", main_log_path_.string());
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[Registry] Registry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[Registry] Logger not found: " + name);
    }
    return logger;
}

bool Registry::isInitialized() { return initialized_; }

}
