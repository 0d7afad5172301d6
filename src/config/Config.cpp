#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace dt::config {

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;

    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to load config file " + path.string() + ": " + e.what());
    }

    const auto decode = [&]<typename T>(const char* key, T& section) {
        const auto node = root[key];
        if (!node) return;
        if (!YAML::convert<T>::decode(node, section))
            throw std::runtime_error(std::string("Invalid config section '") + key + "' in " + path.string());
    };

    decode("store", cfg.store);
    decode("driver", cfg.driver);
    decode("io", cfg.io);
    decode("logging", cfg.logging);

    return cfg;
}

uintmax_t normalizeChunkSize(const uintmax_t bytes) {
    if (bytes < RESUMABLE_CHUNK_GRANULARITY) return RESUMABLE_CHUNK_GRANULARITY;
    return bytes - bytes % RESUMABLE_CHUNK_GRANULARITY;
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"store", c.store},
        {"driver", c.driver},
        {"io", c.io},
        {"logging", c.logging}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("store")) j.at("store").get_to(c.store);
    if (j.contains("driver")) j.at("driver").get_to(c.driver);
    if (j.contains("io")) j.at("io").get_to(c.io);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
}

void to_json(nlohmann::json& j, const StoreConfig& c) {
    j = {
        {"endpoint", c.endpoint},
        {"access_token_file", c.access_token_file.string()},
        {"access_token_env", c.access_token_env},
        {"upload_chunk_size", c.upload_chunk_size},
        {"page_size", c.page_size},
        {"timeout_seconds", c.timeout_seconds}
    };
}

void from_json(const nlohmann::json& j, StoreConfig& c) {
    c.endpoint = j.value("endpoint", "https://www.googleapis.com");
    c.access_token_file = j.value("access_token_file", "");
    c.access_token_env = j.value("access_token_env", "DRIVETREE_ACCESS_TOKEN");
    c.upload_chunk_size = normalizeChunkSize(j.value("upload_chunk_size", DEFAULT_UPLOAD_CHUNK_SIZE));
    c.page_size = j.value("page_size", 1000u);
    c.timeout_seconds = j.value("timeout_seconds", 300u);
}

void to_json(nlohmann::json& j, const DriverConfig& c) {
    j = {{"root_directory", c.root_directory}};
}

void from_json(const nlohmann::json& j, DriverConfig& c) {
    c.root_directory = j.value("root_directory", "");
}

void to_json(nlohmann::json& j, const IOConfig& c) {
    j = {{"pipe_buffer_size", c.pipe_buffer_size}};
}

void from_json(const nlohmann::json& j, IOConfig& c) {
    c.pipe_buffer_size = j.value("pipe_buffer_size", DEFAULT_PIPE_BUFFER_SIZE);
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"log_dir", c.log_dir.string()},
        {"levels", c.levels}
    };
}

void from_json(const nlohmann::json& j, LoggingConfig& c) {
    c.log_dir = j.value("log_dir", "");
    if (j.contains("levels")) j.at("levels").get_to(c.levels);
}

void to_json(nlohmann::json& j, const LogLevelsConfig& c) {
    j = {
        {"console_log_level", c.console_log_level},
        {"file_log_level", c.file_log_level},
        {"subsystem_levels", c.subsystem_levels}
    };
}

void from_json(const nlohmann::json& j, LogLevelsConfig& c) {
    c.console_log_level = j.value("console_log_level", spdlog::level::info);
    c.file_log_level = j.value("file_log_level", spdlog::level::warn);
    if (j.contains("subsystem_levels")) j.at("subsystem_levels").get_to(c.subsystem_levels);
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    j = {
        {"drivetree", c.drivetree},
        {"drive", c.drive},
        {"store", c.store},
        {"io", c.io},
        {"shell", c.shell}
    };
}

void from_json(const nlohmann::json& j, SubsystemLogLevelsConfig& c) {
    c.drivetree = j.value("drivetree", spdlog::level::info);
    c.drive = j.value("drive", spdlog::level::warn);
    c.store = j.value("store", spdlog::level::warn);
    c.io = j.value("io", spdlog::level::warn);
    c.shell = j.value("shell", spdlog::level::warn);
}

} // namespace dt::config
