#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace dt::config {

constexpr static uintmax_t RESUMABLE_CHUNK_GRANULARITY = 256 * 1024;            // 256KiB
constexpr static uintmax_t DEFAULT_UPLOAD_CHUNK_SIZE = 8 * 1024 * 1024;         // 8MiB
constexpr static uintmax_t DEFAULT_PIPE_BUFFER_SIZE = 1024 * 1024;              // 1MiB

struct StoreConfig {
    std::string endpoint = "https://www.googleapis.com";
    std::filesystem::path access_token_file{};
    std::string access_token_env = "DRIVETREE_ACCESS_TOKEN";
    uintmax_t upload_chunk_size = DEFAULT_UPLOAD_CHUNK_SIZE;
    unsigned int page_size = 1000;
    unsigned int timeout_seconds = 300;
};

struct DriverConfig {
    std::string root_directory{};
};

struct IOConfig {
    uintmax_t pipe_buffer_size = DEFAULT_PIPE_BUFFER_SIZE;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum drivetree = spdlog::level::info;   // CLI lifecycle
    spdlog::level::level_enum drive     = spdlog::level::warn;   // Resolution and tree mutation
    spdlog::level::level_enum store     = spdlog::level::warn;   // Remote calls, HTTP failures
    spdlog::level::level_enum io        = spdlog::level::warn;   // Pipes and file handles
    spdlog::level::level_enum shell     = spdlog::level::warn;   // Command parsing
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir{};
    LogLevelsConfig levels;
};

struct Config {
    StoreConfig store;
    DriverConfig driver;
    IOConfig io;
    LoggingConfig logging;
};

Config loadConfig(const std::filesystem::path& path);

// Rounds down to a multiple of the resumable upload granularity, never below one granule
uintmax_t normalizeChunkSize(uintmax_t bytes);

void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);
void to_json(nlohmann::json& j, const StoreConfig& c);
void from_json(const nlohmann::json& j, StoreConfig& c);
void to_json(nlohmann::json& j, const DriverConfig& c);
void from_json(const nlohmann::json& j, DriverConfig& c);
void to_json(nlohmann::json& j, const IOConfig& c);
void from_json(const nlohmann::json& j, IOConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void from_json(const nlohmann::json& j, LoggingConfig& c);
void to_json(nlohmann::json& j, const LogLevelsConfig& c);
void from_json(const nlohmann::json& j, LogLevelsConfig& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);
void from_json(const nlohmann::json& j, SubsystemLogLevelsConfig& c);

} // namespace dt::config
