#pragma once

#include "config/Config.hpp"
#include "config/util.hpp"

#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace dt::config;

inline std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<StoreConfig> {
    static Node encode(const StoreConfig& rhs) {
        Node node;
        node["endpoint"] = rhs.endpoint;
        node["access_token_file"] = rhs.access_token_file.string();
        node["access_token_env"] = rhs.access_token_env;
        node["upload_chunk_size"] = bytesToSizeStr(rhs.upload_chunk_size);
        node["page_size"] = rhs.page_size;
        node["timeout_seconds"] = rhs.timeout_seconds;
        return node;
    }

    static bool decode(const Node& node, StoreConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.endpoint = node["endpoint"].as<std::string>("https://www.googleapis.com");
        rhs.access_token_file = node["access_token_file"].as<std::string>("");
        rhs.access_token_env = node["access_token_env"].as<std::string>("DRIVETREE_ACCESS_TOKEN");
        rhs.upload_chunk_size = normalizeChunkSize(parseSizeToBytes(node["upload_chunk_size"].as<std::string>("8MB")));
        rhs.page_size = node["page_size"].as<unsigned int>(1000);
        rhs.timeout_seconds = node["timeout_seconds"].as<unsigned int>(300);
        return true;
    }
};

template<>
struct convert<DriverConfig> {
    static Node encode(const DriverConfig& rhs) {
        Node node;
        node["root_directory"] = rhs.root_directory;
        return node;
    }

    static bool decode(const Node& node, DriverConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.root_directory = node["root_directory"].as<std::string>("");
        return true;
    }
};

template<>
struct convert<IOConfig> {
    static Node encode(const IOConfig& rhs) {
        Node node;
        node["pipe_buffer_size"] = bytesToSizeStr(rhs.pipe_buffer_size);
        return node;
    }

    static bool decode(const Node& node, IOConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.pipe_buffer_size = parseSizeToBytes(node["pipe_buffer_size"].as<std::string>("1MB"));
        if (rhs.pipe_buffer_size == 0) return false;
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["drivetree"] = to_std_string(spdlog::level::to_string_view(rhs.drivetree));
        node["drive"]     = to_std_string(spdlog::level::to_string_view(rhs.drive));
        node["store"]     = to_std_string(spdlog::level::to_string_view(rhs.store));
        node["io"]        = to_std_string(spdlog::level::to_string_view(rhs.io));
        node["shell"]     = to_std_string(spdlog::level::to_string_view(rhs.shell));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.drivetree = spdlog::level::from_str(node["drivetree"].as<std::string>("info"));
        rhs.drive = spdlog::level::from_str(node["drive"].as<std::string>("warn"));
        rhs.store = spdlog::level::from_str(node["store"].as<std::string>("warn"));
        rhs.io = spdlog::level::from_str(node["io"].as<std::string>("warn"));
        rhs.shell = spdlog::level::from_str(node["shell"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("warn"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        if (node["levels"]) rhs.levels = node["levels"].as<LogLevelsConfig>();
        return true;
    }
};

}
