#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace cw::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<UploadConfig> {
    static Node encode(const UploadConfig& rhs) {
        Node node;
        node["part_size_mb"] = rhs.part_size / MiB;
        node["large_part_size_mb"] = rhs.large_part_size / MiB;
        node["large_file_threshold_gb"] = rhs.large_file_threshold / GiB;
        node["max_sequence_size_gb"] = rhs.max_sequence_size / GiB;
        node["max_files_per_request"] = rhs.max_files_per_request;
        node["max_parts_per_request"] = rhs.max_parts_per_request;
        node["max_parts_per_file"] = rhs.max_parts_per_file;
        node["max_concurrent_uploads"] = rhs.max_concurrent_uploads;
        node["max_preview_file_size_mb"] = rhs.max_preview_file_size / MiB;
        node["preview_extensions"] = rhs.preview_extensions;
        return node;
    }

    static bool decode(const Node& node, UploadConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.part_size = node["part_size_mb"].as<uintmax_t>(150) * MiB;
        rhs.large_part_size = node["large_part_size_mb"].as<uintmax_t>(1024) * MiB;
        rhs.large_file_threshold = node["large_file_threshold_gb"].as<uintmax_t>(15) * GiB;
        rhs.max_sequence_size = node["max_sequence_size_gb"].as<uintmax_t>(3) * GiB;
        rhs.max_files_per_request = node["max_files_per_request"].as<unsigned int>(50);
        rhs.max_parts_per_request = node["max_parts_per_request"].as<unsigned int>(1000);
        rhs.max_parts_per_file = node["max_parts_per_file"].as<unsigned int>(10000);
        rhs.max_concurrent_uploads = node["max_concurrent_uploads"].as<unsigned int>(6);
        rhs.max_preview_file_size = node["max_preview_file_size_mb"].as<uintmax_t>(5) * MiB;
        if (node["preview_extensions"]) rhs.preview_extensions = node["preview_extensions"].as<std::vector<std::string>>();
        return true;
    }
};

template<>
struct convert<RetryConfig> {
    static Node encode(const RetryConfig& rhs) {
        Node node;
        node["request_attempts"] = rhs.request_attempts;
        node["part_attempts"] = rhs.part_attempts;
        node["base_delay_ms"] = rhs.base_delay.count();
        node["rate_limit_delay_seconds"] = rhs.rate_limit_delay.count();
        return node;
    }

    static bool decode(const Node& node, RetryConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.request_attempts = node["request_attempts"].as<unsigned int>(5);
        rhs.part_attempts = node["part_attempts"].as<unsigned int>(3);
        rhs.base_delay = std::chrono::milliseconds(node["base_delay_ms"].as<long>(1000));
        rhs.rate_limit_delay = std::chrono::seconds(node["rate_limit_delay_seconds"].as<long>(60));
        return true;
    }
};

template<>
struct convert<ApiConfig> {
    static Node encode(const ApiConfig& rhs) {
        Node node;
        node["base_url"] = rhs.base_url;
        node["request_timeout_seconds"] = rhs.request_timeout.count();
        node["connect_timeout_seconds"] = rhs.connect_timeout.count();
        node["verify_tls"] = rhs.verify_tls;
        // auth_token is never written back out
        return node;
    }

    static bool decode(const Node& node, ApiConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.base_url = node["base_url"].as<std::string>("http://localhost:8080");
        rhs.auth_token = node["auth_token"].as<std::string>("");
        rhs.request_timeout = std::chrono::seconds(node["request_timeout_seconds"].as<long>(300));
        rhs.connect_timeout = std::chrono::seconds(node["connect_timeout_seconds"].as<long>(30));
        rhs.verify_tls = node["verify_tls"].as<bool>(true);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["chunkwise"] = to_std_string(spdlog::level::to_string_view(rhs.chunkwise));
        node["planner"]   = to_std_string(spdlog::level::to_string_view(rhs.planner));
        node["engine"]    = to_std_string(spdlog::level::to_string_view(rhs.engine));
        node["sequence"]  = to_std_string(spdlog::level::to_string_view(rhs.sequence));
        node["workflow"]  = to_std_string(spdlog::level::to_string_view(rhs.workflow));
        node["http"]      = to_std_string(spdlog::level::to_string_view(rhs.http));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.chunkwise = spdlog::level::from_str(node["chunkwise"].as<std::string>("info"));
        rhs.planner   = spdlog::level::from_str(node["planner"].as<std::string>("warning"));
        rhs.engine    = spdlog::level::from_str(node["engine"].as<std::string>("warning"));
        rhs.sequence  = spdlog::level::from_str(node["sequence"].as<std::string>("info"));
        rhs.workflow  = spdlog::level::from_str(node["workflow"].as<std::string>("info"));
        rhs.http      = spdlog::level::from_str(node["http"].as<std::string>("warning"));
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
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["log_to_file"] = rhs.log_to_file;
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        rhs.log_to_file = node["log_to_file"].as<bool>(true);
        if (node["log_levels"]) rhs.levels = node["log_levels"].as<LogLevelsConfig>();
        return true;
    }
};

}
