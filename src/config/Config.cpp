#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <cstdlib>
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace cw::config {

static std::string levelName(const spdlog::level::level_enum lvl) {
    const auto sv = spdlog::level::to_string_view(lvl);
    return {sv.data(), sv.size()};
}

Config loadConfig(const std::string& path) {
    Config cfg;
    YAML::Node root = YAML::LoadFile(path);

    if (auto node = root["upload"]) YAML::convert<UploadConfig>::decode(node, cfg.upload);
    if (auto node = root["retry"]) YAML::convert<RetryConfig>::decode(node, cfg.retry);
    if (auto node = root["api"]) YAML::convert<ApiConfig>::decode(node, cfg.api);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    applyEnvironmentOverrides(cfg);
    return cfg;
}

void applyEnvironmentOverrides(Config& cfg) {
    if (const char* token = std::getenv("CHUNKWISE_API_TOKEN"); token && *token) cfg.api.auth_token = token;
    if (const char* url = std::getenv("CHUNKWISE_API_URL"); url && *url) cfg.api.base_url = url;
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"upload", c.upload},
        {"retry", c.retry},
        {"api", c.api},
        {"logging", c.logging}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("upload")) j.at("upload").get_to(c.upload);
    if (j.contains("retry")) j.at("retry").get_to(c.retry);
    if (j.contains("api")) j.at("api").get_to(c.api);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
}

void to_json(nlohmann::json& j, const UploadConfig& c) {
    j = {
        {"part_size", c.part_size},
        {"large_part_size", c.large_part_size},
        {"large_file_threshold", c.large_file_threshold},
        {"max_sequence_size", c.max_sequence_size},
        {"max_files_per_request", c.max_files_per_request},
        {"max_parts_per_request", c.max_parts_per_request},
        {"max_parts_per_file", c.max_parts_per_file},
        {"max_concurrent_uploads", c.max_concurrent_uploads},
        {"max_preview_file_size", c.max_preview_file_size},
        {"preview_extensions", c.preview_extensions}
    };
}

void from_json(const nlohmann::json& j, UploadConfig& c) {
    c.part_size = j.value("part_size", DEFAULT_PART_SIZE);
    c.large_part_size = j.value("large_part_size", DEFAULT_LARGE_PART_SIZE);
    c.large_file_threshold = j.value("large_file_threshold", DEFAULT_LARGE_FILE_THRESHOLD);
    c.max_sequence_size = j.value("max_sequence_size", DEFAULT_MAX_SEQUENCE_SIZE);
    c.max_files_per_request = j.value("max_files_per_request", 50u);
    c.max_parts_per_request = j.value("max_parts_per_request", 1000u);
    c.max_parts_per_file = j.value("max_parts_per_file", 10000u);
    c.max_concurrent_uploads = j.value("max_concurrent_uploads", 6u);
    c.max_preview_file_size = j.value("max_preview_file_size", DEFAULT_MAX_PREVIEW_FILE_SIZE);
    if (j.contains("preview_extensions")) j.at("preview_extensions").get_to(c.preview_extensions);
}

void to_json(nlohmann::json& j, const RetryConfig& c) {
    j = {
        {"request_attempts", c.request_attempts},
        {"part_attempts", c.part_attempts},
        {"base_delay_ms", c.base_delay.count()},
        {"rate_limit_delay_seconds", c.rate_limit_delay.count()}
    };
}

void from_json(const nlohmann::json& j, RetryConfig& c) {
    c.request_attempts = j.value("request_attempts", 5u);
    c.part_attempts = j.value("part_attempts", 3u);
    c.base_delay = std::chrono::milliseconds(j.value("base_delay_ms", 1000L));
    c.rate_limit_delay = std::chrono::seconds(j.value("rate_limit_delay_seconds", 60L));
}

void to_json(nlohmann::json& j, const ApiConfig& c) {
    j = {
        {"base_url", c.base_url},
        {"auth_token_set", !c.auth_token.empty()},
        {"request_timeout_seconds", c.request_timeout.count()},
        {"connect_timeout_seconds", c.connect_timeout.count()},
        {"verify_tls", c.verify_tls}
    };
}

void from_json(const nlohmann::json& j, ApiConfig& c) {
    c.base_url = j.value("base_url", "http://localhost:8080");
    c.auth_token = j.value("auth_token", "");
    c.request_timeout = std::chrono::seconds(j.value("request_timeout_seconds", 300L));
    c.connect_timeout = std::chrono::seconds(j.value("connect_timeout_seconds", 30L));
    c.verify_tls = j.value("verify_tls", true);
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    j = {
        {"chunkwise", levelName(c.chunkwise)},
        {"planner", levelName(c.planner)},
        {"engine", levelName(c.engine)},
        {"sequence", levelName(c.sequence)},
        {"workflow", levelName(c.workflow)},
        {"http", levelName(c.http)}
    };
}

void from_json(const nlohmann::json& j, SubsystemLogLevelsConfig& c) {
    c.chunkwise = spdlog::level::from_str(j.value("chunkwise", "info"));
    c.planner = spdlog::level::from_str(j.value("planner", "warning"));
    c.engine = spdlog::level::from_str(j.value("engine", "warning"));
    c.sequence = spdlog::level::from_str(j.value("sequence", "info"));
    c.workflow = spdlog::level::from_str(j.value("workflow", "info"));
    c.http = spdlog::level::from_str(j.value("http", "warning"));
}

void to_json(nlohmann::json& j, const LogLevelsConfig& c) {
    j = {
        {"console_log_level", levelName(c.console_log_level)},
        {"file_log_level", levelName(c.file_log_level)},
        {"subsystem_levels", c.subsystem_levels}
    };
}

void from_json(const nlohmann::json& j, LogLevelsConfig& c) {
    c.console_log_level = spdlog::level::from_str(j.value("console_log_level", "info"));
    c.file_log_level = spdlog::level::from_str(j.value("file_log_level", "debug"));
    if (j.contains("subsystem_levels")) j.at("subsystem_levels").get_to(c.subsystem_levels);
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"log_dir", c.log_dir.string()},
        {"log_to_file", c.log_to_file},
        {"log_levels", c.levels}
    };
}

void from_json(const nlohmann::json& j, LoggingConfig& c) {
    c.log_dir = j.value("log_dir", "");
    c.log_to_file = j.value("log_to_file", true);
    if (j.contains("log_levels")) j.at("log_levels").get_to(c.levels);
}

}
