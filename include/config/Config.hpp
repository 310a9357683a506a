#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace cw::config {

constexpr static uintmax_t MiB = 1024ULL * 1024ULL;
constexpr static uintmax_t GiB = 1024ULL * MiB;

constexpr static uintmax_t DEFAULT_PART_SIZE = 150 * MiB;
constexpr static uintmax_t DEFAULT_LARGE_PART_SIZE = 1 * GiB;
constexpr static uintmax_t DEFAULT_LARGE_FILE_THRESHOLD = 15 * GiB;   // files at/above this use the large part size
constexpr static uintmax_t DEFAULT_MAX_SEQUENCE_SIZE = 3 * GiB;
constexpr static uintmax_t DEFAULT_MAX_PREVIEW_FILE_SIZE = 5 * MiB;

struct UploadConfig {
    uintmax_t part_size = DEFAULT_PART_SIZE;
    uintmax_t large_part_size = DEFAULT_LARGE_PART_SIZE;
    uintmax_t large_file_threshold = DEFAULT_LARGE_FILE_THRESHOLD;
    uintmax_t max_sequence_size = DEFAULT_MAX_SEQUENCE_SIZE;
    unsigned int max_files_per_request = 50;
    unsigned int max_parts_per_request = 1000;
    unsigned int max_parts_per_file = 10000;
    unsigned int max_concurrent_uploads = 6;
    uintmax_t max_preview_file_size = DEFAULT_MAX_PREVIEW_FILE_SIZE;
    std::vector<std::string> preview_extensions = {".png", ".jpg", ".jpeg", ".svg", ".gif"};
};

struct RetryConfig {
    unsigned int request_attempts = 5;
    unsigned int part_attempts = 3;
    std::chrono::milliseconds base_delay{1000};
    std::chrono::seconds rate_limit_delay{60};
};

struct ApiConfig {
    std::string base_url = "http://localhost:8080";
    std::string auth_token;                          // CHUNKWISE_API_TOKEN overrides
    std::chrono::seconds request_timeout{300};
    std::chrono::seconds connect_timeout{30};
    bool verify_tls = true;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum chunkwise = spdlog::level::info;   // CLI and startup
    spdlog::level::level_enum planner   = spdlog::level::warn;   // Constraint violations while planning
    spdlog::level::level_enum engine    = spdlog::level::warn;   // Part retries and failures
    spdlog::level::level_enum sequence  = spdlog::level::info;   // Init/complete per sequence
    spdlog::level::level_enum workflow  = spdlog::level::info;   // Stage transitions
    spdlog::level::level_enum http      = spdlog::level::warn;   // Non-2xx and transport errors
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir;                   // empty means paths::getLogPath()
    bool log_to_file = true;
    LogLevelsConfig levels;
};

struct Config {
    UploadConfig upload;
    RetryConfig retry;
    ApiConfig api;
    LoggingConfig logging;
};

Config loadConfig(const std::string& path);
void applyEnvironmentOverrides(Config& cfg);

void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);
void to_json(nlohmann::json& j, const UploadConfig& c);
void from_json(const nlohmann::json& j, UploadConfig& c);
void to_json(nlohmann::json& j, const RetryConfig& c);
void from_json(const nlohmann::json& j, RetryConfig& c);
void to_json(nlohmann::json& j, const ApiConfig& c);
void from_json(const nlohmann::json& j, ApiConfig& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);
void from_json(const nlohmann::json& j, SubsystemLogLevelsConfig& c);
void to_json(nlohmann::json& j, const LogLevelsConfig& c);
void from_json(const nlohmann::json& j, LogLevelsConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void from_json(const nlohmann::json& j, LoggingConfig& c);

}
