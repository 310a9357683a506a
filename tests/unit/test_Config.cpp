#include <gtest/gtest.h>
#include "config/Config.hpp"
#include "config/config_yaml.hpp"
#include "util/bytes.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace cw::config;
using namespace cw::util;
using namespace std::chrono_literals;

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    fs::path path;

    void SetUp() override {
        ::unsetenv("CHUNKWISE_API_TOKEN");
        ::unsetenv("CHUNKWISE_API_URL");
        path = fs::temp_directory_path() / ("chunkwise_config_" + std::to_string(::getpid()) + ".yaml");
    }

    void TearDown() override {
        ::unsetenv("CHUNKWISE_API_TOKEN");
        ::unsetenv("CHUNKWISE_API_URL");
        fs::remove(path);
    }

    void write(const std::string& yaml) const {
        std::ofstream out(path);
        out << yaml;
    }
};

TEST_F(ConfigTest, DefaultsMatchBackendLimits) {
    const Config cfg;
    EXPECT_EQ(cfg.upload.part_size, 150_MiB);
    EXPECT_EQ(cfg.upload.large_part_size, 1_GiB);
    EXPECT_EQ(cfg.upload.large_file_threshold, 15_GiB);
    EXPECT_EQ(cfg.upload.max_sequence_size, 3_GiB);
    EXPECT_EQ(cfg.upload.max_files_per_request, 50u);
    EXPECT_EQ(cfg.upload.max_parts_per_request, 1000u);
    EXPECT_EQ(cfg.upload.max_parts_per_file, 10000u);
    EXPECT_EQ(cfg.upload.max_concurrent_uploads, 6u);
    EXPECT_EQ(cfg.upload.max_preview_file_size, 5_MiB);
    EXPECT_EQ(cfg.retry.request_attempts, 5u);
    EXPECT_EQ(cfg.retry.part_attempts, 3u);
    EXPECT_EQ(cfg.retry.base_delay, 1000ms);
    EXPECT_EQ(cfg.retry.rate_limit_delay, 60s);
}

TEST_F(ConfigTest, LoadsYamlSections) {
    write(R"(
upload:
  part_size_mb: 64
  max_concurrent_uploads: 2
  preview_extensions: [".png", ".webp"]
retry:
  request_attempts: 7
  base_delay_ms: 250
api:
  base_url: https://vams.example.com/api
  auth_token: secret
  verify_tls: false
logging:
  log_to_file: false
  log_levels:
    console_log_level: warning
    subsystem_levels:
      engine: debug
)");

    const auto cfg = loadConfig(path.string());
    EXPECT_EQ(cfg.upload.part_size, 64_MiB);
    EXPECT_EQ(cfg.upload.max_concurrent_uploads, 2u);
    EXPECT_EQ(cfg.upload.max_files_per_request, 50u);
    EXPECT_EQ(cfg.upload.preview_extensions, (std::vector<std::string>{".png", ".webp"}));
    EXPECT_EQ(cfg.retry.request_attempts, 7u);
    EXPECT_EQ(cfg.retry.part_attempts, 3u);
    EXPECT_EQ(cfg.retry.base_delay, 250ms);
    EXPECT_EQ(cfg.api.base_url, "https://vams.example.com/api");
    EXPECT_EQ(cfg.api.auth_token, "secret");
    EXPECT_FALSE(cfg.api.verify_tls);
    EXPECT_FALSE(cfg.logging.log_to_file);
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::warn);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.engine, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.workflow, spdlog::level::info);
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    write("api:\n  base_url: http://file\n  auth_token: from-file\n");
    ::setenv("CHUNKWISE_API_TOKEN", "from-env", 1);
    ::setenv("CHUNKWISE_API_URL", "http://env", 1);

    const auto cfg = loadConfig(path.string());
    EXPECT_EQ(cfg.api.auth_token, "from-env");
    EXPECT_EQ(cfg.api.base_url, "http://env");
}

TEST_F(ConfigTest, MissingFileThrows) {
    EXPECT_THROW(loadConfig((path.parent_path() / "does-not-exist.yaml").string()), YAML::BadFile);
}

TEST_F(ConfigTest, YamlEncodingNeverWritesToken) {
    ApiConfig api;
    api.auth_token = "secret";
    const YAML::Node node = YAML::convert<ApiConfig>::encode(api);
    EXPECT_FALSE(node["auth_token"]);
    EXPECT_EQ(node["base_url"].as<std::string>(), api.base_url);
}

TEST_F(ConfigTest, JsonHidesTokenAndRoundTripsLimits) {
    Config cfg;
    cfg.api.auth_token = "secret";
    cfg.upload.max_concurrent_uploads = 9;

    const nlohmann::json j = cfg;
    EXPECT_TRUE(j.at("api").at("auth_token_set").get<bool>());
    EXPECT_FALSE(j.at("api").contains("auth_token"));
    EXPECT_EQ(j.at("retry").at("base_delay_ms").get<long>(), 1000);

    const auto back = j.get<Config>();
    EXPECT_EQ(back.upload.max_concurrent_uploads, 9u);
    EXPECT_EQ(back.upload.part_size, cfg.upload.part_size);
    EXPECT_TRUE(back.api.auth_token.empty());
    EXPECT_EQ(back.logging.levels.subsystem_levels.http, spdlog::level::warn);
}
