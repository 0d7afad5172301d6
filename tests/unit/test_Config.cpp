#include <gtest/gtest.h>
#include "config/Config.hpp"
#include "config/util.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using namespace dt::config;

class ConfigTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "drivetree_config_test";
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    fs::path writeYaml(const std::string& body) const {
        const auto path = test_dir / "config.yaml";
        std::ofstream out(path);
        out << body;
        return path;
    }
};

TEST_F(ConfigTest, ParseSizeUnits) {
    EXPECT_EQ(parseSizeToBytes("512"), 512u);
    EXPECT_EQ(parseSizeToBytes("4K"), 4096u);
    EXPECT_EQ(parseSizeToBytes("4kb"), 4096u);
    EXPECT_EQ(parseSizeToBytes("8MB"), 8u * 1024 * 1024);
    EXPECT_EQ(parseSizeToBytes("1G"), 1024ull * 1024 * 1024);
    EXPECT_THROW((void)parseSizeToBytes(""), std::invalid_argument);
}

TEST_F(ConfigTest, SizeStringRoundTrips) {
    EXPECT_EQ(bytesToSizeStr(8u * 1024 * 1024), "8MB");
    EXPECT_EQ(bytesToSizeStr(256u * 1024), "256KB");
    EXPECT_EQ(bytesToSizeStr(1000), "1000");
}

TEST_F(ConfigTest, ChunkSizeSnapsToGranularity) {
    EXPECT_EQ(normalizeChunkSize(0), RESUMABLE_CHUNK_GRANULARITY);
    EXPECT_EQ(normalizeChunkSize(1000), RESUMABLE_CHUNK_GRANULARITY);
    EXPECT_EQ(normalizeChunkSize(RESUMABLE_CHUNK_GRANULARITY * 3 + 17), RESUMABLE_CHUNK_GRANULARITY * 3);
    EXPECT_EQ(normalizeChunkSize(DEFAULT_UPLOAD_CHUNK_SIZE), DEFAULT_UPLOAD_CHUNK_SIZE);
}

TEST_F(ConfigTest, LoadsYamlSections) {
    const auto path = writeYaml(R"(
store:
  endpoint: http://localhost:9000
  access_token_env: MY_TOKEN
  upload_chunk_size: 1MB
  page_size: 50
driver:
  root_directory: Backups/laptop
io:
  pipe_buffer_size: 64KB
logging:
  log_dir: /tmp/drivetree-logs
  levels:
    console_log_level: debug
    subsystem_levels:
      store: trace
)");

    const auto cfg = loadConfig(path);
    EXPECT_EQ(cfg.store.endpoint, "http://localhost:9000");
    EXPECT_EQ(cfg.store.access_token_env, "MY_TOKEN");
    EXPECT_EQ(cfg.store.upload_chunk_size, 1024u * 1024);
    EXPECT_EQ(cfg.store.page_size, 50u);
    EXPECT_EQ(cfg.store.timeout_seconds, 300u);
    EXPECT_EQ(cfg.driver.root_directory, "Backups/laptop");
    EXPECT_EQ(cfg.io.pipe_buffer_size, 64u * 1024);
    EXPECT_EQ(cfg.logging.log_dir, "/tmp/drivetree-logs");
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.store, spdlog::level::trace);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.drive, spdlog::level::warn);
}

TEST_F(ConfigTest, MissingSectionsKeepDefaults) {
    const auto cfg = loadConfig(writeYaml("driver:\n  root_directory: X\n"));
    EXPECT_EQ(cfg.driver.root_directory, "X");
    EXPECT_EQ(cfg.store.endpoint, "https://www.googleapis.com");
    EXPECT_EQ(cfg.io.pipe_buffer_size, DEFAULT_PIPE_BUFFER_SIZE);
}

TEST_F(ConfigTest, OddChunkSizeIsNormalized) {
    const auto cfg = loadConfig(writeYaml("store:\n  upload_chunk_size: 300KB\n"));
    EXPECT_EQ(cfg.store.upload_chunk_size, RESUMABLE_CHUNK_GRANULARITY);
}

TEST_F(ConfigTest, InvalidSectionThrows) {
    EXPECT_THROW(loadConfig(writeYaml("store: 12\n")), std::runtime_error);
    EXPECT_THROW(loadConfig(writeYaml("io:\n  pipe_buffer_size: 0\n")), std::runtime_error);
}

TEST_F(ConfigTest, MalformedYamlThrows) {
    EXPECT_THROW(loadConfig(writeYaml("store: [unclosed\n")), std::runtime_error);
}

TEST_F(ConfigTest, JsonRoundTrip) {
    Config cfg;
    cfg.driver.root_directory = "Photos";
    cfg.store.page_size = 10;
    cfg.logging.levels.subsystem_levels.io = spdlog::level::debug;

    const nlohmann::json j = cfg;
    EXPECT_EQ(j.at("driver").at("root_directory"), "Photos");

    const auto back = j.get<Config>();
    EXPECT_EQ(back.driver.root_directory, "Photos");
    EXPECT_EQ(back.store.page_size, 10u);
    EXPECT_EQ(back.logging.levels.subsystem_levels.io, spdlog::level::debug);
}
