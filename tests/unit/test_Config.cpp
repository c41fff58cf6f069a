#include <gtest/gtest.h>
#include "config/Config.hpp"

#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace tally::config;

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path path = std::filesystem::temp_directory_path()
                                 / ("tally_config_test_" + std::to_string(::getpid()) + ".yaml");

    void write(const std::string& yaml) const {
        std::ofstream out(path);
        out << yaml;
    }

    void TearDown() override { std::filesystem::remove(path); }
};

TEST_F(ConfigTest, SectionsOverrideDefaults) {
    write(R"(
server:
  host: 127.0.0.1
  port: 8088
  threads: 2
  max_body_mb: 4
database:
  name: ledger
  pool_size: 8
auth:
  jwt_secret: hunter2
client:
  server_url: https://sync.example.org
  access_token: abc
  sync_interval_seconds: 60
sync:
  fallback_category_name: Misc
  seed_defaults: false
logging:
  log_dir: /tmp/tally-logs
  log_levels:
    console_log_level: debug
    subsystem_levels:
      sync: trace
)");

    const auto cfg = loadConfig(path.string());
    EXPECT_EQ(cfg.server.host, "127.0.0.1");
    EXPECT_EQ(cfg.server.port, 8088);
    EXPECT_EQ(cfg.server.threads, 2u);
    EXPECT_EQ(cfg.server.max_body_bytes, 4u * 1024 * 1024);
    EXPECT_EQ(cfg.database.name, "ledger");
    EXPECT_EQ(cfg.database.user, "tally");
    EXPECT_EQ(cfg.database.pool_size, 8);
    EXPECT_EQ(cfg.auth.jwt_secret, "hunter2");
    EXPECT_EQ(cfg.auth.issuer, "tally");
    EXPECT_EQ(cfg.client.server_url, "https://sync.example.org");
    EXPECT_EQ(cfg.client.sync_interval, std::chrono::seconds(60));
    EXPECT_EQ(cfg.client.request_timeout, std::chrono::seconds(30));
    EXPECT_EQ(cfg.sync.fallback_category_name, "Misc");
    EXPECT_EQ(cfg.sync.fallback_savings_goal_name, "Unassigned Savings Goal");
    EXPECT_FALSE(cfg.sync.seed_defaults);
    EXPECT_EQ(cfg.logging.log_dir, "/tmp/tally-logs");
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.sync, spdlog::level::trace);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.db, spdlog::level::warn);
}

TEST_F(ConfigTest, EmptyFileMeansDefaults) {
    write("{}\n");
    const auto cfg = loadConfig(path.string());
    EXPECT_EQ(cfg.server.port, 36480);
    EXPECT_EQ(cfg.client.database_path, "tally.db");
    EXPECT_EQ(cfg.sync.fallback_category_name, "Uncategorized");
    EXPECT_TRUE(cfg.sync.seed_defaults);
}

TEST_F(ConfigTest, MissingFileThrows) {
    EXPECT_THROW(loadConfig((path.string() + ".missing")), std::exception);
}
