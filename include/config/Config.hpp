#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

namespace tally::config {

constexpr static uintmax_t MAX_SYNC_BODY_BYTES = 16 * 1024 * 1024; // 16MB

struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 36480;
    unsigned int threads = 4;
    uintmax_t max_body_bytes = MAX_SYNC_BODY_BYTES;
};

struct DatabaseConfig {
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string name = "tally";
    std::string user = "tally";
    std::string password;
    int pool_size = 4;
};

struct AuthConfig {
    std::string jwt_secret;
    std::string issuer = "tally";
    unsigned int token_expiry_minutes = 60;
};

// Device side: where the local store lives and how it reaches the server.
struct ClientConfig {
    std::string server_url = "http://127.0.0.1:36480";
    std::filesystem::path database_path = "tally.db";
    std::string access_token;
    std::chrono::seconds sync_interval{300};
    std::chrono::seconds request_timeout{30};
};

struct SyncConfig {
    std::string fallback_category_name = "Uncategorized";
    std::string fallback_savings_goal_name = "Unassigned Savings Goal";
    bool seed_defaults = true;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum tally  = spdlog::level::info;   // Startup/shutdown
    spdlog::level::level_enum sync   = spdlog::level::info;   // Round trips, conflicts, duplicate collapses
    spdlog::level::level_enum ledger = spdlog::level::warn;   // Embedded store failures
    spdlog::level::level_enum db     = spdlog::level::warn;   // Failed transactions, unreachable server
    spdlog::level::level_enum http   = spdlog::level::info;   // Requests, 4xx/5xx, transport failures
    spdlog::level::level_enum auth   = spdlog::level::warn;   // Rejected tokens
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::info;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir;
    LogLevelsConfig levels;
};

struct Config {
    ServerConfig server;
    DatabaseConfig database;
    AuthConfig auth;
    ClientConfig client;
    SyncConfig sync;
    LoggingConfig logging;
};

Config loadConfig(const std::string& path);

}
