#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace tally::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<ServerConfig> {
    static Node encode(const ServerConfig& rhs) {
        Node node;
        node["host"] = rhs.host;
        node["port"] = rhs.port;
        node["threads"] = rhs.threads;
        node["max_body_mb"] = rhs.max_body_bytes / (1024 * 1024);
        return node;
    }

    static bool decode(const Node& node, ServerConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = node["host"].as<std::string>("0.0.0.0");
        rhs.port = node["port"].as<uint16_t>(36480);
        rhs.threads = node["threads"].as<unsigned int>(4);
        rhs.max_body_bytes = node["max_body_mb"].as<uintmax_t>(16) * 1024 * 1024; // Default 16MB
        return true;
    }
};

template<>
struct convert<DatabaseConfig> {
    static Node encode(const DatabaseConfig& rhs) {
        Node node;
        node["host"] = rhs.host;
        node["port"] = rhs.port;
        node["name"] = rhs.name;
        node["user"] = rhs.user;
        node["password"] = rhs.password;
        node["pool_size"] = rhs.pool_size;
        return node;
    }

    static bool decode(const Node& node, DatabaseConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = node["host"].as<std::string>("localhost");
        rhs.port = node["port"].as<uint16_t>(5432);
        rhs.name = node["name"].as<std::string>("tally");
        rhs.user = node["user"].as<std::string>("tally");
        rhs.password = node["password"].as<std::string>("");
        rhs.pool_size = node["pool_size"].as<int>(4);
        return true;
    }
};

template<>
struct convert<AuthConfig> {
    static Node encode(const AuthConfig& rhs) {
        Node node;
        node["jwt_secret"] = rhs.jwt_secret;
        node["issuer"] = rhs.issuer;
        node["token_expiry_minutes"] = rhs.token_expiry_minutes;
        return node;
    }

    static bool decode(const Node& node, AuthConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.jwt_secret = node["jwt_secret"].as<std::string>("");
        rhs.issuer = node["issuer"].as<std::string>("tally");
        rhs.token_expiry_minutes = node["token_expiry_minutes"].as<unsigned int>(60);
        return true;
    }
};

template<>
struct convert<ClientConfig> {
    static Node encode(const ClientConfig& rhs) {
        Node node;
        node["server_url"] = rhs.server_url;
        node["database_path"] = rhs.database_path.string();
        node["access_token"] = rhs.access_token;
        node["sync_interval_seconds"] = rhs.sync_interval.count();
        node["request_timeout_seconds"] = rhs.request_timeout.count();
        return node;
    }

    static bool decode(const Node& node, ClientConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.server_url = node["server_url"].as<std::string>("http://127.0.0.1:36480");
        rhs.database_path = node["database_path"].as<std::string>("tally.db");
        rhs.access_token = node["access_token"].as<std::string>("");
        rhs.sync_interval = std::chrono::seconds(node["sync_interval_seconds"].as<unsigned int>(300));
        rhs.request_timeout = std::chrono::seconds(node["request_timeout_seconds"].as<unsigned int>(30));
        return true;
    }
};

template<>
struct convert<SyncConfig> {
    static Node encode(const SyncConfig& rhs) {
        Node node;
        node["fallback_category_name"] = rhs.fallback_category_name;
        node["fallback_savings_goal_name"] = rhs.fallback_savings_goal_name;
        node["seed_defaults"] = rhs.seed_defaults;
        return node;
    }

    static bool decode(const Node& node, SyncConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.fallback_category_name = node["fallback_category_name"].as<std::string>("Uncategorized");
        rhs.fallback_savings_goal_name = node["fallback_savings_goal_name"].as<std::string>("Unassigned Savings Goal");
        rhs.seed_defaults = node["seed_defaults"].as<bool>(true);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["tally"]  = to_std_string(spdlog::level::to_string_view(rhs.tally));
        node["sync"]   = to_std_string(spdlog::level::to_string_view(rhs.sync));
        node["ledger"] = to_std_string(spdlog::level::to_string_view(rhs.ledger));
        node["db"]     = to_std_string(spdlog::level::to_string_view(rhs.db));
        node["http"]   = to_std_string(spdlog::level::to_string_view(rhs.http));
        node["auth"]   = to_std_string(spdlog::level::to_string_view(rhs.auth));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.tally = spdlog::level::from_str(node["tally"].as<std::string>("info"));
        rhs.sync = spdlog::level::from_str(node["sync"].as<std::string>("info"));
        rhs.ledger = spdlog::level::from_str(node["ledger"].as<std::string>("warn"));
        rhs.db = spdlog::level::from_str(node["db"].as<std::string>("warn"));
        rhs.http = spdlog::level::from_str(node["http"].as<std::string>("info"));
        rhs.auth = spdlog::level::from_str(node["auth"].as<std::string>("warn"));
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
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("info"));
        if (const auto sub = node["subsystem_levels"]) rhs.subsystem_levels = sub.as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        if (const auto levels = node["log_levels"]) rhs.levels = levels.as<LogLevelsConfig>();
        return true;
    }
};

} // namespace YAML
