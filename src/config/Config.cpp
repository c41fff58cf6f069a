#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <yaml-cpp/yaml.h>

namespace tally::config {

Config loadConfig(const std::string& path) {
    Config cfg;
    YAML::Node root = YAML::LoadFile(path);

    if (auto node = root["server"]) YAML::convert<ServerConfig>::decode(node, cfg.server);
    if (auto node = root["database"]) YAML::convert<DatabaseConfig>::decode(node, cfg.database);
    if (auto node = root["auth"]) YAML::convert<AuthConfig>::decode(node, cfg.auth);
    if (auto node = root["client"]) YAML::convert<ClientConfig>::decode(node, cfg.client);
    if (auto node = root["sync"]) YAML::convert<SyncConfig>::decode(node, cfg.sync);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    return cfg;
}

}
