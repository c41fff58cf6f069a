#include "db/DBConnection.hpp"
#include "log/Registry.hpp"

#include <pqxx/pqxx>

namespace tally::db {

namespace {

std::string quoted(const std::string& value) {
    std::string out = "'";
    for (const char c : value) {
        if (c == '\'' || c == '\\') out += '\\';
        out += c;
    }
    return out + "'";
}

}

std::string DBConnection::connectionString(const config::DatabaseConfig& cfg) {
    return "host=" + quoted(cfg.host) +
           " port=" + std::to_string(cfg.port) +
           " user=" + quoted(cfg.user) +
           " password=" + quoted(cfg.password) +
           " dbname=" + quoted(cfg.name) +
           " connect_timeout=5";
}

DBConnection::DBConnection(const config::DatabaseConfig& cfg)
    : conn_(std::make_unique<pqxx::connection>(connectionString(cfg))) {
    log::Registry::db()->debug("[DBConnection] Connected to {}:{}/{}", cfg.host, cfg.port, cfg.name);
}

DBConnection::~DBConnection() { if (conn_ && conn_->is_open()) conn_->close(); }

pqxx::connection& DBConnection::get() const { return *conn_; }

void DBConnection::initPrepared() const {
    if (!conn_ || !conn_->is_open()) throw std::runtime_error("Database connection is not open");

    initPreparedLedger();
    initPreparedLocks();
}

void DBConnection::initPreparedLocks() const {
    // serializes concurrent sync requests of one owner across server processes
    conn_->prepare("lock_owner", "SELECT pg_advisory_xact_lock(hashtext($1))");
}

}
