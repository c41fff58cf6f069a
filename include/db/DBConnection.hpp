#pragma once

#include "config/Config.hpp"

#include <memory>
#include <string>
#include <pqxx/connection>

namespace tally::db {

class DBConnection {
  public:
    explicit DBConnection(const config::DatabaseConfig& cfg);
    ~DBConnection();

    [[nodiscard]] pqxx::connection& get() const;

    void initPrepared() const;

    // libpq key/value connection string; values are quoted and escaped.
    static std::string connectionString(const config::DatabaseConfig& cfg);

  private:
    std::unique_ptr<pqxx::connection> conn_;

    void initPreparedLedger() const;
    void initPreparedLocks() const;
};

}
