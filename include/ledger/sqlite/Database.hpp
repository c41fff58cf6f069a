#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

struct sqlite3;
struct sqlite3_stmt;

namespace tally::ledger::sqlite {

class SqliteError : public std::runtime_error {
public:
    SqliteError(const std::string& msg, const int code) : std::runtime_error(msg), code_(code) {}

    [[nodiscard]] int code() const noexcept { return code_; }

private:
    int code_;
};

// Prepared statement; finalized on destruction. Bind indexes are 1-based,
// column indexes 0-based, as in the C API.
class Statement {
public:
    Statement(sqlite3* db, std::string_view sql);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    Statement(Statement&& o) noexcept;
    Statement& operator=(Statement&& o) noexcept;

    void bind(int idx, std::int64_t v);
    void bind(int idx, const std::string& v);
    void bindNull(int idx);

    // true while a row is available, false when done
    bool step();

    // Steps once, expecting no result row.
    void run();

    void reset();

    [[nodiscard]] std::int64_t int64At(int col) const;
    [[nodiscard]] std::string textAt(int col) const;
    [[nodiscard]] bool isNull(int col) const;

private:
    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_ = nullptr;
};

// Owns one connection. A store instance is not meant to be shared across
// threads without holding mutex().
class Database {
public:
    // ":memory:" opens a private in-memory database.
    explicit Database(const std::string& path);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    void exec(const std::string& sql);

    [[nodiscard]] Statement prepare(std::string_view sql);

    [[nodiscard]] std::int64_t lastInsertRowId() const;
    [[nodiscard]] int changes() const;

    [[nodiscard]] const std::string& path() const { return path_; }

    std::recursive_mutex& mutex() { return mtx_; }

private:
    std::string path_;
    sqlite3* db_ = nullptr;
    std::recursive_mutex mtx_;
};

}
