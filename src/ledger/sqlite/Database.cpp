#include "ledger/sqlite/Database.hpp"
#include "log/Registry.hpp"

#include <sqlite3.h>

namespace tally::ledger::sqlite {

Statement::Statement(sqlite3* db, const std::string_view sql) : db_(db) {
    const int rc = sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &stmt_, nullptr);
    if (rc != SQLITE_OK)
        throw SqliteError("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)), rc);
}

Statement::~Statement() {
    if (stmt_) sqlite3_finalize(stmt_);
}

Statement::Statement(Statement&& o) noexcept : db_(o.db_), stmt_(o.stmt_) {
    o.stmt_ = nullptr;
}

Statement& Statement::operator=(Statement&& o) noexcept {
    if (this != &o) {
        if (stmt_) sqlite3_finalize(stmt_);
        db_ = o.db_;
        stmt_ = o.stmt_;
        o.stmt_ = nullptr;
    }
    return *this;
}

void Statement::bind(const int idx, const std::int64_t v) {
    if (const int rc = sqlite3_bind_int64(stmt_, idx, v); rc != SQLITE_OK)
        throw SqliteError("Failed to bind integer: " + std::string(sqlite3_errmsg(db_)), rc);
}

void Statement::bind(const int idx, const std::string& v) {
    if (const int rc = sqlite3_bind_text(stmt_, idx, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
        rc != SQLITE_OK)
        throw SqliteError("Failed to bind text: " + std::string(sqlite3_errmsg(db_)), rc);
}

void Statement::bindNull(const int idx) {
    if (const int rc = sqlite3_bind_null(stmt_, idx); rc != SQLITE_OK)
        throw SqliteError("Failed to bind null: " + std::string(sqlite3_errmsg(db_)), rc);
}

bool Statement::step() {
    const int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw SqliteError("Step failed: " + std::string(sqlite3_errmsg(db_)), rc);
}

void Statement::run() {
    if (step()) throw SqliteError("Statement unexpectedly returned a row", SQLITE_MISUSE);
}

void Statement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

std::int64_t Statement::int64At(const int col) const { return sqlite3_column_int64(stmt_, col); }

std::string Statement::textAt(const int col) const {
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, col));
    if (!text) return {};
    return {text, static_cast<size_t>(sqlite3_column_bytes(stmt_, col))};
}

bool Statement::isNull(const int col) const { return sqlite3_column_type(stmt_, col) == SQLITE_NULL; }

Database::Database(const std::string& path) : path_(path) {
    const int rc = sqlite3_open_v2(path.c_str(), &db_,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        const std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw SqliteError("Failed to open " + path + ": " + msg, rc);
    }

    sqlite3_busy_timeout(db_, 5000);
    exec("PRAGMA foreign_keys = OFF");
    if (path != ":memory:") exec("PRAGMA journal_mode = WAL");

    log::Registry::ledger()->debug("[Database] Opened {}", path);
}

Database::~Database() {
    if (db_) sqlite3_close(db_);
}

void Database::exec(const std::string& sql) {
    char* err = nullptr;
    const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw SqliteError(msg, rc);
    }
}

Statement Database::prepare(const std::string_view sql) { return {db_, sql}; }

std::int64_t Database::lastInsertRowId() const { return sqlite3_last_insert_rowid(db_); }

int Database::changes() const { return sqlite3_changes(db_); }

}
