#include "ledger/sqlite/SqliteLedger.hpp"
#include "ledger/sqlite/Database.hpp"
#include "ledger/sqlite/schema.hpp"
#include "log/Registry.hpp"

#include <mutex>

using namespace tally::ledger::sqlite;

SqliteLedger::SqliteLedger(std::shared_ptr<Database> db, std::string ownerId)
    : db_(std::move(db)), ownerId_(std::move(ownerId)),
      categories_(db_, ownerId_), transactions_(db_, ownerId_), budgets_(db_, ownerId_),
      recurring_(db_, ownerId_), settings_(db_, ownerId_), savingsGoals_(db_, ownerId_),
      savingsGoalTransactions_(db_, ownerId_) {
    if (!db_) throw std::invalid_argument("SqliteLedger requires an open database");
}

std::shared_ptr<Database> SqliteLedger::open(const std::string& path) {
    auto db = std::make_shared<Database>(path);
    initSchema(*db);
    return db;
}

void SqliteLedger::runInTransaction(const std::function<void()>& fn) {
    std::lock_guard lock(db_->mutex());

    // SAVEPOINT opens a transaction when none is active, so one code path
    // covers both the outermost scope and nested phases.
    const auto name = "tally_sp_" + std::to_string(depth_);
    db_->exec("SAVEPOINT " + name);
    ++depth_;

    try {
        fn();
    } catch (const std::exception& e) {
        --depth_;
        log::Registry::ledger()->warn("[SqliteLedger] Rolling back {}: {}", name, e.what());
        db_->exec("ROLLBACK TO " + name);
        db_->exec("RELEASE " + name);
        throw;
    } catch (...) {
        --depth_;
        db_->exec("ROLLBACK TO " + name);
        db_->exec("RELEASE " + name);
        throw;
    }

    --depth_;
    db_->exec("RELEASE " + name);
}
