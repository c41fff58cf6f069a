#pragma once

#include "ledger/ChangeLedger.hpp"
#include "ledger/sqlite/SqliteTable.hpp"

#include <memory>
#include <string>

namespace tally::ledger::sqlite {

class Database;

// ChangeLedger over SQLite. A device store uses one ledger with the empty owner;
// a shared SQLite store builds one ledger per owner per request.
class SqliteLedger final : public ChangeLedger {
public:
    explicit SqliteLedger(std::shared_ptr<Database> db, std::string ownerId = {});

    // Opens (or creates) the database file and ensures the schema exists.
    static std::shared_ptr<Database> open(const std::string& path);

    Table<types::Category>& categories() override { return categories_; }
    Table<types::Transaction>& transactions() override { return transactions_; }
    Table<types::Budget>& budgets() override { return budgets_; }
    Table<types::RecurringTransaction>& recurringTransactions() override { return recurring_; }
    Table<types::Settings>& settings() override { return settings_; }
    Table<types::SavingsGoal>& savingsGoals() override { return savingsGoals_; }
    Table<types::SavingsGoalTransaction>& savingsGoalTransactions() override { return savingsGoalTransactions_; }

    void runInTransaction(const std::function<void()>& fn) override;

    [[nodiscard]] const std::shared_ptr<Database>& database() const { return db_; }
    [[nodiscard]] const std::string& ownerId() const { return ownerId_; }

private:
    std::shared_ptr<Database> db_;
    std::string ownerId_;
    unsigned int depth_ = 0;

    SqliteTable<types::Category> categories_;
    SqliteTable<types::Transaction> transactions_;
    SqliteTable<types::Budget> budgets_;
    SqliteTable<types::RecurringTransaction> recurring_;
    SqliteTable<types::Settings> settings_;
    SqliteTable<types::SavingsGoal> savingsGoals_;
    SqliteTable<types::SavingsGoalTransaction> savingsGoalTransactions_;
};

}
