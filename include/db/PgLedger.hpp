#pragma once

#include "db/PgTable.hpp"
#include "ledger/ChangeLedger.hpp"

#include <string>

namespace tally::db {

// One owner's ledger inside an open PostgreSQL transaction. Nested
// runInTransaction() scopes become subtransactions (savepoints).
class PgLedger final : public ledger::ChangeLedger {
public:
    PgLedger(pqxx::dbtransaction& txn, std::string ownerId);

    ledger::Table<types::Category>& categories() override { return categories_; }
    ledger::Table<types::Transaction>& transactions() override { return transactions_; }
    ledger::Table<types::Budget>& budgets() override { return budgets_; }
    ledger::Table<types::RecurringTransaction>& recurringTransactions() override { return recurring_; }
    ledger::Table<types::Settings>& settings() override { return settings_; }
    ledger::Table<types::SavingsGoal>& savingsGoals() override { return savingsGoals_; }
    ledger::Table<types::SavingsGoalTransaction>& savingsGoalTransactions() override { return savingsGoalTransactions_; }

    void runInTransaction(const std::function<void()>& fn) override;

private:
    TxnScope scope_;
    std::string ownerId_;
    unsigned int depth_ = 0;

    PgTable<types::Category> categories_;
    PgTable<types::Transaction> transactions_;
    PgTable<types::Budget> budgets_;
    PgTable<types::RecurringTransaction> recurring_;
    PgTable<types::Settings> settings_;
    PgTable<types::SavingsGoal> savingsGoals_;
    PgTable<types::SavingsGoalTransaction> savingsGoalTransactions_;
};

}
