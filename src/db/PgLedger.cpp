#include "db/PgLedger.hpp"
#include "log/Registry.hpp"

using namespace tally::db;

PgLedger::PgLedger(pqxx::dbtransaction& txn, std::string ownerId)
    : scope_{&txn}, ownerId_(std::move(ownerId)),
      categories_(scope_, ownerId_), transactions_(scope_, ownerId_), budgets_(scope_, ownerId_),
      recurring_(scope_, ownerId_), settings_(scope_, ownerId_), savingsGoals_(scope_, ownerId_),
      savingsGoalTransactions_(scope_, ownerId_) {}

void PgLedger::runInTransaction(const std::function<void()>& fn) {
    auto* parent = scope_.current;
    pqxx::subtransaction sub(*parent, "tally_sp_" + std::to_string(depth_));
    scope_.current = &sub;
    ++depth_;

    try {
        fn();
    } catch (const std::exception& e) {
        --depth_;
        scope_.current = parent;
        log::Registry::db()->warn("[PgLedger] Rolling back subtransaction for owner {}: {}", ownerId_, e.what());
        sub.abort();
        throw;
    } catch (...) {
        --depth_;
        scope_.current = parent;
        sub.abort();
        throw;
    }

    --depth_;
    scope_.current = parent;
    sub.commit();
}
