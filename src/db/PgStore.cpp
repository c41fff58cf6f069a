#include "db/PgStore.hpp"
#include "db/PgLedger.hpp"
#include "db/Transactions.hpp"

using namespace tally::db;

void PgStore::withOwner(const std::string& ownerId, const std::function<void(ledger::ChangeLedger&)>& fn) {
    Transactions::exec("PgStore::withOwner", [&](pqxx::work& txn) {
        txn.exec(pqxx::prepped{"lock_owner"}, pqxx::params{ownerId});
        PgLedger ledger(txn, ownerId);
        fn(ledger);
    });
}
