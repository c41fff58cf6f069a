#include "db/DBConnection.hpp"
#include "db/ledgerSql.hpp"

#include <pqxx/pqxx>

using namespace tally::types;

void tally::db::DBConnection::initPreparedLedger() const {
    sql::prepareTable<Category>(*conn_);
    sql::prepareTable<Transaction>(*conn_);
    sql::prepareTable<Budget>(*conn_);
    sql::prepareTable<RecurringTransaction>(*conn_);
    sql::prepareTable<Settings>(*conn_);
    sql::prepareTable<SavingsGoal>(*conn_);
    sql::prepareTable<SavingsGoalTransaction>(*conn_);
}
