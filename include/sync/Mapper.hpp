#pragma once

#include "ledger/ChangeLedger.hpp"
#include "sync/model/Dto.hpp"
#include "types/entities.hpp"

namespace tally::sync::mapper {

using types::LocalId;

// local -> wire. Parent references are looked up in an unfiltered
// local->global table; a missing or zero local id becomes the empty global id.
model::CategoryDto toWire(const types::Category& c);
model::TransactionDto toWire(const types::Transaction& t, const ledger::LocalToGlobal& categories);
model::BudgetDto toWire(const types::Budget& b, const ledger::LocalToGlobal& categories);
model::RecurringTransactionDto toWire(const types::RecurringTransaction& r, const ledger::LocalToGlobal& categories);
model::SettingsDto toWire(const types::Settings& s);
model::SavingsGoalDto toWire(const types::SavingsGoal& g);
model::SavingsGoalTransactionDto toWire(const types::SavingsGoalTransaction& t, const ledger::LocalToGlobal& goals);

// wire -> local. The result has no local id; parents arrive already resolved.
types::Category fromWire(const model::CategoryDto& d);
types::Transaction fromWire(const model::TransactionDto& d, LocalId categoryId);
types::Budget fromWire(const model::BudgetDto& d, LocalId categoryId);
types::RecurringTransaction fromWire(const model::RecurringTransactionDto& d, LocalId categoryId);
types::Settings fromWire(const model::SettingsDto& d);
types::SavingsGoal fromWire(const model::SavingsGoalDto& d);
types::SavingsGoalTransaction fromWire(const model::SavingsGoalTransactionDto& d, LocalId savingsGoalId);

}
