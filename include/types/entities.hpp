#pragma once

#include "types/Category.hpp"
#include "types/Transaction.hpp"
#include "types/Budget.hpp"
#include "types/RecurringTransaction.hpp"
#include "types/Settings.hpp"
#include "types/SavingsGoal.hpp"
#include "types/SavingsGoalTransaction.hpp"

#include <string_view>

namespace tally::types {

// Name used in log lines and error messages.
template <typename T> constexpr std::string_view entityName();
template <> constexpr std::string_view entityName<Category>() { return "Category"; }
template <> constexpr std::string_view entityName<Transaction>() { return "Transaction"; }
template <> constexpr std::string_view entityName<Budget>() { return "Budget"; }
template <> constexpr std::string_view entityName<RecurringTransaction>() { return "RecurringTransaction"; }
template <> constexpr std::string_view entityName<Settings>() { return "Settings"; }
template <> constexpr std::string_view entityName<SavingsGoal>() { return "SavingsGoal"; }
template <> constexpr std::string_view entityName<SavingsGoalTransaction>() { return "SavingsGoalTransaction"; }

}
