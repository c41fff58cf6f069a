#pragma once

#include "ledger/Table.hpp"
#include "types/entities.hpp"

#include <functional>
#include <type_traits>
#include <unordered_map>

namespace tally::ledger {

using GlobalToLocal = std::unordered_map<GlobalId, LocalId>;
using LocalToGlobal = std::unordered_map<LocalId, GlobalId>;

// The change-tracking view of one owner's data in a store.
class ChangeLedger {
public:
    virtual ~ChangeLedger() = default;

    virtual Table<types::Category>& categories() = 0;
    virtual Table<types::Transaction>& transactions() = 0;
    virtual Table<types::Budget>& budgets() = 0;
    virtual Table<types::RecurringTransaction>& recurringTransactions() = 0;
    virtual Table<types::Settings>& settings() = 0;
    virtual Table<types::SavingsGoal>& savingsGoals() = 0;
    virtual Table<types::SavingsGoalTransaction>& savingsGoalTransactions() = 0;

    // Runs fn atomically. Nested calls become savepoints of the enclosing scope.
    // Any exception thrown by fn rolls the scope back and is rethrown.
    virtual void runInTransaction(const std::function<void()>& fn) = 0;

    template <typename T> Table<T>& table();

    // Foreign-key resolution tables. Unfiltered: deleted parents still resolve.
    // With duplicate global ids the highest local id wins.
    GlobalToLocal categoryLocalIds();
    LocalToGlobal categoryGlobalIds();
    GlobalToLocal savingsGoalLocalIds();
    LocalToGlobal savingsGoalGlobalIds();

    // Highest changed_at across every table.
    util::Timestamp latestChange();

    // A change stamp no earlier than `now` and strictly after every stamp already
    // stored, whatever the clock did since. Call inside runInTransaction together
    // with the write it stamps.
    util::Timestamp nextChangeStamp(util::Timestamp now);

    std::size_t repointCategoryChildren(LocalId from, LocalId to, util::Timestamp now);
    std::size_t repointSavingsGoalChildren(LocalId from, LocalId to, util::Timestamp now);
};

template <typename T>
Table<T>& ChangeLedger::table() {
    if constexpr (std::is_same_v<T, types::Category>) return categories();
    else if constexpr (std::is_same_v<T, types::Transaction>) return transactions();
    else if constexpr (std::is_same_v<T, types::Budget>) return budgets();
    else if constexpr (std::is_same_v<T, types::RecurringTransaction>) return recurringTransactions();
    else if constexpr (std::is_same_v<T, types::Settings>) return settings();
    else if constexpr (std::is_same_v<T, types::SavingsGoal>) return savingsGoals();
    else {
        static_assert(std::is_same_v<T, types::SavingsGoalTransaction>, "Not a syncable entity");
        return savingsGoalTransactions();
    }
}

}
