#include "ledger/ChangeLedger.hpp"
#include "util/Clock.hpp"

#include <algorithm>

namespace tally::ledger {

namespace {

template <typename T>
GlobalToLocal buildLocalIds(Table<T>& table) {
    GlobalToLocal out;
    // identities() is ascending, so a later duplicate overwrites with the higher id
    for (auto& [local, global] : table.identities())
        if (!global.empty()) out[global] = local;
    return out;
}

template <typename T>
LocalToGlobal buildGlobalIds(Table<T>& table) {
    LocalToGlobal out;
    for (auto& [local, global] : table.identities()) out.emplace(local, std::move(global));
    return out;
}

}

GlobalToLocal ChangeLedger::categoryLocalIds() { return buildLocalIds(categories()); }

LocalToGlobal ChangeLedger::categoryGlobalIds() { return buildGlobalIds(categories()); }

GlobalToLocal ChangeLedger::savingsGoalLocalIds() { return buildLocalIds(savingsGoals()); }

LocalToGlobal ChangeLedger::savingsGoalGlobalIds() { return buildGlobalIds(savingsGoals()); }

util::Timestamp ChangeLedger::latestChange() {
    return std::max({categories().latestChange(), transactions().latestChange(), budgets().latestChange(),
                     recurringTransactions().latestChange(), settings().latestChange(),
                     savingsGoals().latestChange(), savingsGoalTransactions().latestChange()});
}

util::Timestamp ChangeLedger::nextChangeStamp(const util::Timestamp now) {
    return util::advanceStamp(latestChange(), now);
}

std::size_t ChangeLedger::repointCategoryChildren(const LocalId from, const LocalId to, const util::Timestamp now) {
    if (from == to) return 0;
    return transactions().repointParent(from, to, now)
         + budgets().repointParent(from, to, now)
         + recurringTransactions().repointParent(from, to, now);
}

std::size_t ChangeLedger::repointSavingsGoalChildren(const LocalId from, const LocalId to, const util::Timestamp now) {
    if (from == to) return 0;
    return savingsGoalTransactions().repointParent(from, to, now);
}

}
