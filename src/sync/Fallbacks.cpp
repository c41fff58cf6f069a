#include "sync/Fallbacks.hpp"
#include "log/Registry.hpp"
#include "util/strings.hpp"
#include "util/uuid.hpp"

using namespace tally::sync;
using namespace tally::types;

namespace {

template <typename T>
LocalId findActiveByName(tally::ledger::Table<T>& table, const std::string& name) {
    const auto wanted = tally::util::normalizeName(name);
    for (const auto& r : table.listActive())
        if (tally::util::normalizeName(r.name) == wanted) return r.id;
    return kNoLocalId;
}

template <typename T>
void stampNew(T& record, const tally::util::Timestamp now) {
    record.global_id = tally::util::generateGlobalId();
    record.updated_at = now;
    record.changed_at = now;
    record.is_deleted = false;
}

}

Fallbacks::Fallbacks(ledger::ChangeLedger& ledger, const util::Timestamp now,
                     std::string categoryName, std::string savingsGoalName)
    : ledger_(ledger), now_(now),
      categoryName_(std::move(categoryName)), savingsGoalName_(std::move(savingsGoalName)) {}

LocalId Fallbacks::category() {
    if (categoryId_ != kNoLocalId) return categoryId_;

    categoryId_ = findActiveByName(ledger_.categories(), categoryName_);
    if (categoryId_ != kNoLocalId) return categoryId_;

    Category c;
    stampNew(c, now_);
    c.name = categoryName_;
    c.icon = "❓";
    c.color = "#6B7280";
    c.type = CategoryType::Fixed;
    categoryId_ = ledger_.categories().upsertByLocalId(c);
    ++created_;

    log::Registry::sync()->info("[Fallbacks] Created fallback category '{}' ({})", c.name, c.global_id);
    return categoryId_;
}

LocalId Fallbacks::savingsGoal() {
    if (savingsGoalId_ != kNoLocalId) return savingsGoalId_;

    savingsGoalId_ = findActiveByName(ledger_.savingsGoals(), savingsGoalName_);
    if (savingsGoalId_ != kNoLocalId) return savingsGoalId_;

    SavingsGoal g;
    stampNew(g, now_);
    g.name = savingsGoalName_;
    g.icon = "🏦";
    g.color = "#6B7280";
    g.start_date = util::Date{std::chrono::floor<std::chrono::days>(now_)};
    g.status = SavingsGoalStatus::Active;
    savingsGoalId_ = ledger_.savingsGoals().upsertByLocalId(g);
    ++created_;

    log::Registry::sync()->info("[Fallbacks] Created fallback savings goal '{}' ({})", g.name, g.global_id);
    return savingsGoalId_;
}
