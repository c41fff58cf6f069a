#include "sync/Collector.hpp"
#include "sync/Mapper.hpp"
#include "log/Registry.hpp"

namespace tally::sync {

namespace {

enum class Select { Changed, Written };

template <typename T, typename Dto, typename... Lookup>
void gather(ledger::Table<T>& table, const Select select, const util::Timestamp since, std::vector<Dto>& out,
            const Lookup&... lookup) {
    const auto rows = select == Select::Changed ? table.listChangedSince(since) : table.listWrittenSince(since);
    for (const auto& r : rows) out.push_back(mapper::toWire(r, lookup...));
}

model::Payload gatherAll(ledger::ChangeLedger& ledger, const Select select, const util::Timestamp since) {
    model::Payload p;

    const auto categories = ledger.categoryGlobalIds();
    const auto goals = ledger.savingsGoalGlobalIds();

    gather(ledger.categories(), select, since, p.categories);
    gather(ledger.savingsGoals(), select, since, p.savings_goals);
    gather(ledger.settings(), select, since, p.settings);
    gather(ledger.transactions(), select, since, p.transactions, categories);
    gather(ledger.budgets(), select, since, p.budgets, categories);
    gather(ledger.recurringTransactions(), select, since, p.recurring_transactions, categories);
    gather(ledger.savingsGoalTransactions(), select, since, p.savings_goal_transactions, goals);
    return p;
}

}

model::Payload collect(ledger::ChangeLedger& ledger, const util::Timestamp since) {
    auto p = gatherAll(ledger, Select::Changed, since);
    log::Registry::sync()->debug("[Collector] {} records changed since {}", p.size(), util::timestampToString(since));
    return p;
}

model::Payload collectOutbound(ledger::ChangeLedger& ledger, const util::Timestamp sentThrough) {
    auto p = gatherAll(ledger, Select::Written, sentThrough);
    log::Registry::sync()->debug("[Collector] {} local records written after {}", p.size(),
                                 util::timestampToString(sentThrough));
    return p;
}

}
