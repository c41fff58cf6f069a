#include "sync/Applier.hpp"
#include "sync/Mapper.hpp"
#include "log/Registry.hpp"
#include "util/Clock.hpp"

using namespace tally::sync;
using namespace tally::types;

Applier::Applier(ledger::ChangeLedger& ledger, const util::Timestamp now, const Stamp stamp,
                 const config::SyncConfig& cfg)
    : ledger_(ledger), now_(now), stamp_(stamp),
      fallbacks_(ledger, now, cfg.fallback_category_name, cfg.fallback_savings_goal_name) {}

ApplyStats Applier::apply(const model::Payload& payload) {
    stats_ = {};
    if (payload.empty()) return stats_;

    ledger_.runInTransaction([&] { applyParents(payload); });
    ledger_.runInTransaction([&] { applyChildren(payload); });

    stats_.fallbacks = fallbacks_.created();
    log::Registry::sync()->debug("[Applier] {} records in: {} inserted, {} overwritten, {} discarded",
                                 payload.size(), stats_.inserted, stats_.overwritten, stats_.discarded);
    return stats_;
}

void Applier::applyParents(const model::Payload& payload) {
    for (const auto& d : payload.categories)
        applyRecord<Category>(d, [](const auto& dto) { return mapper::fromWire(dto); });
    for (const auto& d : payload.savings_goals)
        applyRecord<SavingsGoal>(d, [](const auto& dto) { return mapper::fromWire(dto); });
    for (const auto& d : payload.settings)
        applyRecord<Settings>(d, [](const auto& dto) { return mapper::fromWire(dto); });
}

void Applier::applyChildren(const model::Payload& payload) {
    const auto categories = ledger_.categoryLocalIds();
    const auto goals = ledger_.savingsGoalLocalIds();

    for (const auto& d : payload.transactions)
        applyRecord<Transaction>(d, [&](const auto& dto) {
            return mapper::fromWire(dto, categoryFor(dto.category_global_id, categories));
        });
    for (const auto& d : payload.budgets)
        applyRecord<Budget>(d, [&](const auto& dto) {
            return mapper::fromWire(dto, categoryFor(dto.category_global_id, categories));
        });
    for (const auto& d : payload.recurring_transactions)
        applyRecord<RecurringTransaction>(d, [&](const auto& dto) {
            return mapper::fromWire(dto, categoryFor(dto.category_global_id, categories));
        });
    for (const auto& d : payload.savings_goal_transactions)
        applyRecord<SavingsGoalTransaction>(d, [&](const auto& dto) {
            return mapper::fromWire(dto, savingsGoalFor(dto.savings_goal_global_id, goals));
        });
}

LocalId Applier::categoryFor(const GlobalId& ref, const ledger::GlobalToLocal& categories) {
    if (!ref.empty())
        if (const auto it = categories.find(ref); it != categories.end()) return it->second;

    log::Registry::sync()->warn("[Applier] Unresolved category reference '{}', using fallback", ref);
    redirected_ = true;
    return fallbacks_.category();
}

LocalId Applier::savingsGoalFor(const GlobalId& ref, const ledger::GlobalToLocal& goals) {
    if (!ref.empty())
        if (const auto it = goals.find(ref); it != goals.end()) return it->second;

    log::Registry::sync()->warn("[Applier] Unresolved savings goal reference '{}', using fallback", ref);
    redirected_ = true;
    return fallbacks_.savingsGoal();
}

template <typename T, typename Dto, typename ToLocal>
void Applier::applyRecord(const Dto& dto, ToLocal&& toLocal) {
    auto& table = ledger_.table<T>();
    auto& pending = pending_[entityName<T>()];

    std::optional<T> existing;
    if (const auto it = pending.find(dto.global_id); it != pending.end())
        existing = table.findByLocalId(it->second);
    if (!existing) existing = table.findByGlobalId(dto.global_id);

    const auto resolution = resolve(existing ? std::optional{existing->updated_at} : std::nullopt, dto.updated_at);
    if (resolution == Resolution::Discard) {
        ++stats_.discarded;
        return;
    }

    // references are resolved only for records that will actually be written
    redirected_ = false;
    T record = toLocal(dto);
    record.id = existing ? existing->id : kNoLocalId;
    // a child moved to a fallback gets a fresh stamp and flows back to its sender
    if (redirected_) record.updated_at = util::advanceStamp(record.updated_at, now_);
    if (stamp_ == Stamp::ReceiveTime || redirected_) record.changed_at = now_;
    else record.changed_at = existing ? existing->changed_at : util::kEpoch;

    const auto id = table.upsertByLocalId(record);
    if (resolution == Resolution::Insert) {
        pending[record.global_id] = id;
        ++stats_.inserted;
    } else {
        ++stats_.overwritten;
    }

    log::Registry::sync()->trace("[Applier] {} {} {}", to_string(resolution), entityName<T>(), record.global_id);
}
