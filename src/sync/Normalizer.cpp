#include "sync/Normalizer.hpp"
#include "log/Registry.hpp"
#include "util/Clock.hpp"
#include "util/strings.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <map>
#include <vector>

using namespace tally::sync;
using namespace tally::types;

namespace {

// Natural keys for the semantic pass.

std::string categoryKey(const Category& c) {
    return fmt::format("{}|{}", tally::util::normalizeName(c.name), toInt(c.type));
}

std::string savingsGoalKey(const SavingsGoal& g) {
    return tally::util::normalizeName(g.name);
}

std::string budgetKey(const Budget& b) {
    return fmt::format("{}|{}|{}", b.category_id, b.month, b.year);
}

std::string settingsKey(const Settings&) {
    return "settings";
}

// Newest first; equal stamps ordered by global id so every store picks the same row.
template <typename T>
bool survivesOver(const T& a, const T& b) {
    if (a.updated_at != b.updated_at) return a.updated_at > b.updated_at;
    return a.global_id < b.global_id;
}

}

Normalizer::Normalizer(ledger::ChangeLedger& ledger, const util::Timestamp now)
    : ledger_(ledger), now_(now) {}

NormalizeStats Normalizer::run() {
    stats_ = {};

    ledger_.runInTransaction([this] {
        collapseExact();
        collapseSemantic();
    });

    if (stats_.changed())
        log::Registry::sync()->info("[Normalizer] Collapsed duplicates: {} erased, {} soft-deleted, {} children repointed",
                                    stats_.erased, stats_.softDeleted, stats_.repointed);
    return stats_;
}

void Normalizer::collapseExact() {
    const auto categoryChildren = [this](const LocalId from, const LocalId to) {
        return ledger_.repointCategoryChildren(from, to, now_);
    };
    const auto goalChildren = [this](const LocalId from, const LocalId to) {
        return ledger_.repointSavingsGoalChildren(from, to, now_);
    };
    const auto leaf = [](LocalId, LocalId) -> std::size_t { return 0; };

    // parents first, so their children are repointed before the child pass
    exactPass<Category>(categoryChildren);
    exactPass<SavingsGoal>(goalChildren);
    exactPass<Settings>(leaf);
    exactPass<Transaction>(leaf);
    exactPass<Budget>(leaf);
    exactPass<RecurringTransaction>(leaf);
    exactPass<SavingsGoalTransaction>(leaf);
}

void Normalizer::collapseSemantic() {
    const auto categoryChildren = [this](const LocalId from, const LocalId to) {
        return ledger_.repointCategoryChildren(from, to, now_);
    };
    const auto goalChildren = [this](const LocalId from, const LocalId to) {
        return ledger_.repointSavingsGoalChildren(from, to, now_);
    };
    const auto leaf = [](LocalId, LocalId) -> std::size_t { return 0; };

    semanticPass<Category>(categoryKey, categoryChildren);
    semanticPass<SavingsGoal>(savingsGoalKey, goalChildren);
    // budgets key on the category, so they go after categories collapse
    semanticPass<Budget>(budgetKey, leaf);
    semanticPass<Settings>(settingsKey, leaf);
}

template <typename T, typename RepointFn>
void Normalizer::exactPass(RepointFn&& repoint) {
    auto& table = ledger_.table<T>();

    std::map<GlobalId, std::vector<LocalId>> groups;
    for (auto& [local, global] : table.identities())
        if (!global.empty()) groups[global].push_back(local);

    for (const auto& [global, ids] : groups) {
        if (ids.size() < 2) continue;

        // identities() is ascending, so the keeper is last
        const auto keep = ids.back();
        for (std::size_t i = 0; i + 1 < ids.size(); ++i) {
            stats_.repointed += repoint(ids[i], keep);
            table.erase(ids[i]);
            ++stats_.erased;
        }

        log::Registry::sync()->info("[Normalizer] {} {} stored {} times, kept local id {}",
                                    entityName<T>(), global, ids.size(), keep);
    }
}

template <typename T, typename KeyFn, typename RepointFn>
void Normalizer::semanticPass(KeyFn&& key, RepointFn&& repoint) {
    auto& table = ledger_.table<T>();

    std::map<std::string, std::vector<T>> groups;
    std::map<std::string, std::vector<LocalId>> retired;
    for (auto& r : table.listAll()) {
        if (r.is_deleted) retired[key(r)].push_back(r.id);
        else groups[key(r)].push_back(std::move(r));
    }

    for (auto& [k, members] : groups) {
        std::sort(members.begin(), members.end(), survivesOver<T>);
        const auto& keeper = members.front();

        for (std::size_t i = 1; i < members.size(); ++i) {
            auto loser = members[i];
            stats_.repointed += repoint(loser.id, keeper.id);

            loser.is_deleted = true;
            loser.updated_at = util::advanceStamp(loser.updated_at, now_);
            loser.changed_at = now_;
            table.upsertByLocalId(loser);
            ++stats_.softDeleted;

            log::Registry::sync()->info("[Normalizer] {} {} duplicates {} ('{}'), soft-deleted",
                                        entityName<T>(), loser.global_id, keeper.global_id, k);
        }

        // a late child can still reference a row retired in an earlier run
        if (const auto it = retired.find(k); it != retired.end())
            for (const auto id : it->second) stats_.repointed += repoint(id, keeper.id);
    }
}
