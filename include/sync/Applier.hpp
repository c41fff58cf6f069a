#pragma once

#include "config/Config.hpp"
#include "ledger/ChangeLedger.hpp"
#include "sync/Conflict.hpp"
#include "sync/Fallbacks.hpp"
#include "sync/model/Payload.hpp"

#include <optional>
#include <string_view>
#include <unordered_map>

namespace tally::sync {

struct ApplyStats {
    std::size_t inserted{0};
    std::size_t overwritten{0};
    std::size_t discarded{0};
    std::size_t fallbacks{0};

    [[nodiscard]] std::size_t written() const { return inserted + overwritten; }
};

// Writes an inbound change set into one owner's ledger, parents first.
//
// Phase 1 (categories, savings goals, settings) and phase 2 (everything that
// references them) run in separate transaction scopes, so phase 2 resolves
// references only against a durably written phase 1.
class Applier {
public:
    // What a written row gets as its store-local change stamp.
    enum class Stamp {
        Incoming,     // device: received rows keep the stamp they had (epoch when new)
        ReceiveTime   // server: the request's issued watermark
    };

    // On the device `now` must come from ChangeLedger::nextChangeStamp, so rows
    // redirected to a fallback are collected on the next outbound pass.
    Applier(ledger::ChangeLedger& ledger, util::Timestamp now, Stamp stamp, const config::SyncConfig& cfg);

    ApplyStats apply(const model::Payload& payload);

private:
    using PendingInserts = std::unordered_map<types::GlobalId, types::LocalId>;

    ledger::ChangeLedger& ledger_;
    util::Timestamp now_;
    Stamp stamp_;
    Fallbacks fallbacks_;
    ApplyStats stats_;
    bool redirected_{false};

    // Rows inserted by this apply, keyed per entity type. Consulted before the store.
    std::unordered_map<std::string_view, PendingInserts> pending_;

    void applyParents(const model::Payload& payload);
    void applyChildren(const model::Payload& payload);

    types::LocalId categoryFor(const types::GlobalId& ref, const ledger::GlobalToLocal& categories);
    types::LocalId savingsGoalFor(const types::GlobalId& ref, const ledger::GlobalToLocal& goals);

    template <typename T, typename Dto, typename ToLocal>
    void applyRecord(const Dto& dto, ToLocal&& toLocal);
};

}
