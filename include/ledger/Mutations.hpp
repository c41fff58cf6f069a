#pragma once

#include "ledger/ChangeLedger.hpp"
#include "util/Clock.hpp"
#include "util/uuid.hpp"

#include <stdexcept>

namespace tally::ledger {

// Local record lifecycle. Every write here is a user-originated mutation: it
// gets a fresh UpdatedAt from the clock and a change stamp past everything the
// store already holds, so the next outbound collection picks it up.

template <typename T>
T create(ChangeLedger& ledger, T record, const util::Clock& clock) {
    ledger.runInTransaction([&] {
        record.id = types::kNoLocalId;
        record.global_id = util::generateGlobalId();
        record.updated_at = clock.now();
        record.changed_at = ledger.nextChangeStamp(record.updated_at);
        record.is_deleted = false;
        record.id = ledger.table<T>().upsertByLocalId(record);
    });
    return record;
}

template <typename T>
T update(ChangeLedger& ledger, T record, const util::Clock& clock) {
    if (!record.persisted()) throw std::invalid_argument("update() needs a stored record");

    ledger.runInTransaction([&] {
        const auto current = ledger.table<T>().findByLocalId(record.id);
        if (!current) throw std::invalid_argument("update() on a record that does not exist");

        // identity is immutable
        record.global_id = current->global_id;
        record.updated_at = util::advanceStamp(current->updated_at, clock.now());
        record.changed_at = ledger.nextChangeStamp(record.updated_at);
        ledger.table<T>().upsertByLocalId(record);
    });
    return record;
}

// Returns false when no such record exists or it is already deleted.
template <typename T>
bool softDelete(ChangeLedger& ledger, const types::LocalId id, const util::Clock& clock) {
    bool deleted = false;
    ledger.runInTransaction([&] {
        auto record = ledger.table<T>().findByLocalId(id);
        if (!record || record->is_deleted) return;
        record->is_deleted = true;
        record->updated_at = util::advanceStamp(record->updated_at, clock.now());
        record->changed_at = ledger.nextChangeStamp(record->updated_at);
        ledger.table<T>().upsertByLocalId(*record);
        deleted = true;
    });
    return deleted;
}

// Default categories and a Settings row on an empty store.
// Returns false when categories already exist.
bool seedDefaults(ChangeLedger& ledger, const util::Clock& clock);

}
