#pragma once

#include "types/SyncMeta.hpp"
#include "util/timestamp.hpp"

#include <optional>
#include <utility>
#include <vector>

namespace tally::ledger {

using types::GlobalId;
using types::LocalId;

// Owner-scoped access to the rows of one entity type.
// Every read except listActive() sees soft-deleted rows.
template <typename T>
class Table {
public:
    virtual ~Table() = default;

    // Rows with updated_at > since or changed_at > since, deleted ones included.
    virtual std::vector<T> listChangedSince(util::Timestamp since) = 0;

    // Rows whose changed_at alone is after `since`. The device's outbound set.
    virtual std::vector<T> listWrittenSince(util::Timestamp since) = 0;

    // Highest changed_at in the table; the epoch when it is empty.
    virtual util::Timestamp latestChange() = 0;

    // Ordered by local id ascending.
    virtual std::vector<T> listAll() = 0;

    // Ordinary application reads; excludes soft-deleted rows.
    virtual std::vector<T> listActive() = 0;

    // When duplicate rows share the id, the one with the highest local id is returned.
    virtual std::optional<T> findByGlobalId(const GlobalId& id) = 0;

    virtual std::optional<T> findByLocalId(LocalId id) = 0;

    // Inserts when record.id is 0, otherwise updates the row with that id.
    // Returns the local id of the written row.
    virtual LocalId upsertByLocalId(const T& record) = 0;

    // Physical removal. Only the normalizer's exact-duplicate pass uses this.
    virtual void erase(LocalId id) = 0;

    // (local id, global id) of every row, ascending by local id.
    virtual std::vector<std::pair<LocalId, GlobalId>> identities() = 0;

    // Moves every child pointing at parent `from` to `to`, stamping updated_at and
    // changed_at with `now`. Returns the number of rows touched; 0 for entity
    // types without a parent reference.
    virtual std::size_t repointParent(LocalId from, LocalId to, util::Timestamp now) = 0;
};

}
