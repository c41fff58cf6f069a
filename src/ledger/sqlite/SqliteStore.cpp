#include "ledger/sqlite/SqliteStore.hpp"
#include "ledger/sqlite/SqliteLedger.hpp"
#include "ledger/sqlite/Database.hpp"

#include <mutex>

namespace tally::ledger::sqlite {

SqliteStore::SqliteStore(std::shared_ptr<Database> db) : db_(std::move(db)) {
    if (!db_) throw std::invalid_argument("SqliteStore requires an open database");
}

void SqliteStore::withOwner(const std::string& ownerId, const std::function<void(ChangeLedger&)>& fn) {
    std::lock_guard lock(db_->mutex());
    SqliteLedger ledger(db_, ownerId);
    ledger.runInTransaction([&] { fn(ledger); });
}

SyncState::SyncState(std::shared_ptr<Database> db, std::string ownerId)
    : db_(std::move(db)), ownerId_(std::move(ownerId)) {}

std::optional<SyncCursor> SyncState::load() {
    std::lock_guard lock(db_->mutex());
    auto st = db_->prepare("SELECT last_synced_at, sent_through FROM sync_state WHERE owner_id = ?1");
    st.bind(1, ownerId_);
    if (!st.step()) return std::nullopt;
    return SyncCursor{util::fromMicros(st.int64At(0)), util::fromMicros(st.int64At(1))};
}

void SyncState::save(const SyncCursor& cursor) {
    std::lock_guard lock(db_->mutex());
    auto st = db_->prepare(
        "INSERT INTO sync_state (owner_id, last_synced_at, sent_through) VALUES (?1, ?2, ?3) "
        "ON CONFLICT (owner_id) DO UPDATE SET last_synced_at = excluded.last_synced_at, "
        "sent_through = excluded.sent_through");
    st.bind(1, ownerId_);
    st.bind(2, util::toMicros(cursor.watermark));
    st.bind(3, util::toMicros(cursor.sent_through));
    st.run();
}

}
