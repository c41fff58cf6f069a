#pragma once

#include "ledger/SharedStore.hpp"
#include "ledger/WatermarkStore.hpp"

#include <memory>
#include <string>

namespace tally::ledger::sqlite {

class Database;

// Multi-owner store on one SQLite connection. Serves single-host deployments
// and in-process servers in tests; requests are serialized on the connection.
class SqliteStore final : public SharedStore {
public:
    explicit SqliteStore(std::shared_ptr<Database> db);

    void withOwner(const std::string& ownerId, const std::function<void(ChangeLedger&)>& fn) override;

private:
    std::shared_ptr<Database> db_;
};

// Cursor row in sync_state for one owner (the device store uses the empty owner).
class SyncState final : public WatermarkStore {
public:
    explicit SyncState(std::shared_ptr<Database> db, std::string ownerId = {});

    std::optional<SyncCursor> load() override;
    void save(const SyncCursor& cursor) override;

private:
    std::shared_ptr<Database> db_;
    std::string ownerId_;
};

}
