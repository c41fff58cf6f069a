#pragma once

#include "util/timestamp.hpp"

#include <optional>

namespace tally::ledger {

// How far a device has got with its server.
struct SyncCursor {
    // Server-issued; sent back as last_synced_at.
    util::Timestamp watermark{};
    // Highest local change stamp already delivered. Local clock only, never
    // compared with server stamps.
    util::Timestamp sent_through{};

    bool operator==(const SyncCursor&) const = default;
};

// Durable home of the device's sync cursor.
class WatermarkStore {
public:
    virtual ~WatermarkStore() = default;

    // nullopt before the first successful sync
    virtual std::optional<SyncCursor> load() = 0;

    virtual void save(const SyncCursor& cursor) = 0;
};

}
