#pragma once

#include "util/timestamp.hpp"

#include <cstdint>
#include <string>

namespace tally::types {

using LocalId = std::int64_t;
using GlobalId = std::string;

inline constexpr LocalId kNoLocalId = 0;

// Sync attributes carried by every syncable record.
struct SyncMeta {
    LocalId id{kNoLocalId};
    GlobalId global_id;
    util::Timestamp updated_at{};
    bool is_deleted{false};

    // Store-local write stamp. Never leaves the store; see ChangeLedger::listChangedSince.
    util::Timestamp changed_at{};

    [[nodiscard]] bool persisted() const { return id != kNoLocalId; }
};

}
