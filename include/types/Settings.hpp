#pragma once

#include "types/SyncMeta.hpp"

namespace tally::types {

// Per-owner preferences. At most one active row per owner.
struct Settings : SyncMeta {
    std::int64_t monthly_income_cents{};
};

}
