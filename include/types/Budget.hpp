#pragma once

#include "types/SyncMeta.hpp"

namespace tally::types {

// Monthly allocation for a category.
struct Budget : SyncMeta {
    LocalId category_id{kNoLocalId};
    std::int64_t amount_cents{};
    int month{1};
    int year{};
};

}
