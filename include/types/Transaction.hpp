#pragma once

#include "types/SyncMeta.hpp"
#include "types/enums.hpp"

namespace tally::types {

struct Transaction : SyncMeta {
    std::string description;
    std::int64_t amount_cents{};
    util::Date date = util::kEpochDate;
    LocalId category_id{kNoLocalId};
    TransactionType type{TransactionType::Expense};
};

}
