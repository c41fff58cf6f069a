#pragma once

#include "types/SyncMeta.hpp"
#include "types/enums.hpp"

namespace tally::types {

struct RecurringTransaction : SyncMeta {
    std::string description;
    std::int64_t amount_cents{};
    LocalId category_id{kNoLocalId};
    TransactionType type{TransactionType::Expense};
    Frequency frequency{Frequency::Monthly};
    int day_of_month{1};
    util::Date start_date = util::kEpochDate;
    util::Date next_due_date = util::kEpochDate;
    bool is_active{true};
};

}
