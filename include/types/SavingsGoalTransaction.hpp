#pragma once

#include "types/SyncMeta.hpp"
#include "types/enums.hpp"

namespace tally::types {

struct SavingsGoalTransaction : SyncMeta {
    LocalId savings_goal_id{kNoLocalId};
    util::Date date = util::kEpochDate;
    std::int64_t amount_cents{};
    SavingsGoalTransactionType type{SavingsGoalTransactionType::Contribution};
    std::string note;
};

}
