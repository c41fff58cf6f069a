#pragma once

#include "types/SyncMeta.hpp"
#include "types/enums.hpp"

#include <optional>

namespace tally::types {

struct SavingsGoal : SyncMeta {
    std::string name;
    std::string icon = "🎯";
    std::string color = "#6366F1";
    std::int64_t goal_cents{};
    std::int64_t current_balance_cents{};
    std::int64_t monthly_contribution_cents{};
    util::Date start_date = util::kEpochDate;
    std::optional<util::Date> target_date;
    SavingsGoalStatus status{SavingsGoalStatus::Active};
    bool auto_contribute{false};
    std::optional<util::Date> last_auto_contribute_date;
};

}
