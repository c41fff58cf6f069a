#pragma once

#include "types/SyncMeta.hpp"
#include "util/timestamp.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace tally::sync::model {

using types::GlobalId;

// Wire shapes. No local ids anywhere: references travel as global ids and an
// empty global id means "no reference". Enums travel as their integer values.

struct WireMeta {
    GlobalId global_id;
    util::Timestamp updated_at{};
    bool is_deleted{false};
};

struct CategoryDto : WireMeta {
    std::string name, icon, color;
    std::int64_t default_budget_cents{};
    int type{};
};

struct TransactionDto : WireMeta {
    std::string description;
    std::int64_t amount_cents{};
    util::Date date = util::kEpochDate;
    GlobalId category_global_id;
    int type{};
};

struct BudgetDto : WireMeta {
    GlobalId category_global_id;
    std::int64_t amount_cents{};
    int month{1};
    int year{};
};

struct RecurringTransactionDto : WireMeta {
    std::string description;
    std::int64_t amount_cents{};
    GlobalId category_global_id;
    int type{};
    int frequency{};
    int day_of_month{1};
    util::Date start_date = util::kEpochDate;
    util::Date next_due_date = util::kEpochDate;
    bool is_active{true};
};

struct SettingsDto : WireMeta {
    std::int64_t monthly_income_cents{};
};

struct SavingsGoalDto : WireMeta {
    std::string name, icon, color;
    std::int64_t goal_cents{};
    std::int64_t current_balance_cents{};
    std::int64_t monthly_contribution_cents{};
    util::Date start_date = util::kEpochDate;
    std::optional<util::Date> target_date;
    int status{};
    bool auto_contribute{false};
    std::optional<util::Date> last_auto_contribute_date;
};

struct SavingsGoalTransactionDto : WireMeta {
    GlobalId savings_goal_global_id;
    util::Date date = util::kEpochDate;
    std::int64_t amount_cents{};
    int type{};
    std::string note;
};

void to_json(nlohmann::json& j, const CategoryDto& d);
void from_json(const nlohmann::json& j, CategoryDto& d);
void to_json(nlohmann::json& j, const TransactionDto& d);
void from_json(const nlohmann::json& j, TransactionDto& d);
void to_json(nlohmann::json& j, const BudgetDto& d);
void from_json(const nlohmann::json& j, BudgetDto& d);
void to_json(nlohmann::json& j, const RecurringTransactionDto& d);
void from_json(const nlohmann::json& j, RecurringTransactionDto& d);
void to_json(nlohmann::json& j, const SettingsDto& d);
void from_json(const nlohmann::json& j, SettingsDto& d);
void to_json(nlohmann::json& j, const SavingsGoalDto& d);
void from_json(const nlohmann::json& j, SavingsGoalDto& d);
void to_json(nlohmann::json& j, const SavingsGoalTransactionDto& d);
void from_json(const nlohmann::json& j, SavingsGoalTransactionDto& d);

}
