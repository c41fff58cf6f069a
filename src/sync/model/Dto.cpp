#include "sync/model/Dto.hpp"
#include "types/enums.hpp"
#include "util/uuid.hpp"

#include <nlohmann/json.hpp>

namespace tally::sync::model {

namespace {

void meta_to_json(nlohmann::json& j, const WireMeta& m) {
    j["global_id"] = m.global_id;
    j["updated_at"] = util::timestampToString(m.updated_at);
    j["is_deleted"] = m.is_deleted;
}

void meta_from_json(const nlohmann::json& j, WireMeta& m) {
    m.global_id = util::canonicalGlobalId(j.at("global_id").get<std::string>());
    if (m.global_id.empty()) throw std::invalid_argument("Record without a valid global_id");
    m.updated_at = util::parseTimestamp(j.at("updated_at").get<std::string>());
    m.is_deleted = j.value("is_deleted", false);
}

// Enum fields travel as integers; reject values this build does not know.
template <typename E>
int enum_from_json(const nlohmann::json& j, const char* key, const E fallback) {
    return types::toInt(types::enumFromInt<E>(j.value(key, types::toInt(fallback))));
}

// Absent, null and nil references all decode to the empty global id.
GlobalId ref_from_json(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return {};
    return util::canonicalGlobalId(j.at(key).get<std::string>());
}

nlohmann::json date_or_null(const std::optional<util::Date>& d) {
    if (!d) return nullptr;
    return util::dateToString(*d);
}

std::optional<util::Date> optional_date(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    return util::parseDate(j.at(key).get<std::string>());
}

}

void to_json(nlohmann::json& j, const CategoryDto& d) {
    meta_to_json(j, d);
    j["name"] = d.name;
    j["icon"] = d.icon;
    j["color"] = d.color;
    j["default_budget_cents"] = d.default_budget_cents;
    j["type"] = d.type;
}

void from_json(const nlohmann::json& j, CategoryDto& d) {
    meta_from_json(j, d);
    d.name = j.at("name").get<std::string>();
    d.icon = j.value("icon", std::string{});
    d.color = j.value("color", std::string{"#6B7280"});
    d.default_budget_cents = j.value("default_budget_cents", std::int64_t{0});
    d.type = enum_from_json(j, "type", types::CategoryType::Fixed);
}

void to_json(nlohmann::json& j, const TransactionDto& d) {
    meta_to_json(j, d);
    j["description"] = d.description;
    j["amount_cents"] = d.amount_cents;
    j["date"] = util::dateToString(d.date);
    j["category_global_id"] = d.category_global_id;
    j["type"] = d.type;
}

void from_json(const nlohmann::json& j, TransactionDto& d) {
    meta_from_json(j, d);
    d.description = j.value("description", std::string{});
    d.amount_cents = j.at("amount_cents").get<std::int64_t>();
    d.date = util::parseDate(j.at("date").get<std::string>());
    d.category_global_id = ref_from_json(j, "category_global_id");
    d.type = enum_from_json(j, "type", types::TransactionType::Expense);
}

void to_json(nlohmann::json& j, const BudgetDto& d) {
    meta_to_json(j, d);
    j["category_global_id"] = d.category_global_id;
    j["amount_cents"] = d.amount_cents;
    j["month"] = d.month;
    j["year"] = d.year;
}

void from_json(const nlohmann::json& j, BudgetDto& d) {
    meta_from_json(j, d);
    d.category_global_id = ref_from_json(j, "category_global_id");
    d.amount_cents = j.at("amount_cents").get<std::int64_t>();
    d.month = j.at("month").get<int>();
    d.year = j.at("year").get<int>();
    if (d.month < 1 || d.month > 12) throw std::invalid_argument("Budget month out of range");
}

void to_json(nlohmann::json& j, const RecurringTransactionDto& d) {
    meta_to_json(j, d);
    j["description"] = d.description;
    j["amount_cents"] = d.amount_cents;
    j["category_global_id"] = d.category_global_id;
    j["type"] = d.type;
    j["frequency"] = d.frequency;
    j["day_of_month"] = d.day_of_month;
    j["start_date"] = util::dateToString(d.start_date);
    j["next_due_date"] = util::dateToString(d.next_due_date);
    j["is_active"] = d.is_active;
}

void from_json(const nlohmann::json& j, RecurringTransactionDto& d) {
    meta_from_json(j, d);
    d.description = j.value("description", std::string{});
    d.amount_cents = j.at("amount_cents").get<std::int64_t>();
    d.category_global_id = ref_from_json(j, "category_global_id");
    d.type = enum_from_json(j, "type", types::TransactionType::Expense);
    d.frequency = enum_from_json(j, "frequency", types::Frequency::Monthly);
    d.day_of_month = j.value("day_of_month", 1);
    d.start_date = util::parseDate(j.at("start_date").get<std::string>());
    d.next_due_date = util::parseDate(j.at("next_due_date").get<std::string>());
    d.is_active = j.value("is_active", true);
}

void to_json(nlohmann::json& j, const SettingsDto& d) {
    meta_to_json(j, d);
    j["monthly_income_cents"] = d.monthly_income_cents;
}

void from_json(const nlohmann::json& j, SettingsDto& d) {
    meta_from_json(j, d);
    d.monthly_income_cents = j.value("monthly_income_cents", std::int64_t{0});
}

void to_json(nlohmann::json& j, const SavingsGoalDto& d) {
    meta_to_json(j, d);
    j["name"] = d.name;
    j["icon"] = d.icon;
    j["color"] = d.color;
    j["goal_cents"] = d.goal_cents;
    j["current_balance_cents"] = d.current_balance_cents;
    j["monthly_contribution_cents"] = d.monthly_contribution_cents;
    j["start_date"] = util::dateToString(d.start_date);
    j["target_date"] = date_or_null(d.target_date);
    j["status"] = d.status;
    j["auto_contribute"] = d.auto_contribute;
    j["last_auto_contribute_date"] = date_or_null(d.last_auto_contribute_date);
}

void from_json(const nlohmann::json& j, SavingsGoalDto& d) {
    meta_from_json(j, d);
    d.name = j.at("name").get<std::string>();
    d.icon = j.value("icon", std::string{"🎯"});
    d.color = j.value("color", std::string{"#6366F1"});
    d.goal_cents = j.value("goal_cents", std::int64_t{0});
    d.current_balance_cents = j.value("current_balance_cents", std::int64_t{0});
    d.monthly_contribution_cents = j.value("monthly_contribution_cents", std::int64_t{0});
    d.start_date = util::parseDate(j.at("start_date").get<std::string>());
    d.target_date = optional_date(j, "target_date");
    d.status = enum_from_json(j, "status", types::SavingsGoalStatus::Active);
    d.auto_contribute = j.value("auto_contribute", false);
    d.last_auto_contribute_date = optional_date(j, "last_auto_contribute_date");
}

void to_json(nlohmann::json& j, const SavingsGoalTransactionDto& d) {
    meta_to_json(j, d);
    j["savings_goal_global_id"] = d.savings_goal_global_id;
    j["date"] = util::dateToString(d.date);
    j["amount_cents"] = d.amount_cents;
    j["type"] = d.type;
    j["note"] = d.note;
}

void from_json(const nlohmann::json& j, SavingsGoalTransactionDto& d) {
    meta_from_json(j, d);
    d.savings_goal_global_id = ref_from_json(j, "savings_goal_global_id");
    d.date = util::parseDate(j.at("date").get<std::string>());
    d.amount_cents = j.at("amount_cents").get<std::int64_t>();
    d.type = enum_from_json(j, "type", types::SavingsGoalTransactionType::Contribution);
    d.note = j.value("note", std::string{});
}

}
