#include <gtest/gtest.h>
#include "sync/model/Payload.hpp"
#include "util/uuid.hpp"

#include <nlohmann/json.hpp>

using namespace tally::sync::model;
using namespace tally::util;
using json = nlohmann::json;

namespace {

json categoryJson(const std::string& gid) {
    return {
        {"global_id", gid},
        {"updated_at", "2026-03-01T10:00:00.000001Z"},
        {"is_deleted", false},
        {"name", "Rent"},
        {"icon", "🏠"},
        {"color", "#EF4444"},
        {"default_budget_cents", 150000},
        {"type", 0}
    };
}

}

TEST(WireFormatTest, RequestUsesSnakeCaseKeys) {
    SyncRequest req;
    req.last_synced_at = parseTimestamp("2026-03-01T00:00:00Z");
    CategoryDto c;
    c.global_id = generateGlobalId();
    c.updated_at = parseTimestamp("2026-03-01T10:00:00Z");
    c.name = "Rent";
    req.client_changes.categories.push_back(c);

    const json j = req;
    EXPECT_EQ(j.at("last_synced_at"), "2026-03-01T00:00:00.000000Z");
    const auto& cat = j.at("client_changes").at("categories").at(0);
    EXPECT_EQ(cat.at("global_id"), c.global_id);
    EXPECT_EQ(cat.at("updated_at"), "2026-03-01T10:00:00.000000Z");
    EXPECT_EQ(cat.at("is_deleted"), false);
    for (const auto* key : {"transactions", "budgets", "recurring_transactions", "settings", "savings_goals",
                            "savings_goal_transactions"})
        EXPECT_TRUE(j.at("client_changes").at(key).is_array()) << key;
}

TEST(WireFormatTest, MissingListsDecodeEmpty) {
    const auto gid = generateGlobalId();
    const auto p = json{{"categories", json::array({categoryJson(gid)})}, {"budgets", nullptr}}.get<Payload>();
    ASSERT_EQ(p.categories.size(), 1u);
    EXPECT_EQ(p.categories[0].global_id, gid);
    EXPECT_EQ(p.categories[0].default_budget_cents, 150000);
    EXPECT_TRUE(p.budgets.empty());
    EXPECT_TRUE(p.transactions.empty());
    EXPECT_EQ(p.size(), 1u);
}

TEST(WireFormatTest, GlobalIdsAreCanonicalized) {
    auto j = categoryJson("3F2504E0-4F89-11D3-9A0C-0305E82C3301");
    EXPECT_EQ(j.get<CategoryDto>().global_id, "3f2504e0-4f89-11d3-9a0c-0305e82c3301");

    j["global_id"] = "00000000-0000-0000-0000-000000000000";
    EXPECT_THROW(j.get<CategoryDto>(), std::invalid_argument);
}

TEST(WireFormatTest, UnknownEnumValueIsRejected) {
    auto j = categoryJson(generateGlobalId());
    j["type"] = 7;
    EXPECT_THROW(j.get<CategoryDto>(), std::invalid_argument);
}

TEST(WireFormatTest, NilAndNullReferencesBecomeEmpty) {
    json tx = {
        {"global_id", generateGlobalId()},
        {"updated_at", "2026-03-01T10:00:00Z"},
        {"amount_cents", 1999},
        {"date", "2026-03-01"},
        {"category_global_id", "00000000-0000-0000-0000-000000000000"},
        {"type", 0}
    };
    EXPECT_EQ(tx.get<TransactionDto>().category_global_id, "");

    tx["category_global_id"] = nullptr;
    EXPECT_EQ(tx.get<TransactionDto>().category_global_id, "");

    tx.erase("category_global_id");
    const auto d = tx.get<TransactionDto>();
    EXPECT_EQ(d.category_global_id, "");
    EXPECT_EQ(d.amount_cents, 1999);
    EXPECT_EQ(d.date, parseDate("2026-03-01"));
}

TEST(WireFormatTest, BudgetMonthMustBeACalendarMonth) {
    json b = {
        {"global_id", generateGlobalId()},
        {"updated_at", "2026-03-01T10:00:00Z"},
        {"category_global_id", generateGlobalId()},
        {"amount_cents", 5000},
        {"month", 13},
        {"year", 2026}
    };
    EXPECT_THROW(b.get<BudgetDto>(), std::invalid_argument);
    b["month"] = 12;
    EXPECT_EQ(b.get<BudgetDto>().month, 12);
}

TEST(WireFormatTest, OptionalDatesTravelAsNull) {
    SavingsGoalDto g;
    g.global_id = generateGlobalId();
    g.updated_at = parseTimestamp("2026-03-01T10:00:00Z");
    g.name = "Trip";
    g.start_date = parseDate("2026-03-01");

    const json j = g;
    EXPECT_TRUE(j.at("target_date").is_null());
    EXPECT_TRUE(j.at("last_auto_contribute_date").is_null());
    EXPECT_FALSE(j.get<SavingsGoalDto>().target_date.has_value());
}

TEST(WireFormatTest, ResponseRequiresSyncedAt) {
    EXPECT_THROW(json({{"server_changes", json::object()}}).get<SyncResponse>(), json::exception);

    const auto r = json{{"synced_at", "2026-03-01T10:00:00.5Z"}}.get<SyncResponse>();
    EXPECT_EQ(r.synced_at, parseTimestamp("2026-03-01T10:00:00.500000Z"));
    EXPECT_TRUE(r.server_changes.empty());
}

TEST(WireFormatTest, NonObjectChangeSetIsRejected) {
    EXPECT_THROW(json::array().get<Payload>(), std::invalid_argument);
}
