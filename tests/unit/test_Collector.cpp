#include <gtest/gtest.h>
#include "support/Harness.hpp"

#include "sync/Collector.hpp"

using namespace tally;
using namespace tally::types;
using namespace std::chrono;

class CollectorTest : public ::testing::Test {
protected:
    std::shared_ptr<ledger::sqlite::Database> db = ledger::sqlite::SqliteLedger::open(":memory:");
    ledger::sqlite::SqliteLedger store{db};
    test::ManualClock clock;
};

TEST_F(CollectorTest, ReferencesLeaveAsGlobalIds) {
    const auto cat = ledger::create(store, test::category("Rent"), clock);
    const auto tx = ledger::create(store, test::transaction(cat.id, 150000, "March"), clock);

    SavingsGoal goal;
    goal.name = "Car";
    goal = ledger::create(store, goal, clock);
    SavingsGoalTransaction contribution;
    contribution.savings_goal_id = goal.id;
    contribution.amount_cents = 2500;
    ledger::create(store, contribution, clock);

    const auto p = sync::collect(store, util::kEpoch);
    ASSERT_EQ(p.transactions.size(), 1u);
    EXPECT_EQ(p.transactions[0].global_id, tx.global_id);
    EXPECT_EQ(p.transactions[0].category_global_id, cat.global_id);
    EXPECT_EQ(p.transactions[0].description, "March");
    ASSERT_EQ(p.savings_goal_transactions.size(), 1u);
    EXPECT_EQ(p.savings_goal_transactions[0].savings_goal_global_id, goal.global_id);
    EXPECT_EQ(p.categories.size(), 1u);
    EXPECT_EQ(p.savings_goals.size(), 1u);
}

TEST_F(CollectorTest, DeletedParentStillResolves) {
    const auto cat = ledger::create(store, test::category("Old"), clock);
    const auto since = clock.peek();
    ledger::softDelete<Category>(store, cat.id, clock);
    ledger::create(store, test::transaction(cat.id, 100), clock);

    const auto p = sync::collect(store, since);
    ASSERT_EQ(p.categories.size(), 1u);
    EXPECT_TRUE(p.categories[0].is_deleted);
    ASSERT_EQ(p.transactions.size(), 1u);
    EXPECT_EQ(p.transactions[0].category_global_id, cat.global_id);
}

TEST_F(CollectorTest, DanglingReferenceLeavesEmpty) {
    ledger::create(store, test::transaction(4242, 100), clock);
    ledger::create(store, test::transaction(kNoLocalId, 200), clock);

    const auto p = sync::collect(store, util::kEpoch);
    ASSERT_EQ(p.transactions.size(), 2u);
    EXPECT_EQ(p.transactions[0].category_global_id, "");
    EXPECT_EQ(p.transactions[1].category_global_id, "");
}

TEST_F(CollectorTest, OnlyRecordsAfterTheWatermark) {
    ledger::create(store, test::category("Before"), clock);
    const auto since = clock.peek();
    ledger::create(store, test::category("After"), clock);

    const auto p = sync::collect(store, since);
    ASSERT_EQ(p.size(), 1u);
    EXPECT_EQ(p.categories[0].name, "After");
}

TEST_F(CollectorTest, OutboundSkipsRowsWithoutALocalChangeStamp) {
    const auto local = ledger::create(store, test::category("Rent"), clock);

    auto received = test::category("From elsewhere");
    received.global_id = util::generateGlobalId();
    received.updated_at = local.updated_at + hours(2);
    received.changed_at = util::kEpoch;
    store.categories().upsertByLocalId(received);

    const auto all = sync::collectOutbound(store, util::kEpoch);
    ASSERT_EQ(all.categories.size(), 1u);
    EXPECT_EQ(all.categories[0].global_id, local.global_id);
    EXPECT_TRUE(sync::collectOutbound(store, local.changed_at).empty());
}
