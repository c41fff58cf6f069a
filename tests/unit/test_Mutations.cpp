#include <gtest/gtest.h>
#include "support/Harness.hpp"

using namespace tally;
using namespace tally::types;
using namespace std::chrono;

class MutationsTest : public ::testing::Test {
protected:
    std::shared_ptr<ledger::sqlite::Database> db = ledger::sqlite::SqliteLedger::open(":memory:");
    ledger::sqlite::SqliteLedger store{db};
    test::ManualClock clock;
};

TEST_F(MutationsTest, CreateAssignsIdentityAndStamp) {
    const auto c = ledger::create(store, test::category("Rent"), clock);
    EXPECT_TRUE(c.persisted());
    EXPECT_EQ(c.global_id.size(), 36u);
    EXPECT_EQ(c.updated_at, clock.peek());
    EXPECT_EQ(c.changed_at, c.updated_at);
    EXPECT_FALSE(c.is_deleted);
}

TEST_F(MutationsTest, UpdateKeepsGlobalIdAndAdvancesStamp) {
    auto c = ledger::create(store, test::category("Rent"), clock);
    const auto original = c;

    c.name = "Mortgage";
    c.global_id = util::generateGlobalId();
    const auto updated = ledger::update(store, c, clock);

    EXPECT_EQ(updated.global_id, original.global_id);
    EXPECT_GT(updated.updated_at, original.updated_at);
    EXPECT_EQ(store.categories().findByLocalId(c.id)->name, "Mortgage");
}

TEST_F(MutationsTest, UpdateAdvancesPastASkewedStamp) {
    auto c = ledger::create(store, test::category("Rent"), clock);
    clock.set(c.updated_at - hours(1));
    const auto updated = ledger::update(store, c, clock);
    EXPECT_EQ(updated.updated_at, c.updated_at + microseconds(1));
}

TEST_F(MutationsTest, UpdateRequiresAStoredRecord) {
    EXPECT_THROW(ledger::update(store, test::category("Nope"), clock), std::invalid_argument);

    auto ghost = test::category("Ghost");
    ghost.id = 77;
    EXPECT_THROW(ledger::update(store, ghost, clock), std::invalid_argument);
}

TEST_F(MutationsTest, SoftDeleteStampsOnce) {
    const auto c = ledger::create(store, test::category("Rent"), clock);
    EXPECT_TRUE(ledger::softDelete<Category>(store, c.id, clock));
    EXPECT_FALSE(ledger::softDelete<Category>(store, c.id, clock));
    EXPECT_FALSE(ledger::softDelete<Category>(store, 12345, clock));

    const auto back = store.categories().findByLocalId(c.id);
    ASSERT_TRUE(back);
    EXPECT_TRUE(back->is_deleted);
    EXPECT_GT(back->updated_at, c.updated_at);
}

TEST_F(MutationsTest, SeedDefaultsOnlyOnAnEmptyStore) {
    EXPECT_TRUE(ledger::seedDefaults(store, clock));
    EXPECT_EQ(store.categories().listActive().size(), 10u);
    EXPECT_EQ(store.settings().listActive().size(), 1u);

    EXPECT_FALSE(ledger::seedDefaults(store, clock));
    EXPECT_EQ(store.categories().listAll().size(), 10u);
    EXPECT_EQ(store.settings().listAll().size(), 1u);
}

TEST_F(MutationsTest, ChangeStampPassesEveryStoredStampWhenTheClockFallsBack) {
    const auto first = ledger::create(store, test::category("Rent"), clock);
    clock.set(first.updated_at - hours(1));

    const auto second = ledger::create(store, test::category("Food"), clock);
    EXPECT_LT(second.updated_at, first.updated_at);
    EXPECT_EQ(second.changed_at, first.changed_at + microseconds(1));
    EXPECT_EQ(store.latestChange(), second.changed_at);
}
