#include <gtest/gtest.h>
#include "support/Harness.hpp"

#include "ledger/sqlite/Database.hpp"
#include "ledger/sqlite/schema.hpp"

using namespace tally;
using namespace tally::types;
using namespace tally::util;
using namespace std::chrono;

class SqliteLedgerTest : public ::testing::Test {
protected:
    std::shared_ptr<ledger::sqlite::Database> db = ledger::sqlite::SqliteLedger::open(":memory:");
    ledger::sqlite::SqliteLedger store{db};
    test::ManualClock clock;

    Category stored(const std::string& name, const Timestamp updated, const GlobalId& gid = generateGlobalId()) {
        auto c = test::category(name);
        c.global_id = gid;
        c.updated_at = updated;
        c.changed_at = updated;
        c.id = store.categories().upsertByLocalId(c);
        return c;
    }
};

TEST_F(SqliteLedgerTest, UpsertInsertsThenUpdatesInPlace) {
    auto c = ledger::create(store, test::category("Groceries", CategoryType::Discretionary), clock);
    ASSERT_TRUE(c.persisted());

    c.name = "Food";
    c.default_budget_cents = 42000;
    EXPECT_EQ(store.categories().upsertByLocalId(c), c.id);

    const auto back = store.categories().findByLocalId(c.id);
    ASSERT_TRUE(back);
    EXPECT_EQ(back->name, "Food");
    EXPECT_EQ(back->default_budget_cents, 42000);
    EXPECT_EQ(back->type, CategoryType::Discretionary);
    EXPECT_EQ(back->global_id, c.global_id);
    EXPECT_EQ(back->updated_at, c.updated_at);
    EXPECT_EQ(store.categories().listAll().size(), 1u);
}

TEST_F(SqliteLedgerTest, UpdatingAMissingRowThrows) {
    auto c = test::category("Ghost");
    c.id = 999;
    c.global_id = generateGlobalId();
    EXPECT_THROW(store.categories().upsertByLocalId(c), ledger::sqlite::SqliteError);
}

TEST_F(SqliteLedgerTest, ChangedSinceUsesEitherStamp) {
    const auto t0 = parseTimestamp("2026-01-01T00:00:00Z");
    stored("Old", t0);
    stored("New", t0 + seconds(10));

    auto touched = stored("Touched", t0);
    touched.changed_at = t0 + seconds(20);
    store.categories().upsertByLocalId(touched);

    const auto changed = store.categories().listChangedSince(t0 + seconds(5));
    ASSERT_EQ(changed.size(), 2u);
    EXPECT_EQ(changed[0].name, "New");
    EXPECT_EQ(changed[1].name, "Touched");
    EXPECT_EQ(changed[1].updated_at, t0);

    EXPECT_EQ(store.categories().listChangedSince(kEpoch).size(), 3u);
    EXPECT_TRUE(store.categories().listChangedSince(t0 + seconds(20)).empty());
}

TEST_F(SqliteLedgerTest, WrittenSinceLooksAtTheChangeStampOnly) {
    const auto t0 = parseTimestamp("2026-01-01T00:00:00Z");
    auto received = stored("From the server", t0 + hours(1));
    received.changed_at = kEpoch;
    store.categories().upsertByLocalId(received);
    auto local = stored("Local", t0);
    local.changed_at = t0 + seconds(20);
    store.categories().upsertByLocalId(local);

    const auto written = store.categories().listWrittenSince(t0);
    ASSERT_EQ(written.size(), 1u);
    EXPECT_EQ(written[0].name, "Local");
    EXPECT_TRUE(store.categories().listWrittenSince(t0 + seconds(20)).empty());
}

TEST_F(SqliteLedgerTest, LatestChangeSpansEveryTable) {
    EXPECT_EQ(store.latestChange(), kEpoch);

    const auto t0 = parseTimestamp("2026-01-01T00:00:00Z");
    const auto cat = stored("Rent", t0);
    auto tx = test::transaction(cat.id, 100);
    tx.global_id = generateGlobalId();
    tx.updated_at = t0;
    tx.changed_at = t0 + minutes(5);
    store.transactions().upsertByLocalId(tx);

    EXPECT_EQ(store.categories().latestChange(), t0);
    EXPECT_EQ(store.latestChange(), t0 + minutes(5));
    EXPECT_EQ(store.nextChangeStamp(t0), t0 + minutes(5) + microseconds(1));
    EXPECT_EQ(store.nextChangeStamp(t0 + hours(1)), t0 + hours(1));
}

TEST_F(SqliteLedgerTest, SoftDeletedRowsAreHiddenOnlyFromActiveReads) {
    const auto keep = ledger::create(store, test::category("Keep"), clock);
    const auto gone = ledger::create(store, test::category("Gone"), clock);
    ASSERT_TRUE(ledger::softDelete<Category>(store, gone.id, clock));

    const auto active = store.categories().listActive();
    ASSERT_EQ(active.size(), 1u);
    EXPECT_EQ(active[0].id, keep.id);

    EXPECT_EQ(store.categories().listAll().size(), 2u);
    const auto found = store.categories().findByGlobalId(gone.global_id);
    ASSERT_TRUE(found);
    EXPECT_TRUE(found->is_deleted);
    EXPECT_EQ(store.categories().listChangedSince(gone.updated_at - microseconds(1)).size(), 1u);
}

TEST_F(SqliteLedgerTest, FindByGlobalIdPrefersHighestLocalId) {
    const auto gid = generateGlobalId();
    const auto t0 = parseTimestamp("2026-01-01T00:00:00Z");
    stored("First", t0, gid);
    const auto second = stored("Second", t0, gid);

    const auto found = store.categories().findByGlobalId(gid);
    ASSERT_TRUE(found);
    EXPECT_EQ(found->id, second.id);
    EXPECT_EQ(store.categoryLocalIds().at(gid), second.id);
}

TEST_F(SqliteLedgerTest, OwnersDoNotSeeEachOther) {
    ledger::sqlite::SqliteLedger alice(db, "alice");
    ledger::sqlite::SqliteLedger bob(db, "bob");
    ledger::create(alice, test::category("Rent"), clock);

    EXPECT_EQ(alice.categories().listAll().size(), 1u);
    EXPECT_TRUE(bob.categories().listAll().empty());
    EXPECT_TRUE(store.categories().listAll().empty());
}

TEST_F(SqliteLedgerTest, RollbackUndoesEveryWriteInScope) {
    EXPECT_THROW(store.runInTransaction([&] {
        ledger::create(store, test::category("Doomed"), clock);
        throw std::runtime_error("boom");
    }), std::runtime_error);

    EXPECT_TRUE(store.categories().listAll().empty());
}

TEST_F(SqliteLedgerTest, NestedScopeRollsBackAlone) {
    store.runInTransaction([&] {
        ledger::create(store, test::category("Outer"), clock);
        EXPECT_THROW(store.runInTransaction([&] {
            ledger::create(store, test::category("Inner"), clock);
            throw std::runtime_error("inner failure");
        }), std::runtime_error);
    });

    const auto all = store.categories().listAll();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].name, "Outer");
}

TEST_F(SqliteLedgerTest, RepointMovesChildrenAndRestampsThem) {
    const auto from = ledger::create(store, test::category("From"), clock);
    const auto to = ledger::create(store, test::category("To"), clock);
    const auto tx = ledger::create(store, test::transaction(from.id, 1250), clock);

    Budget b;
    b.category_id = from.id;
    b.amount_cents = 10000;
    b.month = 3;
    b.year = 2026;
    ledger::create(store, b, clock);

    const auto now = tx.updated_at + seconds(30);
    EXPECT_EQ(store.repointCategoryChildren(from.id, to.id, now), 2u);

    const auto moved = store.transactions().findByLocalId(tx.id);
    ASSERT_TRUE(moved);
    EXPECT_EQ(moved->category_id, to.id);
    EXPECT_EQ(moved->updated_at, now);
    EXPECT_EQ(moved->changed_at, now);
    EXPECT_EQ(store.budgets().listActive().at(0).category_id, to.id);
}

TEST_F(SqliteLedgerTest, RepointStillAdvancesAFutureStamp) {
    const auto from = ledger::create(store, test::category("From"), clock);
    const auto to = ledger::create(store, test::category("To"), clock);

    auto tx = test::transaction(from.id, 500);
    tx.global_id = generateGlobalId();
    tx.updated_at = parseTimestamp("2030-01-01T00:00:00Z");
    tx.changed_at = tx.updated_at;
    tx.id = store.transactions().upsertByLocalId(tx);

    store.repointCategoryChildren(from.id, to.id, parseTimestamp("2026-06-01T00:00:00Z"));
    EXPECT_EQ(store.transactions().findByLocalId(tx.id)->updated_at, tx.updated_at + microseconds(1));
}

TEST_F(SqliteLedgerTest, OptionalDatesSurviveStorage) {
    SavingsGoal g;
    g.name = "Trip";
    g.start_date = parseDate("2026-02-01");
    g.target_date = parseDate("2026-12-24");
    g = ledger::create(store, g, clock);

    const auto back = store.savingsGoals().findByLocalId(g.id);
    ASSERT_TRUE(back);
    ASSERT_TRUE(back->target_date);
    EXPECT_EQ(*back->target_date, parseDate("2026-12-24"));
    EXPECT_FALSE(back->last_auto_contribute_date);
    EXPECT_EQ(back->icon, "🎯");
}

TEST_F(SqliteLedgerTest, CursorRowPersistsPerOwner) {
    ledger::sqlite::SyncState device(db);
    ledger::sqlite::SyncState other(db, "other");
    EXPECT_FALSE(device.load());

    const auto t = parseTimestamp("2026-05-05T05:05:05.050505Z");
    device.save({t, t - hours(1)});
    device.save({t + seconds(1), t - minutes(30)});

    const auto cursor = device.load();
    ASSERT_TRUE(cursor);
    EXPECT_EQ(cursor->watermark, t + seconds(1));
    EXPECT_EQ(cursor->sent_through, t - minutes(30));
    EXPECT_FALSE(other.load());
}

TEST(SqliteSchemaTest, OlderSyncStateGainsTheOutboundMark) {
    auto db = std::make_shared<ledger::sqlite::Database>(":memory:");
    db->exec("CREATE TABLE sync_state (owner_id TEXT PRIMARY KEY, last_synced_at INTEGER NOT NULL)");
    const auto t = parseTimestamp("2026-05-05T05:05:05Z");
    db->exec("INSERT INTO sync_state (owner_id, last_synced_at) VALUES ('', " + std::to_string(toMicros(t)) + ")");

    ledger::sqlite::initSchema(*db);
    ledger::sqlite::initSchema(*db);

    const auto cursor = ledger::sqlite::SyncState(db).load();
    ASSERT_TRUE(cursor);
    EXPECT_EQ(cursor->watermark, t);
    EXPECT_EQ(cursor->sent_through, kEpoch);
}
