#include <gtest/gtest.h>
#include "support/Harness.hpp"

#include <algorithm>
#include <set>

using namespace tally;
using namespace tally::sync;
using namespace tally::types;
using namespace std::chrono;

class ScenarioTest : public ::testing::Test {
protected:
    test::ManualClock clock;
    test::ServerHarness server{clock};
    test::Device a{server, clock};
    test::Device b{server, clock};

    static std::set<std::string> names(const std::vector<Category>& cats) {
        std::set<std::string> out;
        for (const auto& c : cats) out.insert(c.name);
        return out;
    }

    static std::set<GlobalId> ids(const std::vector<Category>& cats) {
        std::set<GlobalId> out;
        for (const auto& c : cats) out.insert(c.global_id);
        return out;
    }

    void syncAll() {
        ASSERT_EQ(a.sync(), SyncResult::Completed);
        ASSERT_EQ(b.sync(), SyncResult::Completed);
        ASSERT_EQ(a.sync(), SyncResult::Completed);
    }
};

TEST_F(ScenarioTest, RecordsReachTheOtherDevice) {
    const auto rent = a.create(test::category("Rent"));
    a.create(test::transaction(rent.id, 150000, "March rent"));

    syncAll();

    const auto cats = b.active<Category>();
    ASSERT_EQ(cats.size(), 1u);
    EXPECT_EQ(cats[0].global_id, rent.global_id);

    const auto txs = b.active<Transaction>();
    ASSERT_EQ(txs.size(), 1u);
    EXPECT_EQ(txs[0].description, "March rent");
    EXPECT_EQ(txs[0].category_id, cats[0].id);
}

TEST_F(ScenarioTest, LastWriteWins) {
    const auto rent = a.create(test::category("Rent"));
    syncAll();

    auto onA = rent;
    onA.name = "Rent (A)";
    a.update(onA);

    auto onB = *b.byGlobalId<Category>(rent.global_id);
    onB.name = "Rent (B)";
    onB.default_budget_cents = 99000;
    b.update(onB);

    syncAll();
    ASSERT_EQ(b.sync(), SyncResult::Completed);

    for (auto* device : {&a, &b}) {
        const auto c = device->byGlobalId<Category>(rent.global_id);
        ASSERT_TRUE(c);
        EXPECT_EQ(c->name, "Rent (B)");
        EXPECT_EQ(c->default_budget_cents, 99000);
    }
    server.inspect("owner-1", [&](ledger::ChangeLedger& l) {
        EXPECT_EQ(l.categories().findByGlobalId(rent.global_id)->name, "Rent (B)");
    });
}

TEST_F(ScenarioTest, DeletionPropagates) {
    const auto rent = a.create(test::category("Rent"));
    syncAll();
    ASSERT_EQ(b.active<Category>().size(), 1u);

    const auto onB = b.byGlobalId<Category>(rent.global_id);
    ASSERT_TRUE(b.remove<Category>(onB->id));
    ASSERT_EQ(b.sync(), SyncResult::Completed);
    ASSERT_EQ(a.sync(), SyncResult::Completed);

    EXPECT_TRUE(a.active<Category>().empty());
    const auto onA = a.byGlobalId<Category>(rent.global_id);
    ASSERT_TRUE(onA);
    EXPECT_TRUE(onA->is_deleted);
}

TEST_F(ScenarioTest, SeededDefaultsCollapseAcrossDevices) {
    ASSERT_TRUE(ledger::seedDefaults(a.local, clock));
    ASSERT_EQ(a.sync(), SyncResult::Completed);

    ASSERT_TRUE(ledger::seedDefaults(b.local, clock));
    ASSERT_EQ(b.sync(), SyncResult::Completed);
    ASSERT_EQ(a.sync(), SyncResult::Completed);

    const auto onA = a.active<Category>();
    const auto onB = b.active<Category>();
    EXPECT_EQ(onA.size(), 10u);
    EXPECT_EQ(onB.size(), 10u);
    EXPECT_EQ(ids(onA), ids(onB));
    EXPECT_EQ(names(onA), names(onB));
    EXPECT_EQ(a.active<Settings>().size(), 1u);
    EXPECT_EQ(b.active<Settings>().size(), 1u);

    server.inspect("owner-1", [](ledger::ChangeLedger& l) {
        EXPECT_EQ(l.categories().listActive().size(), 10u);
        EXPECT_EQ(l.categories().listAll().size(), 20u);
        EXPECT_EQ(l.settings().listActive().size(), 1u);
    });
}

TEST_F(ScenarioTest, ChildrenFollowTheSurvivingCategory) {
    const auto rentA = a.create(test::category("Rent"));
    const auto tx = a.create(test::transaction(rentA.id, 120000, "rent"));
    ASSERT_EQ(a.sync(), SyncResult::Completed);

    // created independently on B, so it is newer and survives
    const auto rentB = b.create(test::category("rent"));
    ASSERT_EQ(b.sync(), SyncResult::Completed);
    ASSERT_EQ(a.sync(), SyncResult::Completed);

    const auto active = a.active<Category>();
    ASSERT_EQ(active.size(), 1u);
    EXPECT_EQ(active[0].global_id, rentB.global_id);

    const auto moved = a.local.transactions().findByGlobalId(tx.global_id);
    ASSERT_TRUE(moved);
    EXPECT_EQ(moved->category_id, active[0].id);

    const auto onB = b.local.transactions().findByGlobalId(tx.global_id);
    ASSERT_TRUE(onB);
    EXPECT_EQ(onB->category_id, b.byGlobalId<Category>(rentB.global_id)->id);
}

TEST_F(ScenarioTest, OfflineEditsSyncLater) {
    a.transport.offline = true;
    const auto rent = a.create(test::category("Rent"));
    EXPECT_EQ(a.sync(), SyncResult::TransportFailed);
    EXPECT_EQ(a.agent.watermark(), util::kEpoch);

    a.transport.offline = false;
    syncAll();
    EXPECT_TRUE(b.byGlobalId<Category>(rent.global_id));
}

TEST_F(ScenarioTest, QuietRoundTripsSendNothing) {
    a.create(test::category("Rent"));
    syncAll();

    ASSERT_EQ(a.sync(), SyncResult::Completed);
    EXPECT_TRUE(a.transport.lastRequest.client_changes.empty());
    ASSERT_EQ(b.sync(), SyncResult::Completed);
    EXPECT_TRUE(b.transport.lastRequest.client_changes.empty());
}

TEST_F(ScenarioTest, OrphanedChildLandsInTheFallbackEverywhere) {
    a.create(test::transaction(kNoLocalId, 700, "mystery"));
    syncAll();
    ASSERT_EQ(b.sync(), SyncResult::Completed);

    for (auto* device : {&a, &b}) {
        const auto cats = device->active<Category>();
        ASSERT_EQ(cats.size(), 1u);
        EXPECT_EQ(cats[0].name, "Uncategorized");
        const auto txs = device->active<Transaction>();
        ASSERT_EQ(txs.size(), 1u);
        EXPECT_EQ(txs[0].category_id, cats[0].id);
    }
}

TEST_F(ScenarioTest, EditDuringARoundTripReachesTheOtherDevice) {
    auto rent = a.create(test::category("Rent"));
    a.transport.whileInFlight = [&, done = false]() mutable {
        if (done) return;
        done = true;
        rent.name = "Rent edited";
        rent = a.update(rent);
    };

    syncAll();
    syncAll();

    EXPECT_EQ(b.byGlobalId<Category>(rent.global_id)->name, "Rent edited");
    server.inspect("owner-1", [&](ledger::ChangeLedger& l) {
        EXPECT_EQ(l.categories().findByGlobalId(rent.global_id)->name, "Rent edited");
    });
}

// Devices whose clock runs behind the server's.
class SlowDeviceClockTest : public ::testing::Test {
protected:
    test::ManualClock serverClock;
    test::ManualClock deviceClock{serverClock.peek() - seconds(30)};
    test::ServerHarness server{serverClock};
    test::Device a{server, deviceClock};
    test::Device b{server, deviceClock};
};

TEST_F(SlowDeviceClockTest, EditAfterASyncStillPropagates) {
    auto rent = a.create(test::category("Rent"));
    ASSERT_EQ(a.sync(), SyncResult::Completed);

    rent.name = "Rent edited";
    rent = a.update(rent);
    ASSERT_LT(rent.updated_at, a.agent.watermark());

    for (int i = 0; i < 3; ++i) {
        ASSERT_EQ(a.sync(), SyncResult::Completed);
        ASSERT_EQ(b.sync(), SyncResult::Completed);
    }

    EXPECT_EQ(b.byGlobalId<Category>(rent.global_id)->name, "Rent edited");
    server.inspect("owner-1", [&](ledger::ChangeLedger& l) {
        EXPECT_EQ(l.categories().findByGlobalId(rent.global_id)->name, "Rent edited");
    });

    ASSERT_EQ(a.sync(), SyncResult::Completed);
    EXPECT_TRUE(a.transport.lastRequest.client_changes.empty());
}
