#include <gtest/gtest.h>
#include "core/stats_ledger.hpp"
#include <thread>
#include <vector>

TEST(StatsLedgerTest, StartsAtZero)
{
    StatsLedger ledger;
    LedgerSnapshot snapshot = ledger.snapshot();
    EXPECT_EQ(snapshot, (LedgerSnapshot{0, 0, 0, 0}));
    EXPECT_TRUE(snapshot.isBalanced());
}

TEST(StatsLedgerTest, EachOutcomeIncrementsExactlyOneCounter)
{
    StatsLedger ledger;
    ledger.setTotal(3);
    ledger.record(ItemOutcome::success("a.mp3"));
    ledger.record(ItemOutcome::failure("b.mp3", "boom"));
    ledger.record(ItemOutcome::skipped("c.mp3"));

    LedgerSnapshot snapshot = ledger.snapshot();
    EXPECT_EQ(snapshot, (LedgerSnapshot{3, 1, 1, 1}));
    EXPECT_TRUE(snapshot.isBalanced());
}

TEST(StatsLedgerTest, ConcurrentRecordsAreNotLost)
{
    StatsLedger ledger;
    ledger.setTotal(800);

    std::vector<std::thread> workers;
    for (int t = 0; t < 8; ++t)
    {
        workers.emplace_back([&ledger, t]()
                             {
            for (int i = 0; i < 100; ++i)
            {
                if (t % 2 == 0)
                    ledger.record(ItemOutcome::success("x"));
                else
                    ledger.record(ItemOutcome::skipped("y"));
            } });
    }
    for (auto &worker : workers)
    {
        worker.join();
    }

    LedgerSnapshot snapshot = ledger.snapshot();
    EXPECT_EQ(snapshot.successful, 400u);
    EXPECT_EQ(snapshot.skipped, 400u);
    EXPECT_TRUE(snapshot.isBalanced());
}

TEST(StatsLedgerTest, SnapshotSerializesToJsonAndText)
{
    LedgerSnapshot snapshot{5, 4, 1, 0};
    nlohmann::json doc = snapshot.toJson();
    EXPECT_EQ(doc["total"], 5);
    EXPECT_EQ(doc["successful"], 4);
    EXPECT_EQ(doc["failed"], 1);
    EXPECT_EQ(doc["skipped"], 0);
    EXPECT_EQ(snapshot.toString(), "{total: 5, successful: 4, failed: 1, skipped: 0}");
}
