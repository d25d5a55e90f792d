#include "statistics.h"
#include <gtest/gtest.h>

TEST(SpinStatistics, EmptySnapshotIsZero) {
    SpinStatistics stats;
    StatisticsSnapshot s = stats.snapshot();
    EXPECT_FALSE(stats.hasWagers());
    EXPECT_EQ(s.totalSpins, 0);
    EXPECT_DOUBLE_EQ(s.currentRTP, 0.0);
    EXPECT_DOUBLE_EQ(s.hitFrequency, 0.0);
    EXPECT_DOUBLE_EQ(s.averageCascades, 0.0);
}

TEST(SpinStatistics, RecordAggregates) {
    SpinStatistics stats;
    stats.record(SpinRecord{100, 0, 0, 0, false});
    stats.record(SpinRecord{100, 50, 1, 0, false});
    stats.record(SpinRecord{100, 1500, 3, 2, true});
    stats.record(SpinRecord{100, 20000, 6, 1, false});

    StatisticsSnapshot s = stats.snapshot();
    EXPECT_TRUE(stats.hasWagers());
    EXPECT_EQ(s.totalSpins, 4);
    EXPECT_EQ(s.totalBet, 400);
    EXPECT_EQ(s.totalWin, 21550);
    EXPECT_DOUBLE_EQ(s.currentRTP, 21550.0 / 400.0);
    EXPECT_EQ(s.winCount, 3);
    EXPECT_DOUBLE_EQ(s.hitFrequency, 0.75);
    EXPECT_EQ(s.bigWins, 2);
    EXPECT_EQ(s.jackpots, 1);
    EXPECT_EQ(s.bonusTriggers, 1);
    EXPECT_EQ(s.wildsCreated, 3);
    EXPECT_DOUBLE_EQ(s.averageCascades, 2.5);
    EXPECT_EQ(s.maxCascadesHit, 6);
    EXPECT_EQ(s.cascadeDistribution.at(0), 1);
    EXPECT_EQ(s.cascadeDistribution.at(3), 1);
    EXPECT_EQ(s.cascadeDistribution.size(), 4u);
}

TEST(SpinStatistics, BigWinAndJackpotThresholdsAreStrict) {
    SpinStatistics stats;
    stats.record(SpinRecord{100, 1000, 1, 0, false});
    stats.record(SpinRecord{100, 10000, 1, 0, false});
    StatisticsSnapshot s = stats.snapshot();
    EXPECT_EQ(s.bigWins, 1);
    EXPECT_EQ(s.jackpots, 0);
}

TEST(SpinStatistics, ResetClearsEverything) {
    SpinStatistics stats;
    stats.record(SpinRecord{100, 300, 2, 1, true});
    stats.reset();
    StatisticsSnapshot s = stats.snapshot();
    EXPECT_EQ(s.totalSpins, 0);
    EXPECT_EQ(s.totalWin, 0);
    EXPECT_EQ(s.maxCascadesHit, 0);
    EXPECT_TRUE(s.cascadeDistribution.empty());
    EXPECT_FALSE(stats.hasWagers());
}
