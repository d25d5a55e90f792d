#include "config.h"
#include "testGrids.h"
#include "trigger.h"
#include <gtest/gtest.h>

TEST(TriggerDetector, ThreeNormalSymbolsTriggerFifteenRounds) {
    BonusConfig bonus = defaultBonusConfig();
    TriggerDetector detector(bonus, -1);
    Grid grid = gridFromIds({
        {9, 1, 2, 3, 4},
        {5, 9, 6, 7, 0},
        {1, 2, 3, 9, 5},
        {6, 7, 0, 1, 2},
    });
    auto trigger = detector.detect(grid);
    ASSERT_TRUE(trigger.has_value());
    EXPECT_EQ(trigger->type, TriggerType::Normal);
    EXPECT_EQ(trigger->symbolId, 9);
    EXPECT_EQ(trigger->symbolCount, 3);
    EXPECT_EQ(trigger->freeRounds, 15);
    EXPECT_DOUBLE_EQ(trigger->multiplier, 1.5);
    EXPECT_EQ(trigger->positions.size(), 3u);
    EXPECT_EQ(trigger->triggerGrid[0][0], 9);
}

TEST(TriggerDetector, ExtraNormalSymbolsAddRounds) {
    TriggerDetector detector(defaultBonusConfig(), -1);
    Grid grid = gridFromIds({
        {9, 9, 9, 9, 9},
        {1, 2, 3, 4, 5},
        {1, 2, 3, 4, 5},
        {1, 2, 3, 4, 5},
    });
    auto trigger = detector.detect(grid);
    ASSERT_TRUE(trigger.has_value());
    EXPECT_EQ(trigger->freeRounds, 25);
}

TEST(TriggerDetector, SuperOutranksNormal) {
    TriggerDetector detector(defaultBonusConfig(), -1);
    Grid grid = gridFromIds({
        {10, 10, 10, 10, 10},
        {9, 9, 9, 1, 2},
        {1, 2, 3, 4, 5},
        {1, 2, 3, 4, 5},
    });
    auto trigger = detector.detect(grid);
    ASSERT_TRUE(trigger.has_value());
    EXPECT_EQ(trigger->type, TriggerType::Super);
    EXPECT_EQ(trigger->freeRounds, 30);
    EXPECT_DOUBLE_EQ(trigger->multiplier, 3.0);
    EXPECT_EQ(trigger->bonusPool, 10000);
}

TEST(TriggerDetector, BelowThresholdOrDisabledIsNothing) {
    BonusConfig bonus = defaultBonusConfig();
    Grid grid = gridFromIds({
        {9, 9, 1, 10, 10},
        {1, 2, 3, 4, 5},
        {1, 2, 3, 4, 5},
        {W, W, W, W, W},
    });
    EXPECT_FALSE(TriggerDetector(bonus, -1).detect(grid).has_value());

    bonus.enabled = false;
    Grid full = gridFromIds({
        {9, 9, 9, 9, 9},
        {1, 2, 3, 4, 5},
        {1, 2, 3, 4, 5},
    });
    EXPECT_FALSE(TriggerDetector(bonus, -1).detect(full).has_value());
}

TEST(TriggerDetector, CountsBothBonusSymbols) {
    TriggerDetector detector(defaultBonusConfig(), -1);
    Grid grid = gridFromIds({
        {9, 10, 1},
        {10, 2, 9},
        {3, 10, 4},
    });
    auto counts = detector.countTriggerSymbols(grid);
    EXPECT_EQ(counts[9], 2);
    EXPECT_EQ(counts[10], 3);
    EXPECT_EQ(counts.size(), 2u);
}
