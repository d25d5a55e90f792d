#include "testGrids.h"
#include "wildLifecycle.h"
#include <gtest/gtest.h>

namespace {

MatchGroup group(int symbol, std::vector<Position> positions) {
    MatchGroup g;
    g.symbolId = symbol;
    g.count = static_cast<int>(positions.size());
    g.positions = std::move(positions);
    return g;
}

}

TEST(WildTracker, RelocateRekeysEveryLookup) {
    WildTracker tracker;
    tracker.beginStep();
    tracker.registerWild(Position{1, 2}, 3);
    tracker.relocate(Position{1, 2}, Position{3, 2});
    EXPECT_FALSE(tracker.isActive(Position{1, 2}));
    EXPECT_TRUE(tracker.isActive(Position{3, 2}));
    EXPECT_EQ(tracker.sourceOf(Position{3, 2}), 3);
    EXPECT_EQ(tracker.sourceOf(Position{1, 2}), -1);
    EXPECT_EQ(tracker.getNewWilds().count(Position{3, 2}), 1u);
    EXPECT_EQ(tracker.size(), 1u);
}

TEST(WildTracker, RemoveReportsWhetherAnythingWasTracked) {
    WildTracker tracker;
    tracker.registerWild(Position{0, 0}, 1);
    EXPECT_TRUE(tracker.remove(Position{0, 0}));
    EXPECT_FALSE(tracker.remove(Position{0, 0}));
    EXPECT_EQ(tracker.size(), 0u);
}

TEST(WildLifecycle, ConsumedGoldenBecomesWildNotEmpty) {
    Grid grid = gridFromIds({
        {5, 6, 7, 1, 2},
        {0, 0, 0, 3, 4},
        {1, 2, 3, 4, 5},
        {2, 3, 4, 5, 6},
    });
    WildLifecycle lifecycle;
    grid.at(1, 2).goldenIndex = lifecycle.addGolden(Position{1, 2}, 0);

    auto converted = lifecycle.removeMatched(grid, {group(0, {{1, 0}, {1, 1}, {1, 2}})}, 1);

    ASSERT_EQ(converted.size(), 1u);
    EXPECT_EQ(converted[0], (Position{1, 2}));
    EXPECT_TRUE(grid.at(1, 2).isWild());
    EXPECT_TRUE(grid.at(1, 0).isEmpty());
    EXPECT_TRUE(grid.at(1, 1).isEmpty());

    ASSERT_EQ(lifecycle.getTransitions().size(), 1u);
    const WildTransition& t = lifecycle.getTransitions()[0];
    EXPECT_EQ(t.step, 1);
    EXPECT_TRUE(t.toWild);
    EXPECT_EQ(t.fromSymbol, 0);
    EXPECT_EQ(t.position, (Position{1, 2}));

    EXPECT_TRUE(lifecycle.getGoldens()[0].becameWild);
    EXPECT_TRUE(lifecycle.getTracker().isActive(Position{1, 2}));
    EXPECT_EQ(lifecycle.getTracker().sourceOf(Position{1, 2}), 0);
}

TEST(WildLifecycle, WildIsRemovedOnlyByALaterMatchAndNeverRecreated) {
    Grid grid = gridFromIds({
        {0, 0, 0},
        {1, 2, 3},
        {4, 5, 6},
    });
    WildLifecycle lifecycle;
    grid.at(0, 1).goldenIndex = lifecycle.addGolden(Position{0, 1}, 0);

    lifecycle.removeMatched(grid, {group(0, {{0, 0}, {0, 1}, {0, 2}})}, 1);
    ASSERT_TRUE(grid.at(0, 1).isWild());

    // the wild takes part in a second match and is cleared
    lifecycle.removeMatched(grid, {group(2, {{0, 1}, {1, 1}})}, 2);
    EXPECT_TRUE(grid.at(0, 1).isEmpty());
    EXPECT_FALSE(lifecycle.getTracker().isActive(Position{0, 1}));

    int toWild = 0;
    int disappeared = 0;
    for (const auto& t : lifecycle.getTransitions()) {
        if (t.toWild) toWild++;
        if (t.disappeared) {
            disappeared++;
            EXPECT_EQ(t.step, 2);
            EXPECT_TRUE(t.usedInMatch);
            EXPECT_EQ(t.fromSymbol, 0);
        }
    }
    EXPECT_EQ(toWild, 1);
    EXPECT_EQ(disappeared, 1);
}

TEST(WildLifecycle, SharedCellIsConvertedOnce) {
    Grid grid = gridFromIds({
        {0, 0, 0},
        {1, 0, 3},
        {4, 0, 6},
    });
    WildLifecycle lifecycle;
    grid.at(0, 1).goldenIndex = lifecycle.addGolden(Position{0, 1}, 0);
    auto converted = lifecycle.removeMatched(grid, {
        group(0, {{0, 0}, {0, 1}, {0, 2}}),
        group(0, {{0, 1}, {1, 1}, {2, 1}}),
    }, 1);
    EXPECT_EQ(converted.size(), 1u);
    EXPECT_EQ(lifecycle.getTransitions().size(), 1u);
    EXPECT_EQ(grid.countEmpty(), 4);
}

TEST(WildLifecycle, NewWildsTrackOnlyTheCurrentStep) {
    Grid grid = gridFromIds({
        {0, 0, 0},
        {1, 1, 1},
        {4, 5, 6},
    });
    WildLifecycle lifecycle;
    grid.at(0, 0).goldenIndex = lifecycle.addGolden(Position{0, 0}, 0);
    lifecycle.removeMatched(grid, {group(0, {{0, 0}, {0, 1}, {0, 2}})}, 1);
    EXPECT_EQ(lifecycle.getTracker().getNewWilds().size(), 1u);

    lifecycle.removeMatched(grid, {group(1, {{1, 0}, {1, 1}, {1, 2}})}, 2);
    EXPECT_TRUE(lifecycle.getTracker().getNewWilds().empty());
    EXPECT_EQ(lifecycle.getTracker().size(), 1u);
}

TEST(WildLifecycle, GravityMoveRekeysTracker) {
    WildLifecycle lifecycle;
    Grid grid = gridFromIds({
        {0, 0, 0},
        {1, 2, 3},
        {4, 5, 6},
    });
    grid.at(0, 2).goldenIndex = lifecycle.addGolden(Position{0, 2}, 0);
    lifecycle.removeMatched(grid, {group(0, {{0, 0}, {0, 1}, {0, 2}})}, 1);
    lifecycle.onWildMoved(Position{0, 2}, Position{2, 2});
    EXPECT_TRUE(lifecycle.getTracker().isActive(Position{2, 2}));
    EXPECT_EQ(lifecycle.getTracker().positions(), (std::vector<Position>{{2, 2}}));
}
