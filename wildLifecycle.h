#pragma once
#include "grid.h"
#include "matching.h"
#include <map>
#include <set>
#include <vector>

struct GoldenSymbolInfo {
    Position position;      // where it was drawn in the initial grid
    int originalId = 0;
    bool isGolden = true;
    bool becameWild = false;
};

struct WildTransition {
    int step = 0;
    Position position;
    int fromSymbol = 0;
    bool toWild = false;
    bool usedInMatch = false;
    bool disappeared = false;
};

// active wild positions, the symbol each wild came from, and the wilds
// created during the step in progress
class WildTracker {
private:
    std::map<Position, Position> activeWilds;
    std::map<Position, int> wildSources;
    std::set<Position> newWilds;

public:
    void beginStep() { newWilds.clear(); }
    void registerWild(const Position& pos, int sourceSymbol);
    // gravity moved a wild within its reel
    void relocate(const Position& from, const Position& to);
    // a matched wild was cleared; false when nothing was tracked there
    bool remove(const Position& pos);

    bool isActive(const Position& pos) const { return activeWilds.count(pos) != 0; }
    int sourceOf(const Position& pos) const;
    std::vector<Position> positions() const;
    const std::set<Position>& getNewWilds() const { return newWilds; }
    size_t size() const { return activeWilds.size(); }
};

// golden -> wild conversion for one spin
class WildLifecycle {
private:
    WildTracker tracker;
    std::vector<GoldenSymbolInfo> goldens;
    std::vector<WildTransition> transitions;

public:
    // returns the index stored in the cell's goldenIndex
    int addGolden(const Position& pos, int originalId);

    // removal pass for one step. golden cells in a match become wilds and
    // stay; every other matched cell becomes empty. conversion finishes
    // before any cell is emptied. returns the converted positions.
    std::vector<Position> removeMatched(Grid& grid, const std::vector<MatchGroup>& matches, int step);

    void onWildMoved(const Position& from, const Position& to);

    const WildTracker& getTracker() const { return tracker; }
    const std::vector<GoldenSymbolInfo>& getGoldens() const { return goldens; }
    const std::vector<WildTransition>& getTransitions() const { return transitions; }
};
