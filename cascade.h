#pragma once
#include "config.h"
#include "grid.h"
#include "matching.h"
#include "randomSource.h"
#include "symbolGenerator.h"
#include "trigger.h"
#include "wildLifecycle.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

struct CascadeStep {
    int stepNumber = 0;                       // 1-based
    std::vector<MatchGroup> removedGroups;
    std::int64_t stepWin = 0;                 // pay-table units, multiplier applied
    double multiplier = 1.0;
    GridIds gridBefore;
    GridIds gridAfterRemove;
    GridIds gridAfter;
    std::vector<Position> newWilds;           // goldens converted this step
};

struct CascadeOutcome {
    GridIds initialGrid;
    GridIds finalGrid;
    std::vector<CascadeStep> steps;
    std::vector<GoldenSymbolInfo> goldenSymbols;
    std::vector<WildTransition> wildTransitions;
    std::vector<Position> wildPositions;
    std::int64_t rawWin = 0;
    int totalRemoved = 0;
    double finalMultiplier = 1.0;
    std::optional<BonusTrigger> bonusTrigger;
};

// generate -> match -> remove/convert -> gravity -> repeat, one spin at a time.
// holds no state across spins besides the generator's random handle.
class CascadeEngine {
private:
    EngineConfig config;
    WeightedSymbolGenerator generator;
    TriggerDetector detector;

public:
    CascadeEngine(const EngineConfig& config, std::shared_ptr<RandomSource> rng);

    // the only grid that can hold golden or bonus symbols. lean biases the
    // ordinary draws, nothing else
    Grid generateInitialGrid(bool lean, WildLifecycle& lifecycle);

    // cascades an already generated grid until no match or maxCascades steps
    CascadeOutcome run(Grid grid, WildLifecycle& lifecycle);

    // generateInitialGrid + run
    CascadeOutcome play(bool lean);

    // compact every reel toward the bottom and refill the top with plain draws
    void applyGravity(Grid& grid, WildLifecycle& lifecycle);

    // 1-based; 1.0 outside the configured table
    double cascadeMultiplier(int step) const;

    const EngineConfig& getConfig() const { return config; }
};
