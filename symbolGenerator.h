#pragma once
#include "config.h"
#include "randomSource.h"
#include <memory>
#include <optional>
#include <vector>

class WeightedSymbolGenerator {
private:
    std::vector<std::vector<int>> weights;   // [reel][symbol]
    std::vector<int> totals;                 // per-reel weight sums
    std::vector<bool> goldenEligible;        // by symbol id
    double goldenProbability;
    BonusConfig bonus;
    std::shared_ptr<RandomSource> rng;

public:
    WeightedSymbolGenerator(const EngineConfig& config, std::shared_ptr<RandomSource> rng);

    // weighted draw for one cell of the given reel; lean shifts the draw
    // toward the front of the weight table by 10% of the total weight
    int drawSymbol(int reel, bool lean = false);

    // independent second draw after the base id is chosen
    bool drawGolden(int symbolId);

    // initial-grid only: the bonus symbol placed in this cell, if any
    std::optional<int> drawSpecial();
};
