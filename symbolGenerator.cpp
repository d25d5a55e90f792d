#include "symbolGenerator.h"
#include <algorithm>
#include <cstdint>
#include <numeric>

WeightedSymbolGenerator::WeightedSymbolGenerator(const EngineConfig& config, std::shared_ptr<RandomSource> rng) :
    weights(config.algorithm.symbolWeights),
    goldenEligible(config.algorithm.symbolCount, false),
    goldenProbability(config.golden.goldenProbability),
    bonus(config.bonus),
    rng(std::move(rng)) {
        for (const auto& reel : weights) {
            // validate() caps each reel total at INT_MAX
            totals.push_back(static_cast<int>(std::accumulate(reel.begin(), reel.end(), std::int64_t(0))));
        }
        for (int id : config.golden.goldenEnabledSymbols) {
            if (id >= 0 && id < static_cast<int>(goldenEligible.size())) goldenEligible[id] = true;
        }
    }

int WeightedSymbolGenerator::drawSymbol(int reel, bool lean) {
    if (reel < 0 || reel >= static_cast<int>(weights.size())) return 0;
    int total = totals[reel];
    // degenerate strip: deterministic symbol 0
    if (total == 0) return 0;

    int r = rng->nextInt(0, total);
    if (lean) r = std::max(0, r - total / 10);

    // walk the cumulative prefix
    int cumulative = 0;
    const auto& reelWeights = weights[reel];
    for (int id = 0; id < static_cast<int>(reelWeights.size()); id++) {
        cumulative += reelWeights[id];
        if (r < cumulative) return id;
    }
    return 0;
}

bool WeightedSymbolGenerator::drawGolden(int symbolId) {
    if (symbolId < 0 || symbolId >= static_cast<int>(goldenEligible.size())) return false;
    if (!goldenEligible[symbolId]) return false;
    return rng->nextDouble() < goldenProbability;
}

std::optional<int> WeightedSymbolGenerator::drawSpecial() {
    if (!bonus.enabled) return std::nullopt;
    double r = rng->nextDouble();
    if (r < bonus.superProbability) return bonus.superSymbolId;
    if (r < bonus.superProbability + bonus.normalProbability) return bonus.normalSymbolId;
    return std::nullopt;
}
