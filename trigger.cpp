#include "trigger.h"

TriggerDetector::TriggerDetector(const BonusConfig& config, int sentinel) :
    config(config),
    sentinel(sentinel) {}

std::map<int, int> TriggerDetector::countTriggerSymbols(const Grid& grid) const {
    std::map<int, int> counts;
    for (int row = 0; row < grid.getHeight(); row++) {
        for (int reel = 0; reel < grid.getWidth(); reel++) {
            const Cell& c = grid.at(row, reel);
            if (!c.isSymbol()) continue;
            if (c.symbol == config.normalSymbolId || c.symbol == config.superSymbolId) counts[c.symbol]++;
        }
    }
    return counts;
}

std::optional<BonusTrigger> TriggerDetector::detect(const Grid& grid) const {
    if (!config.enabled) return std::nullopt;

    auto collect = [&](int symbolId) {
        std::vector<Position> out;
        for (int row = 0; row < grid.getHeight(); row++) {
            for (int reel = 0; reel < grid.getWidth(); reel++) {
                const Cell& c = grid.at(row, reel);
                if (c.isSymbol() && c.symbol == symbolId) out.push_back(Position{row, reel});
            }
        }
        return out;
    };

    auto superPositions = collect(config.superSymbolId);
    if (static_cast<int>(superPositions.size()) >= config.superRequired) {
        BonusTrigger t;
        t.type = TriggerType::Super;
        t.symbolId = config.superSymbolId;
        t.symbolCount = static_cast<int>(superPositions.size());
        t.positions = std::move(superPositions);
        t.freeRounds = config.superFreeRounds;
        t.multiplier = config.superMultiplier;
        t.bonusPool = config.superBonusPool;
        t.triggerGrid = grid.toIds(sentinel);
        return t;
    }

    auto normalPositions = collect(config.normalSymbolId);
    int count = static_cast<int>(normalPositions.size());
    if (count >= config.normalRequired) {
        BonusTrigger t;
        t.type = TriggerType::Normal;
        t.symbolId = config.normalSymbolId;
        t.symbolCount = count;
        t.positions = std::move(normalPositions);
        // every symbol past the requirement adds rounds
        t.freeRounds = config.normalFreeRounds + (count - config.normalRequired) * config.extraRoundsPerSymbol;
        t.multiplier = config.normalMultiplier;
        t.bonusPool = 0;
        t.triggerGrid = grid.toIds(sentinel);
        return t;
    }
    return std::nullopt;
}
