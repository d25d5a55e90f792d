#pragma once
#include "config.h"
#include "grid.h"
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

enum class TriggerType { None, Normal, Super };

struct BonusTrigger {
    TriggerType type = TriggerType::None;
    int symbolId = 0;
    int symbolCount = 0;
    std::vector<Position> positions;
    int freeRounds = 0;
    double multiplier = 1.0;
    std::int64_t bonusPool = 0;
    GridIds triggerGrid;
};

class TriggerDetector {
private:
    BonusConfig config;
    int sentinel;

public:
    TriggerDetector(const BonusConfig& config, int sentinel);

    // super outranks normal; nothing when disabled or under threshold
    std::optional<BonusTrigger> detect(const Grid& grid) const;

    // bonus symbol id -> occurrences
    std::map<int, int> countTriggerSymbols(const Grid& grid) const;
};
