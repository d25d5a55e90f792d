#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <vector>

enum class MatchMode { Ways, Adjacency };

enum class ControllerKind { Dynamic, Fixed };

struct AlgorithmConfig {
    int reelCount = 5;
    int rowCount = 4;
    int symbolCount = 8;

    // [reel][symbol id] = weight
    std::vector<std::vector<int>> symbolWeights;
    // symbol id -> payout by length (ways) or group size (adjacency), index = n - 1
    std::map<int, std::vector<std::int64_t>> payTable;

    double targetRTP = 0.96;
    double minRTP = 0.96 * 0.85;
    double maxRTP = 0.96 * 1.15;

    std::int64_t minBet = 10;
    std::int64_t maxBet = 10000;
    // pay table values are credits per betUnit wagered
    std::int64_t betUnit = 100;

    ControllerKind controller = ControllerKind::Dynamic;
};

struct CascadeConfig {
    int gridWidth = 5;
    int gridHeight = 4;
    int minMatch = 3;
    int maxCascades = 10;
    std::vector<double> cascadeMultipliers = {1.0, 2.0, 3.0, 5.0, 8.0, 12.0, 18.0, 25.0, 35.0, 50.0};
    // 4-neighbour flood fill only; false adds diagonals
    bool adjacentOnly = true;
    MatchMode matchMode = MatchMode::Ways;
};

struct GoldenWildConfig {
    double goldenProbability = 0.12;
    std::vector<int> goldenEnabledSymbols = {0, 1, 2, 3, 4};
    int wildSymbolId = -1;
};

struct BonusConfig {
    bool enabled = true;

    int normalSymbolId = 9;
    double normalProbability = 0.02;
    int normalRequired = 3;
    int normalFreeRounds = 15;
    int extraRoundsPerSymbol = 5;
    double normalMultiplier = 1.5;

    int superSymbolId = 10;
    double superProbability = 0.01;
    int superRequired = 5;
    int superFreeRounds = 30;
    double superMultiplier = 3.0;
    std::int64_t superBonusPool = 10000;
};

struct EngineConfig {
    AlgorithmConfig algorithm;
    CascadeConfig cascade;
    GoldenWildConfig golden;
    BonusConfig bonus;
};

AlgorithmConfig defaultAlgorithmConfig();
CascadeConfig defaultCascadeConfig();
GoldenWildConfig defaultGoldenWildConfig();
BonusConfig defaultBonusConfig();
EngineConfig defaultEngineConfig();

// throws ConfigError describing the first violated rule
void validate(const EngineConfig& config);

// key=value overrides used by the simulator; unknown keys throw ConfigError
void applyOverrides(EngineConfig& config, const std::map<std::string, double>& overrides);

// true for ids in [0, symbolCount)
bool isOrdinarySymbol(const AlgorithmConfig& config, int symbolId);
