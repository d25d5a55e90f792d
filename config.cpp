#include "config.h"
#include "errors.h"
#include <climits>
#include <cmath>
#include <numeric>
#include <set>

AlgorithmConfig defaultAlgorithmConfig() {
    AlgorithmConfig config;
    // uniform strips: every ordinary symbol weighted 10 on every reel
    config.symbolWeights.assign(config.reelCount, std::vector<int>(config.symbolCount, 10));
    // credits per 100 wagered, ways length 3/4/5 (lengths 1 and 2 never pay)
    config.payTable = {
        {0, {0, 0, 4, 11, 33}},
        {1, {0, 0, 4, 11, 33}},
        {2, {0, 0, 7, 16, 41}},
        {3, {0, 0, 7, 16, 41}},
        {4, {0, 0, 8, 25, 66}},
        {5, {0, 0, 11, 33, 82}},
        {6, {0, 0, 16, 50, 121}},
        {7, {0, 0, 25, 66, 165}},
    };
    return config;
}

CascadeConfig defaultCascadeConfig() {
    return CascadeConfig{};
}

GoldenWildConfig defaultGoldenWildConfig() {
    return GoldenWildConfig{};
}

BonusConfig defaultBonusConfig() {
    return BonusConfig{};
}

EngineConfig defaultEngineConfig() {
    EngineConfig config;
    config.algorithm = defaultAlgorithmConfig();
    config.cascade = defaultCascadeConfig();
    config.golden = defaultGoldenWildConfig();
    config.bonus = defaultBonusConfig();
    return config;
}

bool isOrdinarySymbol(const AlgorithmConfig& config, int symbolId) {
    return symbolId >= 0 && symbolId < config.symbolCount;
}

static void require(bool ok, const std::string& message) {
    if (!ok) throw ConfigError(message);
}

static bool isProbability(double p) {
    return p >= 0.0 && p <= 1.0;
}

static void validateAlgorithm(const AlgorithmConfig& a) {
    require(a.reelCount >= 3 && a.reelCount <= 7, "reel count must be in [3,7]");
    require(a.rowCount >= 3 && a.rowCount <= 6, "row count must be in [3,6]");
    require(a.symbolCount >= 1, "symbol count must be positive");
    require(static_cast<int>(a.symbolWeights.size()) == a.reelCount,
            "symbol weight tables (" + std::to_string(a.symbolWeights.size()) +
            ") do not match reel count (" + std::to_string(a.reelCount) + ")");
    for (const auto& reel : a.symbolWeights) {
        require(static_cast<int>(reel.size()) == a.symbolCount,
                "each weight table needs one weight per symbol");
        for (int w : reel) require(w >= 0, "symbol weights must be non-negative");
        // draws are made in int
        std::int64_t total = std::accumulate(reel.begin(), reel.end(), std::int64_t(0));
        require(total <= INT_MAX, "reel weight total " + std::to_string(total) + " exceeds " +
                std::to_string(INT_MAX));
    }
    require(!a.payTable.empty(), "pay table is empty");
    for (const auto& kv : a.payTable) {
        require(isOrdinarySymbol(a, kv.first),
                "pay table entry for non-ordinary symbol " + std::to_string(kv.first));
        require(!kv.second.empty(), "pay table row for symbol " + std::to_string(kv.first) + " is empty");
        for (auto p : kv.second) require(p >= 0, "pay table values must be non-negative");
    }
    require(a.targetRTP >= 0.8 && a.targetRTP <= 0.99, "target RTP must be in [0.8,0.99]");
    require(a.minRTP <= a.targetRTP && a.targetRTP <= a.maxRTP, "target RTP outside [minRTP,maxRTP]");
    require(a.minBet > 0 && a.minBet <= a.maxBet, "bet limits must satisfy 0 < minBet <= maxBet");
    require(a.betUnit > 0, "bet unit must be positive");
}

static void validateCascade(const CascadeConfig& c, const AlgorithmConfig& a) {
    require(c.gridWidth == a.reelCount && c.gridHeight == a.rowCount,
            "grid dimensions do not match reel/row counts");
    require(c.minMatch >= 2, "minimum match size must be at least 2");
    require(c.maxCascades >= 1 && c.maxCascades <= 100, "max cascades must be in [1,100]");
    for (double m : c.cascadeMultipliers) require(m > 0.0, "cascade multipliers must be positive");
}

static void validateSpecialIds(const EngineConfig& config) {
    const auto& a = config.algorithm;
    const auto& g = config.golden;
    const auto& b = config.bonus;
    require(isProbability(g.goldenProbability), "golden probability must be in [0,1]");
    for (int id : g.goldenEnabledSymbols) {
        require(isOrdinarySymbol(a, id), "golden-enabled symbol " + std::to_string(id) + " is not ordinary");
    }
    require(!isOrdinarySymbol(a, g.wildSymbolId), "wild id collides with an ordinary symbol");
    if (!b.enabled) return;
    std::set<int> ids = {g.wildSymbolId, b.normalSymbolId, b.superSymbolId};
    require(ids.size() == 3, "wild and bonus symbol ids must be distinct");
    require(!isOrdinarySymbol(a, b.normalSymbolId) && !isOrdinarySymbol(a, b.superSymbolId),
            "bonus ids collide with ordinary symbols");
    require(isProbability(b.normalProbability) && isProbability(b.superProbability) &&
            b.normalProbability + b.superProbability <= 1.0,
            "bonus probabilities must be in [0,1] and sum to at most 1");
    require(b.normalRequired >= 1 && b.superRequired >= 1, "bonus trigger counts must be positive");
    require(b.normalFreeRounds > 0 && b.superFreeRounds > 0, "bonus free rounds must be positive");
    require(b.normalMultiplier > 0.0 && b.superMultiplier > 0.0, "bonus multipliers must be positive");
}

void validate(const EngineConfig& config) {
    validateAlgorithm(config.algorithm);
    validateCascade(config.cascade, config.algorithm);
    validateSpecialIds(config);
}

// overrides arrive as doubles; reject values the target field cannot hold
static int overrideInt(const std::string& key, double val) {
    if (!std::isfinite(val) || val < INT_MIN || val > INT_MAX) {
        throw ConfigError("override '" + key + "' out of range");
    }
    return static_cast<int>(val);
}

static std::int64_t overrideInt64(const std::string& key, double val) {
    // 2^63 is exactly representable, INT64_MAX is not
    if (!std::isfinite(val) || val < -9223372036854775808.0 || val >= 9223372036854775808.0) {
        throw ConfigError("override '" + key + "' out of range");
    }
    return static_cast<std::int64_t>(val);
}

void applyOverrides(EngineConfig& config, const std::map<std::string, double>& overrides) {
    for (const auto& kv : overrides) {
        const std::string& key = kv.first;
        double val = kv.second;
        if (key == "targetRTP") {
            config.algorithm.targetRTP = val;
            config.algorithm.minRTP = val * 0.85;
            config.algorithm.maxRTP = val * 1.15;
        } else if (key == "minBet") {
            config.algorithm.minBet = overrideInt64(key, val);
        } else if (key == "maxBet") {
            config.algorithm.maxBet = overrideInt64(key, val);
        } else if (key == "betUnit") {
            config.algorithm.betUnit = overrideInt64(key, val);
        } else if (key == "controller") {
            config.algorithm.controller = val != 0.0 ? ControllerKind::Fixed : ControllerKind::Dynamic;
        } else if (key == "minMatch") {
            config.cascade.minMatch = overrideInt(key, val);
        } else if (key == "maxCascades") {
            config.cascade.maxCascades = overrideInt(key, val);
        } else if (key == "adjacentOnly") {
            config.cascade.adjacentOnly = val != 0.0;
        } else if (key == "matchMode") {
            config.cascade.matchMode = val != 0.0 ? MatchMode::Adjacency : MatchMode::Ways;
        } else if (key == "goldenProbability") {
            config.golden.goldenProbability = val;
        } else if (key == "bonusEnabled") {
            config.bonus.enabled = val != 0.0;
        } else if (key == "normalProbability") {
            config.bonus.normalProbability = val;
        } else if (key == "superProbability") {
            config.bonus.superProbability = val;
        } else {
            throw ConfigError("unknown override key '" + key + "'");
        }
    }
}
