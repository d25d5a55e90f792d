#pragma once
#include "cascade.h"
#include "config.h"
#include "randomSource.h"
#include "rtpController.h"
#include "statistics.h"
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct SpinRequest {
    std::string sessionId;
    std::int64_t bet = 0;
    std::map<std::string, std::string> metadata;
};

enum class WinTier { None, Small, Medium, Big, Jackpot };

struct SpinResult {
    std::string resultId;
    std::string sessionId;
    std::int64_t bet = 0;

    std::int64_t rawWin = 0;              // pay-table units after cascade multipliers
    double compensationMultiplier = 1.0;  // controller adjustment actually applied
    bool biased = false;                  // the initial grid was leaned
    std::int64_t totalWin = 0;            // credits
    bool isWin = false;
    WinTier tier = WinTier::None;

    int cascadeCount = 0;
    int totalRemoved = 0;
    double finalMultiplier = 1.0;
    std::vector<CascadeStep> steps;
    GridIds initialGrid;
    GridIds finalGrid;
    std::vector<GoldenSymbolInfo> goldenSymbols;
    std::vector<WildTransition> wildTransitions;
    std::vector<Position> wildPositions;
    std::optional<BonusTrigger> bonusTrigger;
    std::map<std::string, std::string> metadata;
};

struct SessionStats {
    std::string sessionId;
    std::int64_t spins = 0;
    std::int64_t totalBet = 0;
    std::int64_t totalWin = 0;
    std::string lastResultId;
};

struct BatchResult {
    std::int64_t spins = 0;
    std::int64_t totalBet = 0;
    std::int64_t totalWin = 0;
    double rtp = 0.0;
    std::int64_t winCount = 0;
    std::int64_t bigWins = 0;
    std::int64_t jackpots = 0;
    std::int64_t bonusTriggers = 0;
    int maxCascades = 0;
};

WinTier classifyWin(std::int64_t win, std::int64_t bet);

// wires generator, matchers, cascade and controller together per spin.
// one lock covers each call; grids stay local to the call.
class SlotGame {
private:
    mutable std::mutex mtx;
    EngineConfig config;
    std::shared_ptr<RandomSource> rng;
    CascadeEngine engine;
    RTPController controller;
    SpinStatistics stats;
    std::map<std::string, SessionStats> sessions;

    void checkBet(std::int64_t bet) const;
    void rebuild(const EngineConfig& next);

public:
    // throws ConfigError when the bundle does not validate
    SlotGame(const EngineConfig& config, std::shared_ptr<RandomSource> rng);

    // BetError before any draw when the bet is out of limits
    SpinResult spin(const SpinRequest& request);

    // grid dimensions follow the new reel/row counts. statistics, histories
    // and the controller start over
    void configureAlgorithm(const AlgorithmConfig& algorithm);
    void configure(const EngineConfig& next);

    StatisticsSnapshot getStatistics() const;
    void resetStatistics();

    // UnsupportedError on the dynamic controller
    void setTargetRTP(double rtp);
    double getCurrentRTP() const;

    SessionStats getSession(const std::string& sessionId) const;
    void closeSession(const std::string& sessionId);

    // sequential spins on this engine under the "batch" session
    BatchResult simulateBatch(std::int64_t spins, std::int64_t bet);

    EngineConfig getConfig() const;
};
