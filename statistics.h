#pragma once
#include "rtpController.h"
#include <cstdint>
#include <map>

// what the facade learns from one finished spin
struct SpinRecord {
    std::int64_t bet = 0;
    std::int64_t win = 0;
    int cascades = 0;
    int wildsCreated = 0;
    bool bonusTriggered = false;
};

struct StatisticsSnapshot {
    std::int64_t totalSpins = 0;
    std::int64_t totalBet = 0;
    std::int64_t totalWin = 0;
    double currentRTP = 0.0;
    std::int64_t winCount = 0;
    double hitFrequency = 0.0;
    std::int64_t bigWins = 0;         // win > 10x bet
    std::int64_t jackpots = 0;        // win > 100x bet
    std::int64_t bonusTriggers = 0;
    std::int64_t wildsCreated = 0;
    double averageCascades = 0.0;
    int maxCascadesHit = 0;
    std::map<int, std::int64_t> cascadeDistribution;   // cascades per spin -> spins
    ControllerSnapshot controller;
};

// lifetime counters; only record() and reset() change them
class SpinStatistics {
private:
    std::int64_t totalSpins = 0;
    std::int64_t totalBet = 0;
    std::int64_t totalWin = 0;
    std::int64_t winCount = 0;
    std::int64_t bigWins = 0;
    std::int64_t jackpots = 0;
    std::int64_t bonusTriggers = 0;
    std::int64_t wildsCreated = 0;
    std::int64_t totalCascades = 0;
    int maxCascadesHit = 0;
    std::map<int, std::int64_t> cascadeDistribution;

public:
    void record(const SpinRecord& spin);
    void reset();

    bool hasWagers() const { return totalBet > 0; }
    double currentRTP() const;
    // the controller part of the snapshot is filled by the caller
    StatisticsSnapshot snapshot() const;
};
