#pragma once
#include "config.h"
#include "game.h"
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <thread>

// closed-form return of the first drop only: ways matcher, no cascades,
// no wilds, no lean
struct TheoreticalEstimate {
    bool supported = false;              // false for the adjacency matcher
    double firstDropRTP = 0.0;
    double hitProbability = 0.0;
    std::map<int, double> symbolRTP;     // contribution per paying symbol
};

struct SimulationReport {
    std::int64_t spins = 0;
    std::int64_t bet = 0;
    size_t blocks = 0;
    std::int64_t totalBet = 0;
    std::int64_t totalWin = 0;
    double rtp = 0.0;
    double targetRTP = 0.0;
    double deviation = 0.0;              // rtp - target
    double confidence = 0.0;
    double hitFrequency = 0.0;
    std::int64_t bigWins = 0;
    std::int64_t jackpots = 0;
    std::int64_t bonusTriggers = 0;
    int maxCascades = 0;
    TheoreticalEstimate theoretical;
};

class Simulation {
public:
    // one independent SlotGame per block, seeded baseSeed + block
    Simulation(const EngineConfig& config, std::uint64_t baseSeed,
               size_t threads = std::thread::hardware_concurrency());

    // runs totalSpins split into blocks of blockSize in parallel
    SimulationReport run(std::int64_t totalSpins, std::int64_t bet, std::int64_t blockSize = 10000);

    static TheoreticalEstimate computeTheoreticalFirstDrop(const EngineConfig& config);

    // key=value lines; returns false when the file cannot be written
    static bool writeReport(const SimulationReport& report, const std::string& path);

    const EngineConfig& getConfig() const { return config; }

private:
    EngineConfig config;
    std::uint64_t baseSeed;
    size_t threadCount;
    std::mutex logMtx;
};
