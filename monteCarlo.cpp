#include "monteCarlo.h"
#include "errors.h"
#include "matching.h"
#include <algorithm>
#include <atomic>
#include <cmath>
#include <fstream>
#include <iostream>
#include <memory>
#include <numeric>
#include <vector>
#include <tbb/tbb.h>
#include <tbb/global_control.h>

struct BlockResult {
    size_t block = 0;
    BatchResult batch;
};

Simulation::Simulation(const EngineConfig& config, std::uint64_t baseSeed, size_t threads)
    : config(config), baseSeed(baseSeed), threadCount(std::max<size_t>(threads, 1)) {
    validate(this->config);
}

SimulationReport Simulation::run(std::int64_t totalSpins, std::int64_t bet, std::int64_t blockSize) {
    if (totalSpins <= 0) throw ConfigError("total spins must be positive");
    if (blockSize <= 0) throw ConfigError("block size must be positive");
    const auto& a = config.algorithm;
    if (bet < a.minBet || bet > a.maxBet) {
        throw BetError("bet " + std::to_string(bet) + " outside [" + std::to_string(a.minBet) + "," +
                       std::to_string(a.maxBet) + "]");
    }

    // throttle TBB to user-specified threads
    tbb::global_control ctl(tbb::global_control::max_allowed_parallelism, static_cast<int>(threadCount));

    const size_t blocks = static_cast<size_t>((totalSpins + blockSize - 1) / blockSize);
    tbb::concurrent_vector<BlockResult> results;
    std::atomic<size_t> finished{0};
    const size_t logEvery = std::max<size_t>(blocks / 10, 1);

    tbb::parallel_for(size_t(0), blocks, [&](size_t b) {
        std::int64_t spins = std::min(blockSize, totalSpins - static_cast<std::int64_t>(b) * blockSize);
        SlotGame game(config, std::make_shared<SeededRandomSource>(baseSeed + b));
        BatchResult batch = game.simulateBatch(spins, bet);
        results.push_back(BlockResult{b, batch});

        // periodic progress logging
        size_t done = ++finished;
        if (done % logEvery == 0 || done == blocks) {
            std::lock_guard<std::mutex> lock(logMtx);
            std::cout << "Block " << done << "/" << blocks
                      << ", spins=" << batch.spins
                      << ", rtp=" << batch.rtp
                      << std::endl;
        }
    });

    // merge in block order so the totals do not depend on scheduling
    std::vector<BlockResult> ordered(results.begin(), results.end());
    std::sort(ordered.begin(), ordered.end(),
              [](const BlockResult& x, const BlockResult& y) { return x.block < y.block; });

    SimulationReport report;
    report.bet = bet;
    report.blocks = blocks;
    report.targetRTP = a.targetRTP;
    std::int64_t wins = 0;
    for (const auto& r : ordered) {
        report.spins += r.batch.spins;
        report.totalBet += r.batch.totalBet;
        report.totalWin += r.batch.totalWin;
        wins += r.batch.winCount;
        report.bigWins += r.batch.bigWins;
        report.jackpots += r.batch.jackpots;
        report.bonusTriggers += r.batch.bonusTriggers;
        report.maxCascades = std::max(report.maxCascades, r.batch.maxCascades);
    }
    if (report.totalBet > 0) {
        report.rtp = static_cast<double>(report.totalWin) / static_cast<double>(report.totalBet);
    }
    if (report.spins > 0) report.hitFrequency = static_cast<double>(wins) / static_cast<double>(report.spins);
    report.deviation = report.rtp - report.targetRTP;
    // normal approximation, rough
    double confidence = 1.0 - std::abs(report.deviation) * std::sqrt(static_cast<double>(report.spins)) / 10.0;
    report.confidence = std::clamp(confidence, 0.0, 1.0);
    report.theoretical = computeTheoreticalFirstDrop(config);

    std::cout << "Simulation complete. spins=" << report.spins
              << ", rtp=" << report.rtp
              << ", target=" << report.targetRTP
              << ", deviation=" << report.deviation
              << ", confidence=" << report.confidence
              << std::endl;
    return report;
}

// compute first-drop return from per-reel presence probabilities
TheoreticalEstimate Simulation::computeTheoreticalFirstDrop(const EngineConfig& config) {
    TheoreticalEstimate estimate;
    if (config.cascade.matchMode != MatchMode::Ways) return estimate;
    estimate.supported = true;

    const auto& a = config.algorithm;
    const int reels = a.reelCount;
    const int rows = a.rowCount;
    // bonus symbols take cells away from ordinary draws
    double ordinaryShare = 1.0;
    if (config.bonus.enabled) ordinaryShare -= config.bonus.normalProbability + config.bonus.superProbability;

    double missAll = 1.0;
    for (const auto& kv : a.payTable) {
        const int symbol = kv.first;
        std::vector<double> p(reels, 0.0), present(reels, 0.0), perReel(reels, 0.0);
        for (int r = 0; r < reels; r++) {
            const auto& w = a.symbolWeights[r];
            double total = std::accumulate(w.begin(), w.end(), 0.0);
            if (total > 0.0) p[r] = ordinaryShare * w[symbol] / total;
            present[r] = 1.0 - std::pow(1.0 - p[r], rows);
            // expected matching cells in a reel known to hold one
            perReel[r] = present[r] > 0.0 ? rows * p[r] / present[r] : 0.0;
        }

        double rtp = 0.0;
        double hit = 0.0;
        double reach = 1.0;        // P(reels 0..len-1 all hold the symbol)
        double expectedCount = 0.0;
        for (int len = 1; len <= reels; len++) {
            reach *= present[len - 1];
            expectedCount += perReel[len - 1];
            if (len < kMinWaysLength) continue;
            double exact = reach * (len < reels ? 1.0 - present[len] : 1.0);
            double pay = static_cast<double>(lookupPayout(a.payTable, symbol, len));
            rtp += exact * pay * expectedCount / len;
            hit += exact;
        }
        rtp /= static_cast<double>(a.betUnit);
        estimate.symbolRTP[symbol] = rtp;
        estimate.firstDropRTP += rtp;
        missAll *= 1.0 - hit;
    }
    estimate.hitProbability = 1.0 - missAll;
    return estimate;
}

bool Simulation::writeReport(const SimulationReport& report, const std::string& path) {
    std::ofstream ofs(path);
    if (!ofs) {
        std::cerr << "Error: could not open " << path << " for writing" << std::endl;
        return false;
    }
    ofs << "spins=" << report.spins << "\n";
    ofs << "bet=" << report.bet << "\n";
    ofs << "blocks=" << report.blocks << "\n";
    ofs << "totalBet=" << report.totalBet << "\n";
    ofs << "totalWin=" << report.totalWin << "\n";
    ofs << "rtp=" << report.rtp << "\n";
    ofs << "targetRTP=" << report.targetRTP << "\n";
    ofs << "deviation=" << report.deviation << "\n";
    ofs << "confidence=" << report.confidence << "\n";
    ofs << "hitFrequency=" << report.hitFrequency << "\n";
    ofs << "bigWins=" << report.bigWins << "\n";
    ofs << "jackpots=" << report.jackpots << "\n";
    ofs << "bonusTriggers=" << report.bonusTriggers << "\n";
    ofs << "maxCascades=" << report.maxCascades << "\n";
    if (report.theoretical.supported) {
        ofs << "theoreticalFirstDropRTP=" << report.theoretical.firstDropRTP << "\n";
        ofs << "theoreticalHitProbability=" << report.theoretical.hitProbability << "\n";
        for (const auto& kv : report.theoretical.symbolRTP) {
            ofs << "symbolRTP" << kv.first << "=" << kv.second << "\n";
        }
    }
    std::cout << "Report written to " << path << std::endl;
    return true;
}
