#include "statistics.h"
#include <algorithm>

void SpinStatistics::record(const SpinRecord& spin) {
    totalSpins++;
    totalBet += spin.bet;
    totalWin += spin.win;
    if (spin.win > 0) winCount++;
    if (spin.win > spin.bet * 10) bigWins++;
    if (spin.win > spin.bet * 100) jackpots++;
    if (spin.bonusTriggered) bonusTriggers++;
    wildsCreated += spin.wildsCreated;
    totalCascades += spin.cascades;
    maxCascadesHit = std::max(maxCascadesHit, spin.cascades);
    cascadeDistribution[spin.cascades]++;
}

void SpinStatistics::reset() {
    *this = SpinStatistics{};
}

double SpinStatistics::currentRTP() const {
    if (totalBet == 0) return 0.0;
    return static_cast<double>(totalWin) / static_cast<double>(totalBet);
}

StatisticsSnapshot SpinStatistics::snapshot() const {
    StatisticsSnapshot s;
    s.totalSpins = totalSpins;
    s.totalBet = totalBet;
    s.totalWin = totalWin;
    s.currentRTP = currentRTP();
    s.winCount = winCount;
    s.bigWins = bigWins;
    s.jackpots = jackpots;
    s.bonusTriggers = bonusTriggers;
    s.wildsCreated = wildsCreated;
    s.maxCascadesHit = maxCascadesHit;
    s.cascadeDistribution = cascadeDistribution;
    if (totalSpins > 0) {
        s.hitFrequency = static_cast<double>(winCount) / static_cast<double>(totalSpins);
        s.averageCascades = static_cast<double>(totalCascades) / static_cast<double>(totalSpins);
    }
    return s;
}
