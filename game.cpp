#include "game.h"
#include "errors.h"
#include <algorithm>
#include <cmath>

static const EngineConfig& validated(const EngineConfig& config) {
    validate(config);
    return config;
}

WinTier classifyWin(std::int64_t win, std::int64_t bet) {
    if (win <= 0) return WinTier::None;
    if (win >= bet * 100) return WinTier::Jackpot;
    if (win >= bet * 20) return WinTier::Big;
    if (win >= bet * 5) return WinTier::Medium;
    return WinTier::Small;
}

SlotGame::SlotGame(const EngineConfig& config, std::shared_ptr<RandomSource> rng) :
    config(validated(config)),
    rng(rng),
    engine(config, rng),
    controller(RTPController::create(config.algorithm, rng)) {}

void SlotGame::checkBet(std::int64_t bet) const {
    const auto& a = config.algorithm;
    if (bet < a.minBet || bet > a.maxBet) {
        throw BetError("bet " + std::to_string(bet) + " outside [" + std::to_string(a.minBet) + "," +
                       std::to_string(a.maxBet) + "]");
    }
}

SpinResult SlotGame::spin(const SpinRequest& request) {
    std::lock_guard<std::mutex> lock(mtx);
    checkBet(request.bet);

    // lean the draw, never force the result
    bool biased = controller.shouldBias(request.bet);
    CascadeOutcome outcome = engine.play(biased);

    double current = stats.hasWagers() ? stats.currentRTP() : controller.getTargetRTP();
    double adjustment = controller.winAdjustment(current);
    double scaled = static_cast<double>(outcome.rawWin) * static_cast<double>(request.bet) /
                    static_cast<double>(config.algorithm.betUnit);
    std::int64_t totalWin = static_cast<std::int64_t>(std::llround(scaled * adjustment));

    int wildsCreated = static_cast<int>(std::count_if(outcome.wildTransitions.begin(), outcome.wildTransitions.end(),
                                                      [](const WildTransition& t) { return t.toWild; }));
    controller.recordOutcome(request.bet, totalWin);
    stats.record(SpinRecord{request.bet, totalWin, static_cast<int>(outcome.steps.size()), wildsCreated,
                            outcome.bonusTrigger.has_value()});

    SessionStats& session = sessions[request.sessionId];
    session.sessionId = request.sessionId;
    session.spins++;
    session.totalBet += request.bet;
    session.totalWin += totalWin;
    session.lastResultId = "cascade_" + request.sessionId + "_" + std::to_string(session.spins);

    SpinResult result;
    result.resultId = session.lastResultId;
    result.sessionId = request.sessionId;
    result.bet = request.bet;
    result.rawWin = outcome.rawWin;
    result.compensationMultiplier = adjustment;
    result.biased = biased;
    result.totalWin = totalWin;
    result.isWin = totalWin > 0;
    result.tier = classifyWin(totalWin, request.bet);
    result.cascadeCount = static_cast<int>(outcome.steps.size());
    result.totalRemoved = outcome.totalRemoved;
    result.finalMultiplier = outcome.finalMultiplier;
    result.steps = std::move(outcome.steps);
    result.initialGrid = std::move(outcome.initialGrid);
    result.finalGrid = std::move(outcome.finalGrid);
    result.goldenSymbols = std::move(outcome.goldenSymbols);
    result.wildTransitions = std::move(outcome.wildTransitions);
    result.wildPositions = std::move(outcome.wildPositions);
    result.bonusTrigger = std::move(outcome.bonusTrigger);
    result.metadata = request.metadata;
    return result;
}

void SlotGame::rebuild(const EngineConfig& next) {
    validate(next);
    config = next;
    engine = CascadeEngine(config, rng);
    controller = RTPController::create(config.algorithm, rng);
    stats.reset();
}

void SlotGame::configureAlgorithm(const AlgorithmConfig& algorithm) {
    std::lock_guard<std::mutex> lock(mtx);
    EngineConfig next = config;
    next.algorithm = algorithm;
    next.cascade.gridWidth = algorithm.reelCount;
    next.cascade.gridHeight = algorithm.rowCount;
    rebuild(next);
}

void SlotGame::configure(const EngineConfig& next) {
    std::lock_guard<std::mutex> lock(mtx);
    rebuild(next);
}

StatisticsSnapshot SlotGame::getStatistics() const {
    std::lock_guard<std::mutex> lock(mtx);
    StatisticsSnapshot snapshot = stats.snapshot();
    snapshot.controller = controller.snapshot();
    return snapshot;
}

void SlotGame::resetStatistics() {
    std::lock_guard<std::mutex> lock(mtx);
    stats.reset();
    controller.reset();
}

void SlotGame::setTargetRTP(double rtp) {
    std::lock_guard<std::mutex> lock(mtx);
    controller.setTargetRTP(rtp);
    config.algorithm.targetRTP = rtp;
}

double SlotGame::getCurrentRTP() const {
    std::lock_guard<std::mutex> lock(mtx);
    return stats.currentRTP();
}

SessionStats SlotGame::getSession(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = sessions.find(sessionId);
    if (it == sessions.end()) throw NotFoundError("session '" + sessionId + "'");
    return it->second;
}

void SlotGame::closeSession(const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(mtx);
    if (sessions.erase(sessionId) == 0) throw NotFoundError("session '" + sessionId + "'");
}

BatchResult SlotGame::simulateBatch(std::int64_t spins, std::int64_t bet) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        checkBet(bet);
    }
    BatchResult batch;
    SpinRequest request;
    request.sessionId = "batch";
    request.bet = bet;
    for (std::int64_t i = 0; i < spins; i++) {
        SpinResult r = spin(request);
        batch.spins++;
        batch.totalBet += r.bet;
        batch.totalWin += r.totalWin;
        if (r.isWin) batch.winCount++;
        if (r.totalWin > bet * 10) batch.bigWins++;
        if (r.totalWin > bet * 100) batch.jackpots++;
        if (r.bonusTrigger) batch.bonusTriggers++;
        batch.maxCascades = std::max(batch.maxCascades, r.cascadeCount);
    }
    if (batch.totalBet > 0) batch.rtp = static_cast<double>(batch.totalWin) / static_cast<double>(batch.totalBet);
    return batch;
}

EngineConfig SlotGame::getConfig() const {
    std::lock_guard<std::mutex> lock(mtx);
    return config;
}
