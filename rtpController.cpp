#include "rtpController.h"
#include "errors.h"
#include <algorithm>
#include <cmath>
#include <string>

// 15 minutes / 100 samples and 24 hours / 1000 samples
static RTPHistory shortTermHistory() {
    return RTPHistory(std::chrono::minutes(15), 100);
}

static RTPHistory longTermHistory() {
    return RTPHistory(std::chrono::hours(24), 1000);
}

static RTPSample makeSample(std::int64_t bet, std::int64_t win, RTPClock::time_point at) {
    RTPSample s;
    s.timestamp = at;
    s.bet = bet;
    s.win = win;
    s.rtp = bet > 0 ? static_cast<double>(win) / static_cast<double>(bet) : 0.0;
    return s;
}

RTPHistory::RTPHistory(RTPClock::duration window, size_t capacity) :
    window(window),
    capacity(capacity) {}

void RTPHistory::dropFront() {
    totalBet -= samples.front().bet;
    totalWin -= samples.front().win;
    samples.pop_front();
}

void RTPHistory::addSample(const RTPSample& sample) {
    samples.push_back(sample);
    totalBet += sample.bet;
    totalWin += sample.win;

    while (samples.size() > capacity) dropFront();
    const auto cutoff = sample.timestamp - window;
    while (!samples.empty() && samples.front().timestamp < cutoff) dropFront();
}

double RTPHistory::currentRTP() const {
    if (totalBet == 0) return 0.0;
    return static_cast<double>(totalWin) / static_cast<double>(totalBet);
}

double RTPHistory::standardDeviation() const {
    if (samples.empty()) return 0.0;
    double sum = 0.0;
    for (const auto& s : samples) sum += s.rtp;
    double mean = sum / samples.size();
    double variance = 0.0;
    for (const auto& s : samples) variance += (s.rtp - mean) * (s.rtp - mean);
    return std::sqrt(variance / samples.size());
}

void RTPHistory::clear() {
    samples.clear();
    totalBet = 0;
    totalWin = 0;
}

DynamicRTPController::DynamicRTPController(const AlgorithmConfig& config, std::shared_ptr<RandomSource> rng) :
    targetRTP(config.targetRTP),
    minRTP(config.minRTP),
    maxRTP(config.maxRTP),
    shortTerm(shortTermHistory()),
    longTerm(longTermHistory()),
    rng(std::move(rng)) {}

void DynamicRTPController::recordOutcome(std::int64_t bet, std::int64_t win) {
    recordOutcome(bet, win, RTPClock::now());
}

void DynamicRTPController::recordOutcome(std::int64_t bet, std::int64_t win, RTPClock::time_point at) {
    RTPSample sample = makeSample(bet, win, at);
    shortTerm.addSample(sample);
    longTerm.addSample(sample);
}

bool DynamicRTPController::shouldBias(std::int64_t bet) {
    double weighted = shortTerm.currentRTP() * 0.3 + longTerm.currentRTP() * 0.7;

    double probability = targetRTP;
    if (weighted < targetRTP) {
        probability += (targetRTP - weighted) * kCompensationFactor;
    } else if (weighted > targetRTP) {
        probability -= (weighted - targetRTP) * kCompensationFactor * 0.5;
    }

    // large bets lean slightly less
    probability *= 1.0 - (static_cast<double>(bet) / 1000000.0) * 0.05;
    probability += kJitter * (0.5 - rng->nextDouble());
    probability = std::clamp(probability, 0.1, 0.9);

    return rng->nextDouble() < probability;
}

// bands at 0.5% and 2% rather than 5% and 10%: wider bands let the lifetime
// RTP settle outside the 2% tolerance when the natural return is far off target
double DynamicRTPController::compensationMultiplier(double currentRTP, double targetRTP) const {
    if (targetRTP <= 0.0) return 1.0;
    double d = (targetRTP - currentRTP) / targetRTP;

    double multiplier;
    if (d > 0.02) {
        multiplier = 2.0;
    } else if (d > 0.005) {
        multiplier = 1.25 + (d - 0.005) / 0.015 * 0.75;
    } else if (d >= -0.005) {
        multiplier = 1.0 + 50.0 * d;
    } else if (d >= -0.02) {
        multiplier = 0.75 - (-d - 0.005) / 0.015 * 0.25;
    } else {
        multiplier = 0.5;
    }
    return std::clamp(multiplier, 0.5, 2.0);
}

double DynamicRTPController::volatilityAdjustment() const {
    if (shortTerm.size() < 10) return 1.0;
    double stdDev = shortTerm.standardDeviation();
    if (stdDev > 0.1) return 0.8;
    if (stdDev < 0.05) return 1.2;
    return 1.0;
}

double DynamicRTPController::winAdjustment(double currentRTP) const {
    double comp = compensationMultiplier(currentRTP, targetRTP);
    return std::clamp(1.0 + (comp - 1.0) * volatilityAdjustment(), 0.5, 2.0);
}

ControllerSnapshot DynamicRTPController::snapshot() const {
    ControllerSnapshot s;
    s.kind = ControllerKind::Dynamic;
    s.targetRTP = targetRTP;
    s.minRTP = minRTP;
    s.maxRTP = maxRTP;
    s.shortTermRTP = shortTerm.currentRTP();
    s.longTermRTP = longTerm.currentRTP();
    s.shortTermSamples = shortTerm.size();
    s.longTermSamples = longTerm.size();
    return s;
}

void DynamicRTPController::reset() {
    shortTerm.clear();
    longTerm.clear();
}

FixedOddsController::FixedOddsController(const AlgorithmConfig& config) :
    targetRTP(config.targetRTP),
    minRTP(config.minRTP),
    maxRTP(config.maxRTP),
    shortTerm(shortTermHistory()),
    longTerm(longTermHistory()) {}

void FixedOddsController::recordOutcome(std::int64_t bet, std::int64_t win) {
    recordOutcome(bet, win, RTPClock::now());
}

void FixedOddsController::recordOutcome(std::int64_t bet, std::int64_t win, RTPClock::time_point at) {
    RTPSample sample = makeSample(bet, win, at);
    shortTerm.addSample(sample);
    longTerm.addSample(sample);
}

void FixedOddsController::setTargetRTP(double rtp) {
    if (rtp < 0.8 || rtp > 0.99) {
        throw ConfigError("target RTP " + std::to_string(rtp) + " outside [0.8,0.99]");
    }
    targetRTP = rtp;
    minRTP = std::min(minRTP, rtp);
    maxRTP = std::max(maxRTP, rtp);
}

ControllerSnapshot FixedOddsController::snapshot() const {
    ControllerSnapshot s;
    s.kind = ControllerKind::Fixed;
    s.targetRTP = targetRTP;
    s.minRTP = minRTP;
    s.maxRTP = maxRTP;
    s.shortTermRTP = shortTerm.currentRTP();
    s.longTermRTP = longTerm.currentRTP();
    s.shortTermSamples = shortTerm.size();
    s.longTermSamples = longTerm.size();
    return s;
}

void FixedOddsController::reset() {
    shortTerm.clear();
    longTerm.clear();
}

RTPController RTPController::create(const AlgorithmConfig& config, std::shared_ptr<RandomSource> rng) {
    switch (config.controller) {
    case ControllerKind::Fixed:
        return RTPController(FixedOddsController(config));
    case ControllerKind::Dynamic:
        break;
    }
    return RTPController(DynamicRTPController(config, std::move(rng)));
}

void RTPController::recordOutcome(std::int64_t bet, std::int64_t win) {
    std::visit([&](auto& c) { c.recordOutcome(bet, win); }, impl);
}

bool RTPController::shouldBias(std::int64_t bet) {
    return std::visit([&](auto& c) { return c.shouldBias(bet); }, impl);
}

double RTPController::compensationMultiplier(double currentRTP, double targetRTP) const {
    return std::visit([&](const auto& c) { return c.compensationMultiplier(currentRTP, targetRTP); }, impl);
}

double RTPController::volatilityAdjustment() const {
    return std::visit([](const auto& c) { return c.volatilityAdjustment(); }, impl);
}

double RTPController::winAdjustment(double currentRTP) const {
    return std::visit([&](const auto& c) { return c.winAdjustment(currentRTP); }, impl);
}

void RTPController::setTargetRTP(double rtp) {
    auto* fixed = std::get_if<FixedOddsController>(&impl);
    if (!fixed) throw UnsupportedError("the dynamic RTP controller cannot be retargeted; reconfigure the engine");
    fixed->setTargetRTP(rtp);
}

ControllerSnapshot RTPController::snapshot() const {
    return std::visit([](const auto& c) { return c.snapshot(); }, impl);
}

void RTPController::reset() {
    std::visit([](auto& c) { c.reset(); }, impl);
}

double RTPController::getTargetRTP() const {
    return std::visit([](const auto& c) { return c.getTargetRTP(); }, impl);
}

ControllerKind RTPController::kind() const {
    return std::holds_alternative<FixedOddsController>(impl) ? ControllerKind::Fixed : ControllerKind::Dynamic;
}
