#pragma once
#include "config.h"
#include "randomSource.h"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <variant>

using RTPClock = std::chrono::steady_clock;

struct RTPSample {
    RTPClock::time_point timestamp;
    std::int64_t bet = 0;
    std::int64_t win = 0;
    double rtp = 0.0;     // win / bet of this sample alone
};

// bounded rolling window; totals are kept incrementally
class RTPHistory {
private:
    RTPClock::duration window;
    size_t capacity;
    std::deque<RTPSample> samples;
    std::int64_t totalBet = 0;
    std::int64_t totalWin = 0;

    void dropFront();

public:
    RTPHistory(RTPClock::duration window, size_t capacity);

    // evicts by count first, then everything older than the window
    // measured from the new sample's timestamp
    void addSample(const RTPSample& sample);

    // 0 when nothing was wagered in the window
    double currentRTP() const;
    // population std dev of the per-sample ratios
    double standardDeviation() const;

    size_t size() const { return samples.size(); }
    std::int64_t getTotalBet() const { return totalBet; }
    std::int64_t getTotalWin() const { return totalWin; }
    void clear();
};

struct ControllerSnapshot {
    ControllerKind kind = ControllerKind::Dynamic;
    double targetRTP = 0.0;
    double minRTP = 0.0;
    double maxRTP = 0.0;
    double shortTermRTP = 0.0;
    double longTermRTP = 0.0;
    size_t shortTermSamples = 0;
    size_t longTermSamples = 0;
};

class DynamicRTPController {
private:
    double targetRTP;
    double minRTP;
    double maxRTP;
    RTPHistory shortTerm;
    RTPHistory longTerm;
    std::shared_ptr<RandomSource> rng;

public:
    static constexpr double kCompensationFactor = 1.5;
    static constexpr double kJitter = 0.1;

    DynamicRTPController(const AlgorithmConfig& config, std::shared_ptr<RandomSource> rng);

    void recordOutcome(std::int64_t bet, std::int64_t win);
    void recordOutcome(std::int64_t bet, std::int64_t win, RTPClock::time_point at);

    // weighted 30/70 short/long RTP moves a target-sized probability up or
    // down, large bets shave it slightly, jitter, clamp [0.1,0.9], one draw
    bool shouldBias(std::int64_t bet);

    // piecewise in (target - current) / target, always in [0.5, 2.0]
    double compensationMultiplier(double currentRTP, double targetRTP) const;

    // 1.2 when the short window is calm, 0.8 when noisy, 1.0 otherwise
    // or with fewer than 10 samples
    double volatilityAdjustment() const;

    // compensation damped by volatility, clamped to [0.5, 2.0]
    double winAdjustment(double currentRTP) const;

    ControllerSnapshot snapshot() const;
    void reset();
    double getTargetRTP() const { return targetRTP; }
};

// classic fixed odds: never leans, never rescales, still keeps history
class FixedOddsController {
private:
    double targetRTP;
    double minRTP;
    double maxRTP;
    RTPHistory shortTerm;
    RTPHistory longTerm;

public:
    explicit FixedOddsController(const AlgorithmConfig& config);

    void recordOutcome(std::int64_t bet, std::int64_t win);
    void recordOutcome(std::int64_t bet, std::int64_t win, RTPClock::time_point at);
    bool shouldBias(std::int64_t) { return false; }
    double compensationMultiplier(double, double) const { return 1.0; }
    double volatilityAdjustment() const { return 1.0; }
    double winAdjustment(double) const { return 1.0; }

    // reported target only; throws ConfigError outside [0.8, 0.99]
    void setTargetRTP(double rtp);

    ControllerSnapshot snapshot() const;
    void reset();
    double getTargetRTP() const { return targetRTP; }
};

// the controller variant chosen by AlgorithmConfig::controller
class RTPController {
private:
    std::variant<DynamicRTPController, FixedOddsController> impl;

public:
    explicit RTPController(DynamicRTPController controller) : impl(std::move(controller)) {}
    explicit RTPController(FixedOddsController controller) : impl(std::move(controller)) {}

    static RTPController create(const AlgorithmConfig& config, std::shared_ptr<RandomSource> rng);

    void recordOutcome(std::int64_t bet, std::int64_t win);
    bool shouldBias(std::int64_t bet);
    double compensationMultiplier(double currentRTP, double targetRTP) const;
    double volatilityAdjustment() const;
    double winAdjustment(double currentRTP) const;

    // UnsupportedError on the dynamic controller
    void setTargetRTP(double rtp);

    ControllerSnapshot snapshot() const;
    void reset();
    double getTargetRTP() const;
    ControllerKind kind() const;
};
