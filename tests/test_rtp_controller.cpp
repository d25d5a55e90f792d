#include "errors.h"
#include "rtpController.h"
#include "scriptedRandomSource.h"
#include <gtest/gtest.h>
#include <memory>

namespace {

AlgorithmConfig withTarget(double target) {
    AlgorithmConfig config = defaultAlgorithmConfig();
    config.targetRTP = target;
    config.minRTP = target * 0.85;
    config.maxRTP = target * 1.15;
    return config;
}

}

TEST(RTPHistory, KeepsRunningTotals) {
    RTPHistory history(std::chrono::minutes(15), 100);
    auto now = RTPClock::now();
    history.addSample(RTPSample{now, 100, 50, 0.5});
    history.addSample(RTPSample{now, 100, 150, 1.5});
    EXPECT_EQ(history.getTotalBet(), 200);
    EXPECT_EQ(history.getTotalWin(), 200);
    EXPECT_DOUBLE_EQ(history.currentRTP(), 1.0);
    EXPECT_DOUBLE_EQ(history.standardDeviation(), 0.5);
}

TEST(RTPHistory, EvictsByCountThenByAge) {
    RTPHistory history(std::chrono::minutes(15), 3);
    auto start = RTPClock::now();
    for (int i = 0; i < 5; i++) history.addSample(RTPSample{start, 10, i, i / 10.0});
    EXPECT_EQ(history.size(), 3u);
    EXPECT_EQ(history.getTotalBet(), 30);
    EXPECT_EQ(history.getTotalWin(), 2 + 3 + 4);

    history.addSample(RTPSample{start + std::chrono::minutes(20), 10, 10, 1.0});
    EXPECT_EQ(history.size(), 1u);
    EXPECT_EQ(history.getTotalBet(), 10);
    EXPECT_DOUBLE_EQ(history.currentRTP(), 1.0);
}

TEST(RTPHistory, EmptyHistoryReportsZero) {
    RTPHistory history(std::chrono::hours(24), 1000);
    EXPECT_DOUBLE_EQ(history.currentRTP(), 0.0);
    EXPECT_DOUBLE_EQ(history.standardDeviation(), 0.0);
}

TEST(DynamicRTPController, BiasFrequencyTracksTargetWhenOnTarget) {
    auto rng = std::make_shared<SeededRandomSource>(101);
    DynamicRTPController controller(withTarget(0.85), rng);
    // both windows sit exactly on target
    for (int i = 0; i < 200; i++) controller.recordOutcome(100, 85);

    const int calls = 10000;
    int biased = 0;
    for (int i = 0; i < calls; i++) if (controller.shouldBias(100)) biased++;
    EXPECT_NEAR(static_cast<double>(biased) / calls, 0.85, 0.02);
}

TEST(DynamicRTPController, BiasesMoreWhenBelowTarget) {
    auto rng = std::make_shared<SeededRandomSource>(55);
    DynamicRTPController low(withTarget(0.9), rng);
    DynamicRTPController high(withTarget(0.9), rng);
    for (int i = 0; i < 100; i++) {
        low.recordOutcome(100, 60);
        high.recordOutcome(100, 120);
    }
    int lowBiased = 0;
    int highBiased = 0;
    for (int i = 0; i < 5000; i++) {
        if (low.shouldBias(100)) lowBiased++;
        if (high.shouldBias(100)) highBiased++;
    }
    EXPECT_GT(lowBiased, highBiased);
    // low: 0.9 + 0.45 clamps to 0.9
    EXPECT_NEAR(lowBiased / 5000.0, 0.9, 0.02);
}

TEST(DynamicRTPController, BiasProbabilityIsClamped) {
    // jitter draw 1.0 - tiny, decision draw just under 0.1
    auto rng = std::make_shared<ScriptedRandomSource>();
    DynamicRTPController controller(withTarget(0.9), rng);
    for (int i = 0; i < 100; i++) controller.recordOutcome(100, 1000);
    rng->pushDouble(0.999);
    rng->pushDouble(0.099);
    EXPECT_TRUE(controller.shouldBias(100));
    rng->pushDouble(0.999);
    rng->pushDouble(0.101);
    EXPECT_FALSE(controller.shouldBias(100));
}

TEST(DynamicRTPController, CompensationMultiplierIsPiecewiseAndBounded) {
    DynamicRTPController controller(withTarget(0.9), std::make_shared<SeededRandomSource>(1));
    EXPECT_DOUBLE_EQ(controller.compensationMultiplier(0.5, 1.0), 2.0);
    EXPECT_DOUBLE_EQ(controller.compensationMultiplier(0.97, 1.0), 2.0);
    EXPECT_NEAR(controller.compensationMultiplier(0.99, 1.0), 1.5, 1e-9);
    EXPECT_DOUBLE_EQ(controller.compensationMultiplier(1.0, 1.0), 1.0);
    EXPECT_NEAR(controller.compensationMultiplier(1.002, 1.0), 0.9, 1e-9);
    EXPECT_NEAR(controller.compensationMultiplier(1.0125, 1.0), 0.625, 1e-9);
    EXPECT_DOUBLE_EQ(controller.compensationMultiplier(1.03, 1.0), 0.5);
    EXPECT_DOUBLE_EQ(controller.compensationMultiplier(3.0, 1.0), 0.5);

    // monotone non-increasing in the realized RTP
    double previous = 2.0;
    for (double current = 0.0; current <= 2.0; current += 0.001) {
        double m = controller.compensationMultiplier(current, 0.9);
        ASSERT_GE(m, 0.5);
        ASSERT_LE(m, 2.0);
        ASSERT_LE(m, previous + 1e-12);
        previous = m;
    }
}

TEST(DynamicRTPController, VolatilityAdjustmentFollowsShortWindowSpread) {
    auto rng = std::make_shared<SeededRandomSource>(1);
    DynamicRTPController few(withTarget(0.9), rng);
    for (int i = 0; i < 9; i++) few.recordOutcome(100, i % 2 == 0 ? 0 : 500);
    EXPECT_DOUBLE_EQ(few.volatilityAdjustment(), 1.0);

    DynamicRTPController noisy(withTarget(0.9), rng);
    for (int i = 0; i < 20; i++) noisy.recordOutcome(100, i % 2 == 0 ? 0 : 500);
    EXPECT_DOUBLE_EQ(noisy.volatilityAdjustment(), 0.8);

    DynamicRTPController calm(withTarget(0.9), rng);
    for (int i = 0; i < 20; i++) calm.recordOutcome(100, 90);
    EXPECT_DOUBLE_EQ(calm.volatilityAdjustment(), 1.2);

    DynamicRTPController middle(withTarget(0.9), rng);
    for (int i = 0; i < 20; i++) middle.recordOutcome(100, i % 2 == 0 ? 83 : 97);
    EXPECT_DOUBLE_EQ(middle.volatilityAdjustment(), 1.0);
}

TEST(DynamicRTPController, WinAdjustmentDampsByVolatility) {
    auto rng = std::make_shared<SeededRandomSource>(1);
    DynamicRTPController controller(withTarget(0.9), rng);
    for (int i = 0; i < 20; i++) controller.recordOutcome(100, i % 2 == 0 ? 0 : 500);
    EXPECT_NEAR(controller.winAdjustment(0.5), 1.8, 1e-9);
    EXPECT_NEAR(controller.winAdjustment(2.0), 0.6, 1e-9);
    EXPECT_NEAR(controller.winAdjustment(0.9), 1.0, 1e-9);
}

TEST(DynamicRTPController, ResetClearsHistories) {
    DynamicRTPController controller(withTarget(0.9), std::make_shared<SeededRandomSource>(1));
    controller.recordOutcome(100, 50);
    ControllerSnapshot before = controller.snapshot();
    EXPECT_EQ(before.shortTermSamples, 1u);
    EXPECT_EQ(before.longTermSamples, 1u);
    EXPECT_DOUBLE_EQ(before.shortTermRTP, 0.5);
    controller.reset();
    ControllerSnapshot after = controller.snapshot();
    EXPECT_EQ(after.shortTermSamples, 0u);
    EXPECT_EQ(after.longTermSamples, 0u);
    EXPECT_DOUBLE_EQ(after.targetRTP, 0.9);
}

TEST(FixedOddsController, NeverLeansNorRescales) {
    FixedOddsController controller(withTarget(0.9));
    for (int i = 0; i < 100; i++) controller.recordOutcome(100, 10);
    EXPECT_FALSE(controller.shouldBias(100));
    EXPECT_DOUBLE_EQ(controller.compensationMultiplier(0.1, 0.9), 1.0);
    EXPECT_DOUBLE_EQ(controller.winAdjustment(0.1), 1.0);
    EXPECT_EQ(controller.snapshot().longTermSamples, 100u);
}

TEST(RTPController, CreatesTheConfiguredVariant) {
    AlgorithmConfig config = withTarget(0.9);
    auto rng = std::make_shared<SeededRandomSource>(1);
    EXPECT_EQ(RTPController::create(config, rng).kind(), ControllerKind::Dynamic);
    config.controller = ControllerKind::Fixed;
    EXPECT_EQ(RTPController::create(config, rng).kind(), ControllerKind::Fixed);
}

TEST(RTPController, RetargetingDependsOnVariant) {
    AlgorithmConfig config = withTarget(0.9);
    auto rng = std::make_shared<SeededRandomSource>(1);
    RTPController dynamic = RTPController::create(config, rng);
    EXPECT_THROW(dynamic.setTargetRTP(0.92), UnsupportedError);
    EXPECT_DOUBLE_EQ(dynamic.getTargetRTP(), 0.9);

    config.controller = ControllerKind::Fixed;
    RTPController fixed = RTPController::create(config, rng);
    fixed.setTargetRTP(0.95);
    EXPECT_DOUBLE_EQ(fixed.getTargetRTP(), 0.95);
    EXPECT_DOUBLE_EQ(fixed.snapshot().targetRTP, 0.95);
    EXPECT_THROW(fixed.setTargetRTP(0.5), ConfigError);
    EXPECT_THROW(fixed.setTargetRTP(1.2), ConfigError);
}
