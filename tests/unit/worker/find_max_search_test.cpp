#include <gtest/gtest.h>
#include <surge/worker/concurrency_controller.h>

using namespace surge::worker;

namespace {

StepSnapshot uniformStep(int64_t operations, double latencyMs, int64_t errors = 0,
                         OperationKind kind = OperationKind::PointLookup) {
    StepSnapshot snap;
    snap.operations = operations;
    snap.errors = errors;
    auto& samples = snap.byKind[kind];
    samples.operations = operations;
    samples.errors = errors;
    for (int64_t i = 0; i < operations - errors; ++i) {
        snap.latenciesMs.push_back(latencyMs);
        samples.latenciesMs.push_back(latencyMs);
    }
    return snap;
}

FindMaxSearch::Config searchConfig(int start, int increment, int max) {
    FindMaxSearch::Config cfg;
    cfg.startConcurrency = start;
    cfg.concurrencyIncrement = increment;
    cfg.maxConcurrency = max;
    cfg.latencyStabilityPct = 20.0;
    cfg.maxErrorRatePct = 1.0;
    return cfg;
}

const std::vector<OperationKind> kLookupsOnly{OperationKind::PointLookup};

} // namespace

TEST(FindMaxSearchTest, ClampsStartAndIncrement) {
    FindMaxSearch low(searchConfig(0, 0, 10), kLookupsOnly);
    ASSERT_TRUE(low.next().has_value());
    EXPECT_EQ(low.next()->concurrency, 1);
    low.record(uniformStep(100, 5.0), 1.0);
    EXPECT_EQ(low.next()->concurrency, 2);

    FindMaxSearch high(searchConfig(500, 10, 50), kLookupsOnly);
    EXPECT_EQ(high.next()->concurrency, 50);
}

TEST(FindMaxSearchTest, FlatSignalsClimbToMax) {
    FindMaxSearch search(searchConfig(5, 10, 25), kLookupsOnly);

    std::vector<int> levels;
    while (auto plan = search.next()) {
        levels.push_back(plan->concurrency);
        auto step = search.record(uniformStep(1000, 10.0), 1.0);
        EXPECT_TRUE(step.stable);
    }

    EXPECT_EQ(levels, (std::vector<int>{5, 15, 25}));
    auto result = search.result();
    EXPECT_EQ(result.finalBestConcurrency, 25);
    EXPECT_DOUBLE_EQ(result.finalBestQps, 1000.0);
    EXPECT_EQ(result.terminationReason, kReachedMaxReason);
    EXPECT_EQ(result.stepHistory.size(), 3u);
}

TEST(FindMaxSearchTest, LastIncrementIsClampedToMax) {
    FindMaxSearch search(searchConfig(5, 10, 20), kLookupsOnly);
    std::vector<int> levels;
    while (auto plan = search.next()) {
        levels.push_back(plan->concurrency);
        search.record(uniformStep(100, 3.0), 1.0);
    }
    EXPECT_EQ(levels, (std::vector<int>{5, 15, 20}));
    EXPECT_EQ(search.bestConcurrency(), 20);
}

TEST(FindMaxSearchTest, LatencyKneeStopsAtPreviousLevel) {
    // Latency triples once 35 tasks are running.
    FindMaxSearch search(searchConfig(5, 10, 100), kLookupsOnly);
    while (auto plan = search.next()) {
        const double latency = plan->concurrency >= 35 ? 30.0 : 10.0;
        search.record(uniformStep(500, latency), 1.0);
    }

    auto result = search.result();
    EXPECT_EQ(result.finalBestConcurrency, 25);
    ASSERT_EQ(result.stepHistory.size(), 4u);
    EXPECT_FALSE(result.stepHistory.back().stable);
    EXPECT_EQ(result.stepHistory.back().concurrency, 35);
    EXPECT_EQ(result.terminationReason.rfind("P95 latency", 0), 0u);
}

TEST(FindMaxSearchTest, GuardrailIsTwiceTheStabilityPercentage) {
    // Baseline p95 of 20ms with 20% stability allows up to 28ms.
    FindMaxSearch search(searchConfig(5, 10, 100), kLookupsOnly);
    ASSERT_TRUE(search.record(uniformStep(600, 20.0), 30.0).stable);

    auto within = search.record(uniformStep(600, 27.5), 30.0);
    EXPECT_TRUE(within.stable);
    EXPECT_EQ(search.bestConcurrency(), 15);

    auto over = search.record(uniformStep(600, 35.0), 30.0);
    EXPECT_FALSE(over.stable);
    ASSERT_TRUE(over.stopReason.has_value());
    EXPECT_EQ(*over.stopReason, "P95 latency 35.0ms > 28.0ms (baseline 20.0ms)");

    EXPECT_TRUE(search.finished());
    auto result = search.result();
    EXPECT_EQ(result.finalBestConcurrency, 15);
    EXPECT_DOUBLE_EQ(result.baselineP95LatencyMs, 20.0);
    EXPECT_EQ(result.terminationReason, *over.stopReason);
}

TEST(FindMaxSearchTest, ErrorRateIsCheckedFirst) {
    FindMaxSearch search(searchConfig(5, 10, 100), kLookupsOnly);
    ASSERT_TRUE(search.record(uniformStep(100, 5.0), 1.0).stable);

    auto step = search.record(uniformStep(100, 50.0, 2), 1.0);
    EXPECT_FALSE(step.stable);
    EXPECT_DOUBLE_EQ(step.errorRatePct, 2.0);
    EXPECT_EQ(*step.stopReason, "Error rate 2.00% > 1%");
    EXPECT_EQ(search.bestConcurrency(), 5);
}

TEST(FindMaxSearchTest, UnstableFirstStepLeavesNoBest) {
    FindMaxSearch search(searchConfig(5, 10, 100), kLookupsOnly);
    auto step = search.record(uniformStep(10, 5.0, 5), 1.0);
    EXPECT_FALSE(step.stable);
    EXPECT_TRUE(search.finished());
    EXPECT_EQ(search.result().finalBestConcurrency, 0);
}

TEST(FindMaxSearchTest, ZeroBaselineSkipsLatencyGuard) {
    FindMaxSearch search(searchConfig(5, 10, 15), kLookupsOnly);
    ASSERT_TRUE(search.record(uniformStep(0, 0.0), 1.0).stable);
    EXPECT_TRUE(search.record(uniformStep(100, 500.0), 1.0).stable);
    EXPECT_EQ(search.result().terminationReason, kReachedMaxReason);
}

TEST(FindMaxSearchTest, BackoffThenMidpointRefinesTheBest) {
    auto cfg = searchConfig(10, 10, 100);
    cfg.maxBackoffAttempts = 1;
    FindMaxSearch search(cfg, kLookupsOnly);

    std::vector<std::pair<int, bool>> plans;
    while (auto plan = search.next()) {
        plans.emplace_back(plan->concurrency, plan->isBackoff);
        const double latency = plan->concurrency >= 30 ? 50.0 : 10.0;
        search.record(uniformStep(200, latency), 1.0);
    }

    const std::vector<std::pair<int, bool>> expected{
        {10, false}, {20, false}, {30, false}, {20, true}, {25, false}, {35, false}};
    EXPECT_EQ(plans, expected);

    auto result = search.result();
    EXPECT_EQ(result.finalBestConcurrency, 25);
    // The first unstable step names the termination.
    EXPECT_EQ(result.terminationReason,
              "P95 latency 50.0ms > 14.0ms (baseline 10.0ms)");
    EXPECT_TRUE(result.stepHistory[3].isBackoff);
}

TEST(FindMaxSearchTest, SloWithoutSamplesIsUnstable) {
    auto cfg = searchConfig(5, 10, 100);
    cfg.slo["RANGE_SCAN"].p99Ms = 10.0;
    FindMaxSearch search(cfg, {OperationKind::PointLookup, OperationKind::RangeScan});

    auto step = search.record(uniformStep(100, 2.0), 1.0);
    EXPECT_FALSE(step.stable);
    EXPECT_EQ(*step.stopReason, "RANGE_SCAN: no operations observed");
}

TEST(FindMaxSearchTest, SloLatencyLimitPerKind) {
    auto cfg = searchConfig(5, 10, 100);
    cfg.slo["RANGE_SCAN"].p99Ms = 10.0;
    FindMaxSearch search(cfg, {OperationKind::RangeScan});

    ASSERT_TRUE(search.record(uniformStep(100, 8.0, 0, OperationKind::RangeScan), 1.0).stable);
    auto step = search.record(uniformStep(100, 9.5, 0, OperationKind::RangeScan), 1.0);
    EXPECT_TRUE(step.stable);
    step = search.record(uniformStep(100, 10.5, 0, OperationKind::RangeScan), 1.0);
    EXPECT_FALSE(step.stable);
    EXPECT_EQ(*step.stopReason, "RANGE_SCAN: P99 10.5ms > 10.0ms");
}

TEST(FindMaxSearchTest, QpsDropCheckWhenEnabled) {
    auto cfg = searchConfig(5, 10, 100);
    cfg.qpsStabilityPct = 10.0;
    FindMaxSearch search(cfg, kLookupsOnly);

    ASSERT_TRUE(search.record(uniformStep(100, 5.0), 1.0).stable);
    auto step = search.record(uniformStep(80, 5.0), 1.0);
    EXPECT_FALSE(step.stable);
    EXPECT_EQ(*step.stopReason, "QPS dropped 20.0% vs previous");
}

TEST(FindMaxSearchTest, StopEndsWithStoppedReason) {
    FindMaxSearch search(searchConfig(5, 10, 100), kLookupsOnly);
    search.record(uniformStep(100, 5.0), 1.0);
    search.stop();

    EXPECT_TRUE(search.finished());
    EXPECT_FALSE(search.next().has_value());
    auto result = search.result();
    EXPECT_EQ(result.terminationReason, kStoppedReason);
    EXPECT_EQ(result.finalBestConcurrency, 5);
}
