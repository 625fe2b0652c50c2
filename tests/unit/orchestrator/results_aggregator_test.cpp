#include <gtest/gtest.h>
#include <surge/orchestrator/results_aggregator.h>

using namespace surge::store;
using namespace surge::orchestrator;

namespace {

StepRecord step(int concurrency, double qps, double p95, double p99, bool stable = true,
                bool backoff = false) {
    StepRecord s;
    s.concurrency = concurrency;
    s.qps = qps;
    s.p95LatencyMs = p95;
    s.p99LatencyMs = p99;
    s.stable = stable;
    s.isBackoff = backoff;
    if (!stable)
        s.stopReason = "P95 latency too high";
    return s;
}

WorkerResult findMaxWorker(const std::string& id, int group, int best, double bestQps,
                           std::vector<StepRecord> steps) {
    WorkerResult w;
    w.workerId = id;
    w.workerGroupId = group;
    w.totalOperations = 1000;
    w.failedOperations = 3;
    FindMaxResult fm;
    fm.finalBestConcurrency = best;
    fm.finalBestQps = bestQps;
    fm.baselineP95LatencyMs = 10.0 + group;
    fm.baselineP99LatencyMs = 20.0 + group;
    fm.terminationReason = "reached max workers";
    fm.stepHistory = std::move(steps);
    w.findMax = fm;
    return w;
}

} // namespace

TEST(ResultsAggregatorTest, StepHistoryGroupsByConcurrency) {
    std::map<std::string, std::vector<StepRecord>> steps;
    steps["w0"] = {step(5, 100, 10, 12), step(15, 250, 14, 20)};
    steps["w1"] = {step(5, 110, 12, 18), step(15, 240, 30, 40, false)};
    steps["w2"] = {step(5, 90, 8, 9)};

    auto agg = aggregateStepHistory(steps, 3);
    ASSERT_EQ(agg.size(), 2u);

    EXPECT_EQ(agg[0].concurrency, 5);
    EXPECT_EQ(agg[0].activeWorkers, 3);
    EXPECT_EQ(agg[0].totalWorkers, 3);
    EXPECT_EQ(agg[0].totalConcurrency, 15);
    EXPECT_DOUBLE_EQ(agg[0].qps, 300.0);
    EXPECT_DOUBLE_EQ(agg[0].p95LatencyMs, 12.0);
    EXPECT_DOUBLE_EQ(agg[0].avgP95LatencyMs, 10.0);
    EXPECT_DOUBLE_EQ(agg[0].p99LatencyMs, 18.0);
    EXPECT_FALSE(agg[0].anyUnstable);

    EXPECT_EQ(agg[1].concurrency, 15);
    EXPECT_EQ(agg[1].activeWorkers, 2);
    EXPECT_EQ(agg[1].totalConcurrency, 30);
    EXPECT_DOUBLE_EQ(agg[1].avgP95LatencyMs, 22.0);
    EXPECT_TRUE(agg[1].anyUnstable);
    ASSERT_EQ(agg[1].unstableReasons.size(), 1u);
}

TEST(ResultsAggregatorTest, BackoffAndRepeatedLevelsCountOnce) {
    std::map<std::string, std::vector<StepRecord>> steps;
    steps["w0"] = {step(10, 100, 5, 6), step(20, 150, 50, 60, false),
                   step(10, 90, 7, 8, true, true)};

    auto agg = aggregateStepHistory(steps, 1);
    ASSERT_EQ(agg.size(), 2u);
    EXPECT_DOUBLE_EQ(agg[0].qps, 100.0);
    EXPECT_EQ(agg[0].activeWorkers, 1);
}

TEST(ResultsAggregatorTest, FindMaxSumsBestAcrossWorkers) {
    std::vector<WorkerResult> results{
        findMaxWorker("w0", 0, 15, 300.0, {step(5, 100, 10, 12), step(15, 300, 11, 13)}),
        findMaxWorker("w1", 1, 5, 120.0, {step(5, 120, 10, 12), step(15, 100, 40, 50, false)}),
        findMaxWorker("w2", 2, 25, 500.0, {step(5, 90, 9, 10)}),
    };

    auto agg = aggregateFindMax(results);
    EXPECT_TRUE(agg.isAggregate);
    EXPECT_EQ(agg.totalWorkers, 3);
    EXPECT_EQ(agg.totalNodes, 3);
    EXPECT_EQ(agg.finalBestConcurrency, 45);
    EXPECT_DOUBLE_EQ(agg.finalBestQps, 920.0);
    EXPECT_DOUBLE_EQ(agg.baselineP95LatencyMs, 12.0);
    EXPECT_DOUBLE_EQ(agg.baselineP99LatencyMs, 22.0);
    ASSERT_EQ(agg.perWorkerResults.size(), 3u);
    EXPECT_EQ(agg.perWorkerResults[1].workerId, "w1");
    EXPECT_EQ(agg.perWorkerResults[1].workerGroupId, 1);
    ASSERT_EQ(agg.stepHistory.size(), 2u);
    EXPECT_EQ(agg.stepHistory[1].activeWorkers, 2);
}

TEST(ResultsAggregatorTest, RunTotalsAndOptionalFindMax) {
    WorkerResult plain;
    plain.workerId = "w0";
    plain.totalOperations = 500;
    plain.failedOperations = 5;

    auto fixed = aggregateResults("run", {plain, plain});
    EXPECT_EQ(fixed.runId, "run");
    EXPECT_EQ(fixed.workersReported, 2);
    EXPECT_EQ(fixed.totalOperations, 1000);
    EXPECT_EQ(fixed.failedOperations, 10);
    EXPECT_FALSE(fixed.findMax.has_value());
    EXPECT_GT(fixed.completedAtMs, 0);

    auto searched =
        aggregateResults("run", {plain, findMaxWorker("w1", 1, 10, 50.0, {step(10, 50, 1, 2)})});
    ASSERT_TRUE(searched.findMax.has_value());
    EXPECT_EQ(searched.findMax->totalWorkers, 1);
    EXPECT_EQ(searched.findMax->finalBestConcurrency, 10);
    EXPECT_EQ(searched.totalOperations, 1500);
}

TEST(ResultsAggregatorTest, NoResultsAggregateToZero) {
    auto agg = aggregateFindMax({});
    EXPECT_EQ(agg.totalWorkers, 0);
    EXPECT_EQ(agg.finalBestConcurrency, 0);
    EXPECT_TRUE(agg.stepHistory.empty());
}
