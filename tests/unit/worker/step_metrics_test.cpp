#include <gtest/gtest.h>
#include <surge/worker/step_metrics.h>

using namespace surge::worker;

TEST(PercentileTest, IndexesByFloorAndClamps) {
    EXPECT_DOUBLE_EQ(percentile({}, 95.0), 0.0);
    EXPECT_DOUBLE_EQ(percentile({7.0}, 99.0), 7.0);

    std::vector<double> hundred;
    for (int i = 1; i <= 100; ++i)
        hundred.push_back(static_cast<double>(i));
    // floor(100 * 0.95) = 95 -> the 96th value
    EXPECT_DOUBLE_EQ(percentile(hundred, 95.0), 96.0);
    EXPECT_DOUBLE_EQ(percentile(hundred, 99.0), 100.0);
    EXPECT_DOUBLE_EQ(percentile(hundred, 100.0), 100.0);
    EXPECT_DOUBLE_EQ(percentile(hundred, 0.0), 1.0);

    EXPECT_DOUBLE_EQ(percentile({1.0, 2.0, 3.0, 4.0}, 95.0), 4.0);
}

TEST(StepMetricsCollectorTest, FailuresCountButCarryNoLatency) {
    StepMetricsCollector metrics;
    metrics.record(OperationKind::PointLookup, {4.0, true, {}});
    metrics.record(OperationKind::PointLookup, {9.0, false, "timeout"});
    metrics.record(OperationKind::Insert, {6.0, true, {}});

    auto snap = metrics.snapshot();
    EXPECT_EQ(snap.operations, 3);
    EXPECT_EQ(snap.errors, 1);
    EXPECT_EQ(snap.latenciesMs, (std::vector<double>{4.0, 6.0}));

    ASSERT_EQ(snap.byKind.count(OperationKind::PointLookup), 1u);
    const auto& lookups = snap.byKind.at(OperationKind::PointLookup);
    EXPECT_EQ(lookups.operations, 2);
    EXPECT_EQ(lookups.errors, 1);
    EXPECT_EQ(lookups.latenciesMs.size(), 1u);

    EXPECT_EQ(metrics.lastError(), "timeout");
}

TEST(StepMetricsCollectorTest, ResetKeepsLifetimeCounters) {
    StepMetricsCollector metrics;
    for (int i = 0; i < 10; ++i)
        metrics.record(OperationKind::Update, {1.0, i % 5 != 0, "conflict"});

    metrics.reset();
    auto snap = metrics.snapshot();
    EXPECT_EQ(snap.operations, 0);
    EXPECT_TRUE(snap.latenciesMs.empty());
    EXPECT_TRUE(snap.byKind.empty());

    EXPECT_EQ(metrics.totalOperations(), 10);
    EXPECT_EQ(metrics.failedOperations(), 2);

    metrics.record(OperationKind::Update, {2.0, true, {}});
    EXPECT_EQ(metrics.snapshot().operations, 1);
    EXPECT_EQ(metrics.totalOperations(), 11);
}
