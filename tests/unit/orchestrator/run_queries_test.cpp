#include <gtest/gtest.h>
#include <surge/orchestrator/run_queries.h>
#include <surge/store/sqlite_state_store.h>

using namespace surge;
using namespace surge::orchestrator;
using control::RunPhase;
using control::RunStatus;
using namespace std::chrono_literals;

class RunQueriesTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto opened = store::SqliteStateStore::open({.path = ":memory:"});
        ASSERT_TRUE(opened.has_value());
        store_ = std::move(opened).value();
        queries_ = std::make_unique<RunQueries>(*store_, 10s);

        store::RunRecord run;
        run.runId = "q";
        run.workersExpected = 2;
        ASSERT_TRUE(store_->createRun(run).has_value());
    }

    void write(RunStatus expected, RunStatus status, RunPhase phase) {
        store::RunTransition t;
        t.expected = expected;
        t.status = status;
        t.phase = phase;
        ASSERT_TRUE(store_->transitionRun("q", t).value());
    }

    std::unique_ptr<store::SqliteStateStore> store_;
    std::unique_ptr<RunQueries> queries_;
};

TEST_F(RunQueriesTest, ReportedStatusNeverRegresses) {
    write(RunStatus::Prepared, RunStatus::Running, RunPhase::Running);
    auto first = queries_->runStatus("q");
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first.value().status, RunStatus::Running);

    // An out-of-order row must not move the view backwards.
    write(RunStatus::Running, RunStatus::Starting, RunPhase::Warmup);
    auto second = queries_->runStatus("q");
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second.value().status, RunStatus::Running);
    EXPECT_EQ(second.value().phase, RunPhase::Running);
}

TEST_F(RunQueriesTest, MissingRunIsNotFound) {
    auto r = queries_->runStatus("missing");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::NotFound);
}

TEST_F(RunQueriesTest, StepHistoryPerWorkerAndAggregated) {
    for (const char* worker : {"w0", "w1"}) {
        for (int i = 1; i <= 2; ++i) {
            store::StepRecord step;
            step.stepIndex = i;
            step.concurrency = i * 5;
            step.qps = 100.0 * i;
            ASSERT_TRUE(store_->appendStepRecord("q", worker, step).has_value());
        }
    }

    auto all = queries_->stepHistory("q");
    ASSERT_TRUE(all.has_value());
    EXPECT_EQ(all.value().size(), 4u);

    auto one = queries_->stepHistory("q", std::string("w1"));
    ASSERT_TRUE(one.has_value());
    ASSERT_EQ(one.value().size(), 2u);
    EXPECT_EQ(one.value()[0].workerId, "w1");

    auto merged = queries_->aggregatedStepHistory("q");
    ASSERT_TRUE(merged.has_value());
    ASSERT_EQ(merged.value().size(), 2u);
    EXPECT_EQ(merged.value()[1].concurrency, 10);
    EXPECT_EQ(merged.value()[1].totalConcurrency, 20);
    EXPECT_DOUBLE_EQ(merged.value()[1].qps, 400.0);
    EXPECT_EQ(merged.value()[1].totalWorkers, 2);
}

TEST_F(RunQueriesTest, RecentRunsNewestFirst) {
    store::RunRecord later;
    later.runId = "q2";
    later.createdAtMs = epochMillis() + 1000;
    ASSERT_TRUE(store_->createRun(later).has_value());

    auto runs = queries_->recentRuns(10);
    ASSERT_TRUE(runs.has_value());
    ASSERT_EQ(runs.value().size(), 2u);
    EXPECT_EQ(runs.value()[0].runId, "q2");
}
