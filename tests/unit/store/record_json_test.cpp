#include <gtest/gtest.h>
#include <surge/store/record_json.h>

using namespace surge::store;
using nlohmann::json;

TEST(RecordJsonTest, StepRecordFieldNames) {
    StepRecord step;
    step.stepIndex = 2;
    step.concurrency = 15;
    step.stable = false;
    step.stopReason = "P95 latency 30.0ms > 28.0ms (baseline 20.0ms)";
    step.kindMetrics["INSERT"] = KindStepMetrics{4.0, 6.0, std::nullopt, 0};

    const json j = step;
    EXPECT_EQ(j["step_index"], 2);
    EXPECT_EQ(j["concurrency"], 15);
    EXPECT_EQ(j["stable"], false);
    EXPECT_EQ(j["stop_reason"], *step.stopReason);
    EXPECT_TRUE(j["kind_metrics"]["INSERT"]["error_rate_pct"].is_null());
}

TEST(RecordJsonTest, MissingOptionalFieldsDecodeToDefaults) {
    auto step = json::parse(R"({"step_index": 1, "concurrency": 5, "qps": 100.5})").get<StepRecord>();
    EXPECT_EQ(step.stepIndex, 1);
    EXPECT_DOUBLE_EQ(step.qps, 100.5);
    EXPECT_TRUE(step.stable);
    EXPECT_FALSE(step.stopReason.has_value());
    EXPECT_FALSE(step.isBackoff);
    EXPECT_TRUE(step.kindMetrics.empty());
}

TEST(RecordJsonTest, PerWorkerResultIsFlattened) {
    PerWorkerFindMax p;
    p.workerId = "w-2";
    p.workerGroupId = 2;
    p.result.finalBestConcurrency = 25;
    p.result.terminationReason = "reached max workers";

    const json j = p;
    EXPECT_EQ(j["worker_id"], "w-2");
    EXPECT_EQ(j["final_best_concurrency"], 25);
    EXPECT_EQ(j["termination_reason"], "reached max workers");

    auto back = j.get<PerWorkerFindMax>();
    EXPECT_EQ(back.workerGroupId, 2);
    EXPECT_EQ(back.result.finalBestConcurrency, 25);
}

TEST(RecordJsonTest, RunRecordUsesWireStatusNames) {
    RunRecord run;
    run.runId = "r1";
    run.status = surge::control::RunStatus::Cancelling;
    run.phase = surge::control::RunPhase::Running;

    const json j = run;
    EXPECT_EQ(j["status"], "CANCELLING");
    EXPECT_EQ(j["phase"], "RUNNING");
    EXPECT_TRUE(j["start_time"].is_null());
}
