#pragma once

#include <surge/control/phase_state_machine.h>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace surge::store {

struct RunRecord {
    std::string runId;
    control::RunStatus status{control::RunStatus::Prepared};
    control::RunPhase phase{control::RunPhase::Preparing};
    int workersExpected{1};
    std::string loadMode{"concurrency"};
    std::optional<int64_t> startTimeMs;
    std::optional<int64_t> endTimeMs;
    int64_t createdAtMs{0};
    int64_t updatedAtMs{0};
    std::string message;
};

/// Conditional update of a run row. Applied only while the stored status
/// equals `expected`; unset fields are left untouched.
struct RunTransition {
    control::RunStatus expected{control::RunStatus::Prepared};
    std::optional<control::RunStatus> status;
    std::optional<control::RunPhase> phase;
    std::optional<int64_t> startTimeMs;
    std::optional<int64_t> endTimeMs;
    std::optional<std::string> message;
};

struct HeartbeatRecord {
    std::string runId;
    std::string workerId;
    int workerGroupId{0};
    control::WorkerStatus status{control::WorkerStatus::Ready};
    control::RunPhase phase{control::RunPhase::Unknown};
    int64_t lastHeartbeatMs{0};
    int64_t heartbeatCount{0}; // maintained by the store on every upsert
    int activeTasks{0};
    int targetConcurrency{0};
    int64_t operations{0};
    int64_t errors{0};
    std::string lastError;
};

struct KindStepMetrics {
    double p95LatencyMs{0.0};
    double p99LatencyMs{0.0};
    std::optional<double> errorRatePct; // empty when the kind saw no operations
    int64_t operations{0};
};

struct StepRecord {
    int stepIndex{0};
    int concurrency{0};
    double qps{0.0};
    double p95LatencyMs{0.0};
    double p99LatencyMs{0.0};
    double errorRatePct{0.0};
    bool stable{true};
    std::optional<std::string> stopReason;
    bool isBackoff{false};
    int64_t operations{0};
    int64_t errors{0};
    double durationSeconds{0.0};
    std::map<std::string, KindStepMetrics> kindMetrics;
    int64_t recordedAtMs{0};
};

struct WorkerStepRecord {
    std::string workerId;
    StepRecord step;
};

struct FindMaxResult {
    int finalBestConcurrency{0};
    double finalBestQps{0.0};
    double baselineP95LatencyMs{0.0};
    double baselineP99LatencyMs{0.0};
    std::string terminationReason;
    std::vector<StepRecord> stepHistory;
};

struct WorkerResult {
    std::string workerId;
    int workerGroupId{0};
    control::RunStatus status{control::RunStatus::Completed};
    std::string message;
    int64_t totalOperations{0};
    int64_t failedOperations{0};
    std::optional<FindMaxResult> findMax;
    int64_t reportedAtMs{0};
};

/// One concurrency level across every worker that ran it.
struct AggregatedStep {
    int concurrency{0};
    int totalConcurrency{0};
    double qps{0.0};
    double p95LatencyMs{0.0};
    double p99LatencyMs{0.0};
    double avgP95LatencyMs{0.0};
    double avgP99LatencyMs{0.0};
    int activeWorkers{0};
    int totalWorkers{0};
    bool anyUnstable{false};
    std::vector<std::string> unstableReasons;
};

struct PerWorkerFindMax {
    std::string workerId;
    int workerGroupId{0};
    FindMaxResult result;
};

struct AggregatedFindMaxResult {
    int totalWorkers{0};
    int totalNodes{0};
    int finalBestConcurrency{0};
    double finalBestQps{0.0};
    double baselineP95LatencyMs{0.0};
    double baselineP99LatencyMs{0.0};
    std::vector<PerWorkerFindMax> perWorkerResults;
    std::vector<AggregatedStep> stepHistory;
    bool isAggregate{true};
};

struct RunResult {
    std::string runId;
    int64_t totalOperations{0};
    int64_t failedOperations{0};
    int workersReported{0};
    std::optional<AggregatedFindMaxResult> findMax;
    int64_t completedAtMs{0};
};

} // namespace surge::store
