#include <surge/store/record_json.h>

namespace surge::store {

using nlohmann::json;

namespace {

template <typename T> json optionalToJson(const std::optional<T>& v) {
    return v ? json(*v) : json(nullptr);
}

template <typename T> std::optional<T> optionalFromJson(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return std::nullopt;
    return it->get<T>();
}

} // namespace

void to_json(json& j, const KindStepMetrics& m) {
    j = json{{"p95_latency_ms", m.p95LatencyMs},
             {"p99_latency_ms", m.p99LatencyMs},
             {"error_rate_pct", optionalToJson(m.errorRatePct)},
             {"operations", m.operations}};
}

void from_json(const json& j, KindStepMetrics& m) {
    m.p95LatencyMs = j.value("p95_latency_ms", 0.0);
    m.p99LatencyMs = j.value("p99_latency_ms", 0.0);
    m.errorRatePct = optionalFromJson<double>(j, "error_rate_pct");
    m.operations = j.value("operations", int64_t{0});
}

void to_json(json& j, const StepRecord& s) {
    j = json{{"step_index", s.stepIndex},
             {"concurrency", s.concurrency},
             {"qps", s.qps},
             {"p95_latency_ms", s.p95LatencyMs},
             {"p99_latency_ms", s.p99LatencyMs},
             {"error_rate_pct", s.errorRatePct},
             {"stable", s.stable},
             {"stop_reason", optionalToJson(s.stopReason)},
             {"is_backoff", s.isBackoff},
             {"operations", s.operations},
             {"errors", s.errors},
             {"duration_seconds", s.durationSeconds},
             {"kind_metrics", s.kindMetrics},
             {"recorded_at", s.recordedAtMs}};
}

void from_json(const json& j, StepRecord& s) {
    s.stepIndex = j.value("step_index", 0);
    s.concurrency = j.value("concurrency", 0);
    s.qps = j.value("qps", 0.0);
    s.p95LatencyMs = j.value("p95_latency_ms", 0.0);
    s.p99LatencyMs = j.value("p99_latency_ms", 0.0);
    s.errorRatePct = j.value("error_rate_pct", 0.0);
    s.stable = j.value("stable", true);
    s.stopReason = optionalFromJson<std::string>(j, "stop_reason");
    s.isBackoff = j.value("is_backoff", false);
    s.operations = j.value("operations", int64_t{0});
    s.errors = j.value("errors", int64_t{0});
    s.durationSeconds = j.value("duration_seconds", 0.0);
    s.kindMetrics.clear();
    if (auto it = j.find("kind_metrics"); it != j.end() && it->is_object()) {
        s.kindMetrics = it->get<std::map<std::string, KindStepMetrics>>();
    }
    s.recordedAtMs = j.value("recorded_at", int64_t{0});
}

void to_json(json& j, const FindMaxResult& r) {
    j = json{{"final_best_concurrency", r.finalBestConcurrency},
             {"final_best_qps", r.finalBestQps},
             {"baseline_p95_latency_ms", r.baselineP95LatencyMs},
             {"baseline_p99_latency_ms", r.baselineP99LatencyMs},
             {"termination_reason", r.terminationReason},
             {"step_history", r.stepHistory}};
}

void from_json(const json& j, FindMaxResult& r) {
    r.finalBestConcurrency = j.value("final_best_concurrency", 0);
    r.finalBestQps = j.value("final_best_qps", 0.0);
    r.baselineP95LatencyMs = j.value("baseline_p95_latency_ms", 0.0);
    r.baselineP99LatencyMs = j.value("baseline_p99_latency_ms", 0.0);
    r.terminationReason = j.value("termination_reason", std::string{});
    r.stepHistory.clear();
    if (auto it = j.find("step_history"); it != j.end() && it->is_array()) {
        r.stepHistory = it->get<std::vector<StepRecord>>();
    }
}

void to_json(json& j, const AggregatedStep& s) {
    j = json{{"concurrency", s.concurrency},
             {"total_concurrency", s.totalConcurrency},
             {"qps", s.qps},
             {"p95_latency_ms", s.p95LatencyMs},
             {"p99_latency_ms", s.p99LatencyMs},
             {"avg_p95_latency_ms", s.avgP95LatencyMs},
             {"avg_p99_latency_ms", s.avgP99LatencyMs},
             {"active_workers", s.activeWorkers},
             {"total_workers", s.totalWorkers},
             {"any_unstable", s.anyUnstable},
             {"unstable_reasons", s.unstableReasons}};
}

void from_json(const json& j, AggregatedStep& s) {
    s.concurrency = j.value("concurrency", 0);
    s.totalConcurrency = j.value("total_concurrency", 0);
    s.qps = j.value("qps", 0.0);
    s.p95LatencyMs = j.value("p95_latency_ms", 0.0);
    s.p99LatencyMs = j.value("p99_latency_ms", 0.0);
    s.avgP95LatencyMs = j.value("avg_p95_latency_ms", 0.0);
    s.avgP99LatencyMs = j.value("avg_p99_latency_ms", 0.0);
    s.activeWorkers = j.value("active_workers", 0);
    s.totalWorkers = j.value("total_workers", 0);
    s.anyUnstable = j.value("any_unstable", false);
    s.unstableReasons = j.value("unstable_reasons", std::vector<std::string>{});
}

void to_json(json& j, const PerWorkerFindMax& p) {
    j = json(p.result);
    j["worker_id"] = p.workerId;
    j["worker_group_id"] = p.workerGroupId;
}

void from_json(const json& j, PerWorkerFindMax& p) {
    p.workerId = j.value("worker_id", std::string{});
    p.workerGroupId = j.value("worker_group_id", 0);
    p.result = j.get<FindMaxResult>();
}

void to_json(json& j, const AggregatedFindMaxResult& r) {
    j = json{{"total_workers", r.totalWorkers},
             {"total_nodes", r.totalNodes},
             {"final_best_concurrency", r.finalBestConcurrency},
             {"final_best_qps", r.finalBestQps},
             {"baseline_p95_latency_ms", r.baselineP95LatencyMs},
             {"baseline_p99_latency_ms", r.baselineP99LatencyMs},
             {"per_worker_results", r.perWorkerResults},
             {"step_history", r.stepHistory},
             {"is_aggregate", r.isAggregate}};
}

void from_json(const json& j, AggregatedFindMaxResult& r) {
    r.totalWorkers = j.value("total_workers", 0);
    r.totalNodes = j.value("total_nodes", 0);
    r.finalBestConcurrency = j.value("final_best_concurrency", 0);
    r.finalBestQps = j.value("final_best_qps", 0.0);
    r.baselineP95LatencyMs = j.value("baseline_p95_latency_ms", 0.0);
    r.baselineP99LatencyMs = j.value("baseline_p99_latency_ms", 0.0);
    r.perWorkerResults = j.value("per_worker_results", std::vector<PerWorkerFindMax>{});
    r.stepHistory = j.value("step_history", std::vector<AggregatedStep>{});
    r.isAggregate = j.value("is_aggregate", true);
}

void to_json(json& j, const RunRecord& r) {
    j = json{{"run_id", r.runId},
             {"status", control::toString(r.status)},
             {"phase", control::toString(r.phase)},
             {"workers_expected", r.workersExpected},
             {"load_mode", r.loadMode},
             {"start_time", optionalToJson(r.startTimeMs)},
             {"end_time", optionalToJson(r.endTimeMs)},
             {"created_at", r.createdAtMs},
             {"updated_at", r.updatedAtMs},
             {"message", r.message}};
}

void to_json(json& j, const HeartbeatRecord& h) {
    j = json{{"worker_id", h.workerId},
             {"worker_group_id", h.workerGroupId},
             {"status", control::toString(h.status)},
             {"phase", control::toString(h.phase)},
             {"last_heartbeat", h.lastHeartbeatMs},
             {"heartbeat_count", h.heartbeatCount},
             {"active_tasks", h.activeTasks},
             {"target_concurrency", h.targetConcurrency},
             {"operations", h.operations},
             {"errors", h.errors},
             {"last_error", h.lastError}};
}

void to_json(json& j, const WorkerResult& w) {
    j = json{{"worker_id", w.workerId},
             {"worker_group_id", w.workerGroupId},
             {"status", control::toString(w.status)},
             {"message", w.message},
             {"total_operations", w.totalOperations},
             {"failed_operations", w.failedOperations},
             {"reported_at", w.reportedAtMs}};
    if (w.findMax) {
        j["find_max_result"] = *w.findMax;
    }
}

void to_json(json& j, const RunResult& r) {
    j = json{{"run_id", r.runId},
             {"total_operations", r.totalOperations},
             {"failed_operations", r.failedOperations},
             {"workers_reported", r.workersReported},
             {"completed_at", r.completedAtMs}};
    if (r.findMax) {
        j["find_max_result"] = *r.findMax;
    }
}

} // namespace surge::store
