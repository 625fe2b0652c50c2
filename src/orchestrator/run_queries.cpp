#include <surge/orchestrator/run_queries.h>

#include <surge/orchestrator/results_aggregator.h>

namespace surge::orchestrator {

Result<store::RunRecord> RunQueries::runStatus(const std::string& runId) {
    auto run = store_.readRun(runId);
    if (!run)
        return run.error();

    auto record = std::move(run).value();
    std::scoped_lock lock(mutex_);
    auto& tracker = trackers_[runId];
    tracker.apply(record.status, record.phase);
    record.status = tracker.status();
    record.phase = tracker.phase();
    return record;
}

Result<std::vector<store::WorkerStepRecord>>
RunQueries::stepHistory(const std::string& runId, const std::optional<std::string>& workerId) {
    return store_.listStepRecords(runId, workerId);
}

Result<std::vector<store::AggregatedStep>>
RunQueries::aggregatedStepHistory(const std::string& runId) {
    auto rows = store_.listStepRecords(runId, std::nullopt);
    if (!rows)
        return rows.error();

    std::map<std::string, std::vector<store::StepRecord>> byWorker;
    for (auto& row : rows.value()) {
        byWorker[row.workerId].push_back(row.step);
    }
    return aggregateStepHistory(byWorker, static_cast<int>(byWorker.size()));
}

Result<coordination::HeartbeatSummary> RunQueries::heartbeats(const std::string& runId) {
    return heartbeats_.summarize(runId);
}

} // namespace surge::orchestrator
