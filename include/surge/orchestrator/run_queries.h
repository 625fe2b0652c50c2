#pragma once

#include <surge/control/phase_state_machine.h>
#include <surge/coordination/heartbeat_registry.h>
#include <surge/core/types.h>
#include <surge/store/state_store.h>

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace surge::orchestrator {

/**
 * @brief Read-only view of runs for dashboards and the CLI.
 *
 * Status and phase go through a per-run RunStateTracker, so repeated polls
 * never report a run moving backwards even if reads arrive out of order.
 */
class RunQueries {
public:
    RunQueries(store::SharedStateStore& store, std::chrono::milliseconds staleTimeout)
        : store_(store), heartbeats_(store, staleTimeout) {}

    Result<store::RunRecord> runStatus(const std::string& runId);

    Result<std::vector<store::WorkerStepRecord>>
    stepHistory(const std::string& runId, const std::optional<std::string>& workerId = {});

    /// Step history of every worker merged per concurrency level.
    Result<std::vector<store::AggregatedStep>> aggregatedStepHistory(const std::string& runId);

    Result<coordination::HeartbeatSummary> heartbeats(const std::string& runId);

    Result<std::optional<store::RunResult>> runResult(const std::string& runId) {
        return store_.readRunResult(runId);
    }

    Result<std::vector<store::RunRecord>> recentRuns(int limit = 20) {
        return store_.listRuns(limit);
    }

private:
    store::SharedStateStore& store_;
    coordination::HeartbeatRegistry heartbeats_;
    std::mutex mutex_;
    std::map<std::string, control::RunStateTracker> trackers_;
};

} // namespace surge::orchestrator
