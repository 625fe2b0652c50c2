#pragma once

#include <surge/control/control_event.h>
#include <surge/core/types.h>
#include <surge/store/records.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace surge::store {

/**
 * @brief Durable coordination store shared by the orchestrator and every worker.
 *
 * Reads always observe the most recent committed write; nothing is cached
 * behind this interface. Conditional writes report whether they applied, and
 * event appends return the sequence they were assigned.
 */
class SharedStateStore {
public:
    virtual ~SharedStateStore() = default;

    // run_status
    virtual Result<void> createRun(const RunRecord& run) = 0;
    virtual Result<RunRecord> readRun(const std::string& runId) = 0;

    /// @return true if the stored status matched `expected` and the row changed.
    virtual Result<bool> transitionRun(const std::string& runId, const RunTransition& t) = 0;

    virtual Result<std::vector<RunRecord>> listRuns(int limit) = 0;

    // worker_heartbeats
    virtual Result<void> upsertHeartbeat(const HeartbeatRecord& hb) = 0;
    virtual Result<std::vector<HeartbeatRecord>> listHeartbeats(const std::string& runId) = 0;
    virtual Result<int> deleteHeartbeats(const std::string& runId) = 0;

    // control_events
    virtual Result<control::ControlEvent> appendControlEvent(const std::string& runId,
                                                             const control::ControlPayload& p) = 0;
    virtual Result<std::vector<control::ControlEvent>>
    listControlEventsAfter(const std::string& runId, int64_t afterSequence) = 0;

    // step_records
    virtual Result<void> appendStepRecord(const std::string& runId, const std::string& workerId,
                                          const StepRecord& step) = 0;
    virtual Result<std::vector<WorkerStepRecord>>
    listStepRecords(const std::string& runId, const std::optional<std::string>& workerId) = 0;

    // worker_results / run_results
    virtual Result<void> putWorkerResult(const std::string& runId, const WorkerResult& r) = 0;
    virtual Result<std::vector<WorkerResult>> listWorkerResults(const std::string& runId) = 0;
    virtual Result<void> putRunResult(const RunResult& r) = 0;
    virtual Result<std::optional<RunResult>> readRunResult(const std::string& runId) = 0;
};

} // namespace surge::store
