#pragma once

#include <surge/core/types.h>
#include <surge/store/state_store.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace surge::coordination {

/// Point-in-time view of a run's worker group.
struct HeartbeatSummary {
    int total{0};
    int alive{0}; // fresh and not in a terminal worker state
    int stale{0};
    int ready{0};
    int running{0};
    int stopped{0};
    int failed{0};
    std::vector<std::string> staleWorkerIds;
    std::vector<store::HeartbeatRecord> workers;

    int terminal() const noexcept { return stopped + failed; }
};

/// A worker is stale when it has not reached a terminal state and its last
/// heartbeat is older than `staleTimeout` at `nowMs`.
bool isStale(const store::HeartbeatRecord& hb, int64_t nowMs,
             std::chrono::milliseconds staleTimeout);

HeartbeatSummary classify(const std::vector<store::HeartbeatRecord>& rows, int64_t nowMs,
                          std::chrono::milliseconds staleTimeout);

/**
 * @brief Heartbeat table access for one run.
 *
 * Workers publish through `beat`; the orchestrator and query surface read
 * through `summarize`.
 */
class HeartbeatRegistry {
public:
    HeartbeatRegistry(store::SharedStateStore& store, std::chrono::milliseconds staleTimeout)
        : store_(store), staleTimeout_(staleTimeout) {}

    Result<void> beat(const store::HeartbeatRecord& hb) { return store_.upsertHeartbeat(hb); }

    Result<HeartbeatSummary> summarize(const std::string& runId, int64_t nowMs = epochMillis());

    /// Removes every heartbeat row of the run; returns the number removed.
    Result<int> clear(const std::string& runId) { return store_.deleteHeartbeats(runId); }

    std::chrono::milliseconds staleTimeout() const noexcept { return staleTimeout_; }

private:
    store::SharedStateStore& store_;
    std::chrono::milliseconds staleTimeout_;
};

} // namespace surge::coordination
