#pragma once

#include <surge/config/settings.h>
#include <surge/control/control_event.h>
#include <surge/control/phase_state_machine.h>
#include <surge/coordination/control_event_log.h>
#include <surge/coordination/heartbeat_registry.h>
#include <surge/core/types.h>
#include <surge/store/state_store.h>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace surge::orchestrator {

/// Splits `total` across `groups` worker groups, indexed by group id. Without a
/// cap the split is even and the remainder goes to the lowest ids; with a cap
/// each group is filled up to the cap in id order and any excess is dropped.
std::vector<int> distributeTargets(int total, int groups, int perWorkerCap);

/// Fields the orchestrator wants to move forward. Unset fields are left alone.
struct RunUpdate {
    std::optional<control::RunStatus> status;
    std::optional<control::RunPhase> phase;
    std::optional<int64_t> startTimeMs;
    std::optional<int64_t> endTimeMs;
    std::optional<std::string> message;
};

/**
 * @brief Single authority over a run's status and the control log.
 *
 * Drives a run from PREPARED through rendezvous, the measurement window and
 * the drain to a terminal status, then aggregates worker results. Every
 * write to the run row is conditional on the status it was read with and is
 * checked against the phase state machine first, so a write that lost a race
 * either retries or concludes the run already advanced.
 */
class Orchestrator {
public:
    struct Config {
        config::OrchestratorSettings orchestrator;
        config::HeartbeatSettings heartbeat;
        config::WorkloadSettings workload;
        int retryAttempts{5};
        std::chrono::milliseconds retryDelay{50};
    };

    struct Dependencies {
        boost::asio::any_io_executor executor;
        store::SharedStateStore* store{nullptr};
    };

    Orchestrator(Config config, Dependencies deps);

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /// Writes a PREPARED run row. An empty id is replaced by a generated one.
    Result<store::RunRecord> createRun(const std::string& runId = "");

    /// Runs the whole lifecycle and returns the final run row. A run that is
    /// already terminal is returned unchanged.
    boost::asio::awaitable<Result<store::RunRecord>> execute(const std::string& runId);

    /// External stop. No-op on a terminal run; a run that never started goes
    /// straight to CANCELLED; otherwise a STOP event is appended and the run
    /// moves to CANCELLING for the orchestrator driving it to finish.
    Result<void> requestStop(const std::string& runId);

    /// Appends one SCALE_TO per worker group. Only valid while the run is RUNNING.
    Result<std::vector<control::ControlEvent>> scaleTo(const std::string& runId, int total);

    /// Conditional, guard-checked update of the run row, retried on lost races.
    /// Returns true if this call wrote the row, false if the guards showed the
    /// run had already moved past the requested state.
    Result<bool> advanceRun(const std::string& runId, const RunUpdate& update);

private:
    enum class Readiness { Ready, Cancelled, TimedOut };

    struct MonitorState {
        bool draining{false};
        bool cancelled{false};
        bool failed{false};
        std::string message;
        std::chrono::steady_clock::time_point drainDeadline;
    };

    /// Polls until all workers are READY, the run is stopped or the deadline
    /// passes. Store read failures are logged and polled through.
    boost::asio::awaitable<Readiness> awaitReadiness(const std::string& runId,
                                                     std::string& detail);
    boost::asio::awaitable<Result<void>> monitor(const std::string& runId, MonitorState& state);
    boost::asio::awaitable<Result<store::RunRecord>> finalize(const std::string& runId,
                                                              const MonitorState& state);

    /// STOP event followed by the given active status; starts the drain clock.
    Result<void> beginDrain(const std::string& runId, const std::string& reason,
                            control::RunStatus status, MonitorState& state);

    /// STOP(failed) and FAILED/FAILED with `message`; returns the final row.
    boost::asio::awaitable<Result<store::RunRecord>> failRun(const std::string& runId,
                                                             const std::string& message);

    /// Drain entered without a duration STOP: CANCELLING counts as a cancel.
    void startCancelledDrain(MonitorState& state, control::RunStatus status) const;

    double drainSeconds() const;

    Config config_;
    Dependencies deps_;
    coordination::ControlEventLog log_;
    coordination::HeartbeatRegistry heartbeats_;
};

} // namespace surge::orchestrator
