#pragma once

#include <optional>
#include <string_view>

namespace surge::control {

// Run-level status as written to the run_status row. Unset stands for an
// empty or unrecognised value and ranks with PENDING.
enum class RunStatus {
    Unset = 0,
    Pending,
    Prepared,
    Starting,
    Running,
    Stopping,
    Cancelling,
    Completed,
    Failed,
    Cancelled,
    Stopped,
};

// Run phase. Failed/Cancelled/Stopped are terminal aliases that share the
// Completed rank; MEASUREMENT is accepted on input as a synonym for Running.
enum class RunPhase {
    Unknown = 0,
    Preparing,
    Warmup,
    Running,
    Processing,
    Completed,
    Failed,
    Cancelled,
    Stopped,
};

enum class WorkerStatus {
    Ready = 0,
    Running,
    Stopped,
    Failed,
};

const char* toString(RunStatus status);
const char* toString(RunPhase phase);
const char* toString(WorkerStatus status);

// Case-insensitive; unrecognised input yields Unset / Unknown / nullopt.
RunStatus parseRunStatus(std::string_view text);
RunPhase parseRunPhase(std::string_view text);
std::optional<WorkerStatus> parseWorkerStatus(std::string_view text);

int statusRank(RunStatus status);

// -1 for Unknown.
int phaseRank(RunPhase phase);

bool isTerminal(RunStatus status);

// RUNNING, CANCELLING or STOPPING: the run has started and not yet finished.
bool isActive(RunStatus status);

bool isTerminalPhase(RunPhase phase);

bool isTerminal(WorkerStatus status);

/// Monotonic status guard. Accepts when current is unset, when next equals
/// current, or when next does not rank below current.
bool acceptStatus(RunStatus current, RunStatus next);

/// Monotonic phase guard evaluated against the status the phase arrives with.
/// - unknown next phases are rejected
/// - a terminal phase is rejected while the run is still active
/// - once the run is terminal only PROCESSING or a terminal phase is accepted
/// - otherwise accepted when current is unknown or next does not rank below it
bool acceptPhase(RunPhase current, RunPhase next, RunStatus status);

/// Materialized (status, phase) pair built only through the guards above.
/// Replaying any prefix of an update stream, in any order, with duplicates,
/// never moves either field backwards.
class RunStateTracker {
public:
    RunStateTracker() = default;
    RunStateTracker(RunStatus status, RunPhase phase) : status_(status), phase_(phase) {}

    bool applyStatus(RunStatus next);
    bool applyPhase(RunPhase next, RunStatus status);

    /// Applies status first so the phase guard sees the accepted status.
    /// Returns true if either field changed.
    bool apply(RunStatus status, RunPhase phase);

    RunStatus status() const noexcept { return status_; }
    RunPhase phase() const noexcept { return phase_; }

private:
    RunStatus status_{RunStatus::Unset};
    RunPhase phase_{RunPhase::Unknown};
};

} // namespace surge::control
