#include <surge/control/phase_state_machine.h>

#include <algorithm>
#include <cctype>
#include <string>

namespace surge::control {

namespace {

std::string upper(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

} // namespace

const char* toString(RunStatus status) {
    switch (status) {
        case RunStatus::Unset:
            return "";
        case RunStatus::Pending:
            return "PENDING";
        case RunStatus::Prepared:
            return "PREPARED";
        case RunStatus::Starting:
            return "STARTING";
        case RunStatus::Running:
            return "RUNNING";
        case RunStatus::Stopping:
            return "STOPPING";
        case RunStatus::Cancelling:
            return "CANCELLING";
        case RunStatus::Completed:
            return "COMPLETED";
        case RunStatus::Failed:
            return "FAILED";
        case RunStatus::Cancelled:
            return "CANCELLED";
        case RunStatus::Stopped:
            return "STOPPED";
    }
    return "";
}

const char* toString(RunPhase phase) {
    switch (phase) {
        case RunPhase::Unknown:
            return "";
        case RunPhase::Preparing:
            return "PREPARING";
        case RunPhase::Warmup:
            return "WARMUP";
        case RunPhase::Running:
            return "RUNNING";
        case RunPhase::Processing:
            return "PROCESSING";
        case RunPhase::Completed:
            return "COMPLETED";
        case RunPhase::Failed:
            return "FAILED";
        case RunPhase::Cancelled:
            return "CANCELLED";
        case RunPhase::Stopped:
            return "STOPPED";
    }
    return "";
}

const char* toString(WorkerStatus status) {
    switch (status) {
        case WorkerStatus::Ready:
            return "READY";
        case WorkerStatus::Running:
            return "RUNNING";
        case WorkerStatus::Stopped:
            return "STOPPED";
        case WorkerStatus::Failed:
            return "FAILED";
    }
    return "FAILED";
}

RunStatus parseRunStatus(std::string_view text) {
    const auto s = upper(text);
    if (s == "PENDING")
        return RunStatus::Pending;
    if (s == "PREPARED")
        return RunStatus::Prepared;
    if (s == "STARTING")
        return RunStatus::Starting;
    if (s == "RUNNING")
        return RunStatus::Running;
    if (s == "STOPPING")
        return RunStatus::Stopping;
    if (s == "CANCELLING")
        return RunStatus::Cancelling;
    if (s == "COMPLETED")
        return RunStatus::Completed;
    if (s == "FAILED")
        return RunStatus::Failed;
    if (s == "CANCELLED")
        return RunStatus::Cancelled;
    if (s == "STOPPED")
        return RunStatus::Stopped;
    return RunStatus::Unset;
}

RunPhase parseRunPhase(std::string_view text) {
    const auto s = upper(text);
    if (s == "PREPARING")
        return RunPhase::Preparing;
    if (s == "WARMUP")
        return RunPhase::Warmup;
    if (s == "RUNNING" || s == "MEASUREMENT")
        return RunPhase::Running;
    if (s == "PROCESSING")
        return RunPhase::Processing;
    if (s == "COMPLETED")
        return RunPhase::Completed;
    if (s == "FAILED")
        return RunPhase::Failed;
    if (s == "CANCELLED")
        return RunPhase::Cancelled;
    if (s == "STOPPED")
        return RunPhase::Stopped;
    return RunPhase::Unknown;
}

std::optional<WorkerStatus> parseWorkerStatus(std::string_view text) {
    const auto s = upper(text);
    if (s == "READY")
        return WorkerStatus::Ready;
    if (s == "RUNNING")
        return WorkerStatus::Running;
    if (s == "STOPPED")
        return WorkerStatus::Stopped;
    if (s == "FAILED")
        return WorkerStatus::Failed;
    return std::nullopt;
}

int statusRank(RunStatus status) {
    switch (status) {
        case RunStatus::Unset:
        case RunStatus::Pending:
            return 0;
        case RunStatus::Prepared:
        case RunStatus::Starting:
            return 1;
        case RunStatus::Running:
            return 2;
        case RunStatus::Stopping:
        case RunStatus::Cancelling:
            return 3;
        case RunStatus::Completed:
        case RunStatus::Failed:
        case RunStatus::Cancelled:
        case RunStatus::Stopped:
            return 4;
    }
    return 0;
}

int phaseRank(RunPhase phase) {
    switch (phase) {
        case RunPhase::Unknown:
            return -1;
        case RunPhase::Preparing:
            return 0;
        case RunPhase::Warmup:
            return 1;
        case RunPhase::Running:
            return 2;
        case RunPhase::Processing:
            return 3;
        case RunPhase::Completed:
        case RunPhase::Failed:
        case RunPhase::Cancelled:
        case RunPhase::Stopped:
            return 4;
    }
    return -1;
}

bool isTerminal(RunStatus status) {
    return statusRank(status) == 4;
}

bool isActive(RunStatus status) {
    return status == RunStatus::Running || status == RunStatus::Cancelling ||
           status == RunStatus::Stopping;
}

bool isTerminalPhase(RunPhase phase) {
    return phaseRank(phase) == 4;
}

bool isTerminal(WorkerStatus status) {
    return status == WorkerStatus::Stopped || status == WorkerStatus::Failed;
}

bool acceptStatus(RunStatus current, RunStatus next) {
    if (current == RunStatus::Unset)
        return true;
    if (next == current)
        return true;
    return statusRank(next) >= statusRank(current);
}

bool acceptPhase(RunPhase current, RunPhase next, RunStatus status) {
    if (next == RunPhase::Unknown)
        return false;

    const bool nextTerminal = isTerminalPhase(next);
    if (isActive(status) && nextTerminal)
        return false;
    if (isTerminal(status) && !nextTerminal && next != RunPhase::Processing)
        return false;

    if (current == RunPhase::Unknown)
        return true;
    return phaseRank(next) >= phaseRank(current);
}

bool RunStateTracker::applyStatus(RunStatus next) {
    if (!acceptStatus(status_, next))
        return false;
    status_ = next;
    return true;
}

bool RunStateTracker::applyPhase(RunPhase next, RunStatus status) {
    if (!acceptPhase(phase_, next, status))
        return false;
    phase_ = next;
    return true;
}

bool RunStateTracker::apply(RunStatus status, RunPhase phase) {
    const auto beforeStatus = status_;
    const auto beforePhase = phase_;
    applyStatus(status);
    if (phase != RunPhase::Unknown) {
        applyPhase(phase, status_);
    }
    return beforeStatus != status_ || beforePhase != phase_;
}

} // namespace surge::control
