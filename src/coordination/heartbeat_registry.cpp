#include <surge/coordination/heartbeat_registry.h>

namespace surge::coordination {

using control::WorkerStatus;

bool isStale(const store::HeartbeatRecord& hb, int64_t nowMs,
             std::chrono::milliseconds staleTimeout) {
    if (control::isTerminal(hb.status))
        return false;
    return nowMs - hb.lastHeartbeatMs > staleTimeout.count();
}

HeartbeatSummary classify(const std::vector<store::HeartbeatRecord>& rows, int64_t nowMs,
                          std::chrono::milliseconds staleTimeout) {
    HeartbeatSummary s;
    s.total = static_cast<int>(rows.size());
    s.workers = rows;
    for (const auto& hb : rows) {
        switch (hb.status) {
            case WorkerStatus::Ready:
                ++s.ready;
                break;
            case WorkerStatus::Running:
                ++s.running;
                break;
            case WorkerStatus::Stopped:
                ++s.stopped;
                break;
            case WorkerStatus::Failed:
                ++s.failed;
                break;
        }
        if (isStale(hb, nowMs, staleTimeout)) {
            ++s.stale;
            s.staleWorkerIds.push_back(hb.workerId);
        } else if (!control::isTerminal(hb.status)) {
            ++s.alive;
        }
    }
    return s;
}

Result<HeartbeatSummary> HeartbeatRegistry::summarize(const std::string& runId, int64_t nowMs) {
    auto rows = store_.listHeartbeats(runId);
    if (!rows)
        return rows.error();
    return classify(rows.value(), nowMs, staleTimeout_);
}

} // namespace surge::coordination
