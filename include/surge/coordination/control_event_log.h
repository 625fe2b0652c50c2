#pragma once

#include <surge/control/control_event.h>
#include <surge/store/state_store.h>

#include <cstdint>
#include <string>
#include <vector>

namespace surge::coordination {

/**
 * @brief Append-only, per-run ordered command log.
 *
 * The orchestrator is the only writer. Sequences are strictly increasing per
 * run and assigned by the store.
 */
class ControlEventLog {
public:
    explicit ControlEventLog(store::SharedStateStore& store) : store_(store) {}

    Result<control::ControlEvent> append(const std::string& runId,
                                         const control::ControlPayload& payload);

    Result<std::vector<control::ControlEvent>> readAfter(const std::string& runId,
                                                         int64_t afterSequence);

private:
    store::SharedStateStore& store_;
};

/**
 * @brief Per-consumer position in a run's control log.
 *
 * An event is handed out at most once: anything at or below the last seen
 * sequence is dropped, so replays and out-of-order reads are harmless.
 */
class ControlEventCursor {
public:
    explicit ControlEventCursor(int64_t lastSeenSequence = 0) : lastSeen_(lastSeenSequence) {}

    /// Returns true and advances if the event is newer than anything seen.
    bool admit(const control::ControlEvent& event);

    /// Reads events after the cursor and returns the admitted ones in order.
    Result<std::vector<control::ControlEvent>> poll(ControlEventLog& log, const std::string& runId);

    int64_t lastSeenSequence() const noexcept { return lastSeen_; }

private:
    int64_t lastSeen_;
};

} // namespace surge::coordination
