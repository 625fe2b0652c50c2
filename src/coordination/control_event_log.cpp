#include <surge/coordination/control_event_log.h>

#include <spdlog/spdlog.h>

namespace surge::coordination {

Result<control::ControlEvent> ControlEventLog::append(const std::string& runId,
                                                      const control::ControlPayload& payload) {
    auto appended = store_.appendControlEvent(runId, payload);
    if (!appended) {
        spdlog::warn("[ControlLog] Failed to append {} for {}: {}",
                     control::toString(control::eventTypeOf(payload)), runId,
                     appended.error().message);
        return appended;
    }
    spdlog::debug("[ControlLog] {} #{} {}", runId, appended.value().sequence,
                  control::toString(appended.value().type()));
    return appended;
}

Result<std::vector<control::ControlEvent>> ControlEventLog::readAfter(const std::string& runId,
                                                                      int64_t afterSequence) {
    return store_.listControlEventsAfter(runId, afterSequence);
}

bool ControlEventCursor::admit(const control::ControlEvent& event) {
    if (event.sequence <= lastSeen_)
        return false;
    lastSeen_ = event.sequence;
    return true;
}

Result<std::vector<control::ControlEvent>> ControlEventCursor::poll(ControlEventLog& log,
                                                                    const std::string& runId) {
    auto batch = log.readAfter(runId, lastSeen_);
    if (!batch)
        return batch.error();

    std::vector<control::ControlEvent> admitted;
    for (const auto& event : batch.value()) {
        if (admit(event)) {
            admitted.push_back(event);
        }
    }
    return admitted;
}

} // namespace surge::coordination
