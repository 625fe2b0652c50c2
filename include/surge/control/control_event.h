#pragma once

#include <surge/control/phase_state_machine.h>
#include <surge/core/types.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace surge::control {

enum class ControlEventType {
    SetPhase,
    ScaleTo,
    Stop,
};

struct SetPhasePayload {
    RunPhase phase{RunPhase::Unknown};
};

// A missing worker group id addresses every worker in the run.
struct ScaleToPayload {
    int target{0};
    std::optional<int> workerGroupId;
};

struct StopPayload {
    std::string reason;
    double drainTimeoutSeconds{0.0};
};

using ControlPayload = std::variant<SetPhasePayload, ScaleToPayload, StopPayload>;

// For the exhaustiveness static_assert in std::visit over ControlPayload.
template <typename> inline constexpr bool kUnhandledPayload = false;

// STOP reasons written by the orchestrator.
inline constexpr const char* kStopDurationElapsed = "duration_elapsed";
inline constexpr const char* kStopCancelled = "cancelled";
inline constexpr const char* kStopFailed = "failed";

struct ControlEvent {
    std::string runId;
    int64_t sequence{0};
    ControlPayload payload;
    int64_t timestampMs{0};

    ControlEventType type() const;
};

const char* toString(ControlEventType type);
std::optional<ControlEventType> parseControlEventType(std::string_view text);

ControlEventType eventTypeOf(const ControlPayload& payload);

/// Serialises the payload into the JSON object stored in event_data.
std::string encodeEventData(const ControlPayload& payload);

/// Parses event_data for the given type. Malformed or incomplete payloads are
/// reported as ErrorCode::InvalidData.
Result<ControlPayload> decodeEventData(ControlEventType type, std::string_view json);

inline bool appliesToGroup(const ScaleToPayload& payload, int workerGroupId) {
    return !payload.workerGroupId || *payload.workerGroupId == workerGroupId;
}

} // namespace surge::control
