#include <surge/control/control_event.h>

#include <nlohmann/json.hpp>

#include <type_traits>

namespace surge::control {

using json = nlohmann::json;

ControlEventType eventTypeOf(const ControlPayload& payload) {
    return std::visit(
        [](const auto& p) -> ControlEventType {
            using T = std::decay_t<decltype(p)>;
            if constexpr (std::is_same_v<T, SetPhasePayload>) {
                return ControlEventType::SetPhase;
            } else if constexpr (std::is_same_v<T, ScaleToPayload>) {
                return ControlEventType::ScaleTo;
            } else if constexpr (std::is_same_v<T, StopPayload>) {
                return ControlEventType::Stop;
            } else {
                static_assert(kUnhandledPayload<T>, "unhandled control payload");
            }
        },
        payload);
}

ControlEventType ControlEvent::type() const {
    return eventTypeOf(payload);
}

const char* toString(ControlEventType type) {
    switch (type) {
        case ControlEventType::SetPhase:
            return "SET_PHASE";
        case ControlEventType::ScaleTo:
            return "SCALE_TO";
        case ControlEventType::Stop:
            return "STOP";
    }
    return "";
}

std::optional<ControlEventType> parseControlEventType(std::string_view text) {
    if (text == "SET_PHASE")
        return ControlEventType::SetPhase;
    if (text == "SCALE_TO")
        return ControlEventType::ScaleTo;
    if (text == "STOP")
        return ControlEventType::Stop;
    return std::nullopt;
}

std::string encodeEventData(const ControlPayload& payload) {
    json j = json::object();
    std::visit(
        [&j](const auto& p) {
            using T = std::decay_t<decltype(p)>;
            if constexpr (std::is_same_v<T, SetPhasePayload>) {
                j["phase"] = toString(p.phase);
            } else if constexpr (std::is_same_v<T, ScaleToPayload>) {
                j["target"] = p.target;
                if (p.workerGroupId) {
                    j["worker_group_id"] = *p.workerGroupId;
                }
            } else if constexpr (std::is_same_v<T, StopPayload>) {
                j["reason"] = p.reason;
                j["drain_timeout_seconds"] = p.drainTimeoutSeconds;
            } else {
                static_assert(kUnhandledPayload<T>, "unhandled control payload");
            }
        },
        payload);
    return j.dump();
}

Result<ControlPayload> decodeEventData(ControlEventType type, std::string_view text) {
    json j;
    try {
        j = json::parse(text.begin(), text.end());
    } catch (const json::parse_error& e) {
        return Error{ErrorCode::InvalidData, std::string("event_data is not JSON: ") + e.what()};
    }
    if (!j.is_object()) {
        return Error{ErrorCode::InvalidData, "event_data must be a JSON object"};
    }

    try {
        switch (type) {
            case ControlEventType::SetPhase: {
                auto phase = parseRunPhase(j.value("phase", std::string{}));
                if (phase == RunPhase::Unknown) {
                    return Error{ErrorCode::InvalidData, "SET_PHASE without a known phase"};
                }
                return ControlPayload{SetPhasePayload{phase}};
            }
            case ControlEventType::ScaleTo: {
                if (!j.contains("target") || !j["target"].is_number_integer()) {
                    return Error{ErrorCode::InvalidData, "SCALE_TO without an integer target"};
                }
                ScaleToPayload p;
                p.target = j["target"].get<int>();
                if (p.target < 0) {
                    return Error{ErrorCode::InvalidData, "SCALE_TO target must be >= 0"};
                }
                if (j.contains("worker_group_id") && !j["worker_group_id"].is_null()) {
                    p.workerGroupId = j["worker_group_id"].get<int>();
                }
                return ControlPayload{p};
            }
            case ControlEventType::Stop: {
                StopPayload p;
                p.reason = j.value("reason", std::string{});
                p.drainTimeoutSeconds = j.value("drain_timeout_seconds", 0.0);
                return ControlPayload{p};
            }
        }
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidData, std::string("bad event_data: ") + e.what()};
    }
    return Error{ErrorCode::InvalidData, "unknown event type"};
}

} // namespace surge::control
