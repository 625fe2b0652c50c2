#include <surge/worker/target_client.h>

namespace surge::worker {

const char* toString(OperationKind kind) {
    switch (kind) {
        case OperationKind::PointLookup:
            return "POINT_LOOKUP";
        case OperationKind::RangeScan:
            return "RANGE_SCAN";
        case OperationKind::Insert:
            return "INSERT";
        case OperationKind::Update:
            return "UPDATE";
    }
    return "UNKNOWN";
}

std::optional<OperationKind> parseOperationKind(std::string_view text) {
    for (auto kind : kAllOperationKinds) {
        if (text == toString(kind))
            return kind;
    }
    return std::nullopt;
}

} // namespace surge::worker
