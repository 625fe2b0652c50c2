#pragma once

#include <boost/asio/awaitable.hpp>

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace surge::worker {

enum class OperationKind {
    PointLookup = 0,
    RangeScan,
    Insert,
    Update,
};

inline constexpr std::array<OperationKind, 4> kAllOperationKinds = {
    OperationKind::PointLookup, OperationKind::RangeScan, OperationKind::Insert,
    OperationKind::Update};

const char* toString(OperationKind kind);
std::optional<OperationKind> parseOperationKind(std::string_view text);

struct OperationOutcome {
    double latencyMs{0.0};
    bool success{true};
    std::string error;
};

/// Executes one operation against the system under test.
class TargetClient {
public:
    virtual ~TargetClient() = default;

    virtual boost::asio::awaitable<OperationOutcome> execute(OperationKind kind,
                                                             const std::string& key) = 0;
};

/// Concurrency ceiling in front of the target. acquire() suspends while the
/// ceiling is reached; every successful acquire must be paired with release().
class ConnectionPool {
public:
    virtual ~ConnectionPool() = default;

    virtual boost::asio::awaitable<void> acquire() = 0;
    virtual void release() = 0;

    virtual int inUse() const = 0;
    virtual int capacity() const = 0; ///< 0 = unbounded
};

/// Supplies keys for operations.
class WorkloadValueProvider {
public:
    virtual ~WorkloadValueProvider() = default;

    virtual std::string nextValue(const std::string& workerId, OperationKind kind) = 0;
};

} // namespace surge::worker
