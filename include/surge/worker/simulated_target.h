#pragma once

#include <surge/config/settings.h>
#include <surge/worker/target_client.h>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>

#include <cstdint>
#include <list>
#include <mutex>
#include <random>

namespace surge::worker {

/// Target stand-in for running without a real data system. Latency grows
/// linearly with the number of operations in flight, so a find-max search
/// against it has a well-defined knee.
class SimulatedTargetClient final : public TargetClient {
public:
    using Config = config::TargetSettings;

    SimulatedTargetClient(boost::asio::any_io_executor executor, Config config,
                          uint64_t seed = std::random_device{}());

    boost::asio::awaitable<OperationOutcome> execute(OperationKind kind,
                                                     const std::string& key) override;

    int inFlight() const noexcept { return inFlight_; }

private:
    double sampleLatencyMs(OperationKind kind);
    bool sampleFailure();

    boost::asio::any_io_executor executor_;
    Config config_;
    std::mt19937_64 rng_;
    std::mutex rngMutex_;
    int inFlight_{0};
};

/// Counting pool; waiters are parked on timers and woken in FIFO order.
/// Must only be used from a single-threaded executor.
class BoundedConnectionPool final : public ConnectionPool {
public:
    BoundedConnectionPool(boost::asio::any_io_executor executor, int capacity)
        : executor_(std::move(executor)), capacity_(capacity) {}

    boost::asio::awaitable<void> acquire() override;
    void release() override;

    int inUse() const override { return inUse_; }
    int capacity() const override { return capacity_; }

private:
    boost::asio::any_io_executor executor_;
    int capacity_;
    int inUse_{0};
    std::list<boost::asio::steady_timer*> waiters_;
};

/// Keys for worker group `groupId` of `groupCount`. Reads draw uniformly from
/// the group's shard of [0, keySpace); inserts hand out keys that no other
/// group can produce (groupId + n * groupCount above keySpace).
class ShardedValueProvider final : public WorkloadValueProvider {
public:
    ShardedValueProvider(int groupId, int groupCount, int64_t keySpace = 1'000'000,
                         uint64_t seed = std::random_device{}());

    std::string nextValue(const std::string& workerId, OperationKind kind) override;

private:
    int groupId_;
    int groupCount_;
    int64_t keySpace_;
    int64_t insertCounter_{0};
    std::mt19937_64 rng_;
    std::mutex mutex_;
};

} // namespace surge::worker
