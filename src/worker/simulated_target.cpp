#include <surge/worker/simulated_target.h>

#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <algorithm>
#include <chrono>

namespace surge::worker {

namespace {

// Relative cost of each kind against a point lookup.
double kindCostFactor(OperationKind kind) {
    switch (kind) {
        case OperationKind::PointLookup:
            return 1.0;
        case OperationKind::RangeScan:
            return 3.0;
        case OperationKind::Insert:
            return 1.5;
        case OperationKind::Update:
            return 1.8;
    }
    return 1.0;
}

} // namespace

SimulatedTargetClient::SimulatedTargetClient(boost::asio::any_io_executor executor, Config config,
                                             uint64_t seed)
    : executor_(std::move(executor)), config_(config), rng_(seed) {}

double SimulatedTargetClient::sampleLatencyMs(OperationKind kind) {
    double latency = (config_.baseLatencyMs + config_.latencyPerInflightMs * inFlight_) *
                     kindCostFactor(kind);
    if (config_.jitterPct > 0.0) {
        std::scoped_lock lock(rngMutex_);
        std::uniform_real_distribution<double> jitter(-config_.jitterPct, config_.jitterPct);
        latency *= 1.0 + jitter(rng_) / 100.0;
    }
    return std::max(latency, 0.0);
}

bool SimulatedTargetClient::sampleFailure() {
    if (config_.errorRatePct <= 0.0)
        return false;
    std::scoped_lock lock(rngMutex_);
    std::uniform_real_distribution<double> dist(0.0, 100.0);
    return dist(rng_) < config_.errorRatePct;
}

boost::asio::awaitable<OperationOutcome>
SimulatedTargetClient::execute(OperationKind kind, const std::string& /*key*/) {
    ++inFlight_;
    const double latencyMs = sampleLatencyMs(kind);

    boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
    timer.expires_after(std::chrono::microseconds(static_cast<int64_t>(latencyMs * 1000.0)));
    try {
        co_await timer.async_wait(boost::asio::use_awaitable);
    } catch (const boost::system::system_error& e) {
        --inFlight_;
        if (e.code() == boost::asio::error::operation_aborted) {
            co_return OperationOutcome{latencyMs, false, "operation aborted"};
        }
        throw;
    }
    --inFlight_;

    if (sampleFailure()) {
        co_return OperationOutcome{latencyMs, false, "simulated error"};
    }
    co_return OperationOutcome{latencyMs, true, {}};
}

boost::asio::awaitable<void> BoundedConnectionPool::acquire() {
    while (capacity_ > 0 && inUse_ >= capacity_) {
        boost::asio::steady_timer waiter(co_await boost::asio::this_coro::executor,
                                          boost::asio::steady_timer::time_point::max());
        waiters_.push_back(&waiter);
        try {
            co_await waiter.async_wait(boost::asio::use_awaitable);
        } catch (const boost::system::system_error& e) {
            if (e.code() != boost::asio::error::operation_aborted) {
                waiters_.remove(&waiter);
                throw;
            }
        }
        // release() pops the waiter before cancelling it; a spurious wake leaves it queued.
        waiters_.remove(&waiter);
    }
    ++inUse_;
}

void BoundedConnectionPool::release() {
    if (inUse_ > 0)
        --inUse_;
    if (!waiters_.empty()) {
        auto* next = waiters_.front();
        waiters_.pop_front();
        next->cancel();
    }
}

ShardedValueProvider::ShardedValueProvider(int groupId, int groupCount, int64_t keySpace,
                                           uint64_t seed)
    : groupId_(groupId), groupCount_(std::max(groupCount, 1)), keySpace_(std::max<int64_t>(keySpace, 1)),
      rng_(seed) {}

std::string ShardedValueProvider::nextValue(const std::string& /*workerId*/, OperationKind kind) {
    std::scoped_lock lock(mutex_);
    if (kind == OperationKind::Insert) {
        const int64_t key = keySpace_ + groupId_ + insertCounter_ * groupCount_;
        ++insertCounter_;
        return "key-" + std::to_string(key);
    }

    const int64_t shardSize = std::max<int64_t>(keySpace_ / groupCount_, 1);
    const int64_t shardStart = (groupId_ % groupCount_) * shardSize;
    std::uniform_int_distribution<int64_t> dist(0, shardSize - 1);
    return "key-" + std::to_string(shardStart + dist(rng_));
}

} // namespace surge::worker
