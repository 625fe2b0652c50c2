#include <gtest/gtest.h>
#include <surge/common/sleep.h>
#include <surge/worker/simulated_target.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include <algorithm>
#include <set>

using namespace surge;
using namespace surge::worker;
using namespace std::chrono_literals;
namespace asio = boost::asio;

namespace {

config::TargetSettings steadyTarget() {
    config::TargetSettings cfg;
    cfg.baseLatencyMs = 5.0;
    cfg.latencyPerInflightMs = 1.0;
    cfg.jitterPct = 0.0;
    return cfg;
}

int64_t keyNumber(const std::string& key) {
    return std::stoll(key.substr(4));
}

} // namespace

TEST(SimulatedTargetTest, LatencyGrowsWithInFlightOperations) {
    asio::io_context io;
    SimulatedTargetClient target(io.get_executor(), steadyTarget(), 7);
    std::vector<double> latencies;

    for (int i = 0; i < 3; ++i) {
        asio::co_spawn(
            io,
            [&]() -> asio::awaitable<void> {
                auto outcome = co_await target.execute(OperationKind::PointLookup, "key-1");
                EXPECT_TRUE(outcome.success);
                latencies.push_back(outcome.latencyMs);
            },
            asio::detached);
    }
    io.run();

    std::sort(latencies.begin(), latencies.end());
    EXPECT_EQ(latencies, (std::vector<double>{6.0, 7.0, 8.0}));
    EXPECT_EQ(target.inFlight(), 0);
}

TEST(SimulatedTargetTest, KindCostAndFailures) {
    asio::io_context io;
    auto cfg = steadyTarget();
    cfg.errorRatePct = 100.0;
    SimulatedTargetClient target(io.get_executor(), cfg, 7);

    auto fut = asio::co_spawn(io, target.execute(OperationKind::RangeScan, "key-9"),
                              asio::use_future);
    io.run();
    auto outcome = fut.get();
    EXPECT_DOUBLE_EQ(outcome.latencyMs, 18.0);
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error, "simulated error");
}

TEST(BoundedConnectionPoolTest, CapsInUseAndWakesInOrder) {
    asio::io_context io;
    BoundedConnectionPool pool(io.get_executor(), 2);
    std::vector<int> acquiredOrder;
    int peak = 0;

    for (int i = 0; i < 5; ++i) {
        asio::co_spawn(
            io,
            [&, i]() -> asio::awaitable<void> {
                co_await pool.acquire();
                acquiredOrder.push_back(i);
                peak = std::max(peak, pool.inUse());
                co_await common::sleepFor(5ms);
                pool.release();
            },
            asio::detached);
    }
    io.run();

    EXPECT_EQ(peak, 2);
    EXPECT_EQ(acquiredOrder, (std::vector<int>{0, 1, 2, 3, 4}));
    EXPECT_EQ(pool.inUse(), 0);
    EXPECT_EQ(pool.capacity(), 2);
}

TEST(BoundedConnectionPoolTest, ZeroCapacityNeverBlocks) {
    asio::io_context io;
    BoundedConnectionPool pool(io.get_executor(), 0);
    int acquired = 0;
    asio::co_spawn(
        io,
        [&]() -> asio::awaitable<void> {
            for (int i = 0; i < 10; ++i) {
                co_await pool.acquire();
                ++acquired;
            }
        },
        asio::detached);
    io.run();
    EXPECT_EQ(acquired, 10);
    EXPECT_EQ(pool.inUse(), 10);
}

TEST(ShardedValueProviderTest, InsertKeysNeverCollideAcrossGroups) {
    constexpr int kGroups = 3;
    std::set<std::string> seen;
    for (int g = 0; g < kGroups; ++g) {
        ShardedValueProvider values(g, kGroups, 1000, 1);
        for (int i = 0; i < 100; ++i) {
            auto key = values.nextValue("w", OperationKind::Insert);
            EXPECT_TRUE(seen.insert(key).second) << key;
            EXPECT_GE(keyNumber(key), 1000);
            EXPECT_EQ((keyNumber(key) - 1000) % kGroups, g);
        }
    }
    EXPECT_EQ(seen.size(), 300u);
}

TEST(ShardedValueProviderTest, ReadsStayInsideTheGroupShard) {
    ShardedValueProvider values(2, 4, 1000, 99);
    for (int i = 0; i < 500; ++i) {
        for (auto kind : {OperationKind::PointLookup, OperationKind::RangeScan,
                          OperationKind::Update}) {
            const auto n = keyNumber(values.nextValue("w", kind));
            EXPECT_GE(n, 500);
            EXPECT_LT(n, 750);
        }
    }
}
