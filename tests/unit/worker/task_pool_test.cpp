#include <gtest/gtest.h>
#include <surge/common/sleep.h>
#include <surge/worker/task_pool.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>

#include <set>

using namespace surge;
using namespace surge::worker;
using namespace std::chrono_literals;
namespace asio = boost::asio;

namespace {

// Fixed-latency target that tracks how many operations overlap.
class FakeTarget final : public TargetClient {
public:
    explicit FakeTarget(std::chrono::milliseconds latency) : latency_(latency) {}

    asio::awaitable<OperationOutcome> execute(OperationKind kind, const std::string& key) override {
        ++inFlight_;
        maxInFlight_ = std::max(maxInFlight_, inFlight_);
        kinds_.insert(kind);
        keys_.insert(key);
        asio::steady_timer timer(co_await asio::this_coro::executor, latency_);
        co_await timer.async_wait(asio::use_awaitable);
        --inFlight_;
        ++completed_;
        co_return OperationOutcome{static_cast<double>(latency_.count()), true, {}};
    }

    int inFlight() const { return inFlight_; }
    int maxInFlight() const { return maxInFlight_; }
    int completed() const { return completed_; }
    const std::set<OperationKind>& kinds() const { return kinds_; }
    const std::set<std::string>& keys() const { return keys_; }

private:
    std::chrono::milliseconds latency_;
    int inFlight_{0};
    int maxInFlight_{0};
    int completed_{0};
    std::set<OperationKind> kinds_;
    std::set<std::string> keys_;
};

class CountingValues final : public WorkloadValueProvider {
public:
    std::string nextValue(const std::string& workerId, OperationKind) override {
        return workerId + "-" + std::to_string(next_++);
    }

private:
    int next_{0};
};

} // namespace

class TaskPoolTest : public ::testing::Test {
protected:
    std::unique_ptr<TaskPool> makePool(TaskPool::Config cfg) {
        cfg.workerId = "w1";
        TaskPool::Dependencies deps;
        deps.executor = io_.get_executor();
        deps.target = &target_;
        deps.values = &values_;
        deps.metrics = &metrics_;
        deps.stopRequested = stop_;
        return std::make_unique<TaskPool>(std::move(cfg), std::move(deps));
    }

    template <typename F> void runTest(F&& body) {
        auto done = asio::co_spawn(io_, std::forward<F>(body), asio::use_future);
        io_.run();
        done.get();
    }

    asio::io_context io_;
    FakeTarget target_{2ms};
    CountingValues values_;
    StepMetricsCollector metrics_;
    std::shared_ptr<std::atomic<bool>> stop_ = std::make_shared<std::atomic<bool>>(false);
};

TEST_F(TaskPoolTest, ScalesUpAndDown) {
    auto pool = makePool({});
    int runningAfterUp = -1;
    int runningAfterDown = -1;
    bool drained = false;

    runTest([&]() -> asio::awaitable<void> {
        pool->scaleTo(4);
        EXPECT_EQ(pool->currentTarget(), 4);
        co_await common::sleepFor(30ms);
        runningAfterUp = pool->runningCount();

        pool->scaleTo(1);
        EXPECT_EQ(pool->currentTarget(), 1);
        co_await common::sleepFor(30ms);
        runningAfterDown = pool->runningCount();
        EXPECT_EQ(pool->drainingCount(), 0);

        drained = co_await pool->stopAll(1s);
    });

    EXPECT_EQ(runningAfterUp, 4);
    EXPECT_EQ(target_.maxInFlight(), 4);
    EXPECT_EQ(runningAfterDown, 1);
    EXPECT_TRUE(drained);
    EXPECT_EQ(pool->currentTarget(), 0);
    EXPECT_EQ(pool->runningCount(), 0);
    EXPECT_GT(metrics_.totalOperations(), 4);
    EXPECT_EQ(metrics_.totalOperations(), target_.completed());
}

TEST_F(TaskPoolTest, NegativeTargetMeansZero) {
    auto pool = makePool({});
    runTest([&]() -> asio::awaitable<void> {
        pool->scaleTo(-3);
        EXPECT_EQ(pool->currentTarget(), 0);
        EXPECT_EQ(pool->runningCount(), 0);
        co_return;
    });
    EXPECT_EQ(target_.completed(), 0);
}

TEST_F(TaskPoolTest, TasksEndAfterOperationBudget) {
    TaskPool::Config cfg;
    cfg.operationsPerTask = 3;
    auto pool = makePool(cfg);

    runTest([&]() -> asio::awaitable<void> {
        pool->scaleTo(2);
        co_await common::sleepFor(100ms);
        EXPECT_EQ(pool->runningCount(), 0);
    });

    EXPECT_EQ(metrics_.totalOperations(), 6);
    // Every operation drew a fresh key.
    EXPECT_EQ(target_.keys().size(), 6u);
}

TEST_F(TaskPoolTest, SharedStopFlagEndsEveryTask) {
    auto pool = makePool({});
    bool drained = false;

    runTest([&]() -> asio::awaitable<void> {
        pool->scaleTo(3);
        co_await common::sleepFor(10ms);
        stop_->store(true);
        co_await common::sleepFor(20ms);
        EXPECT_EQ(pool->runningCount(), 0);
        EXPECT_EQ(target_.inFlight(), 0);
        drained = co_await pool->stopAll(100ms);
    });
    EXPECT_TRUE(drained);
}

TEST_F(TaskPoolTest, MixSelectsOnlyWeightedKinds) {
    TaskPool::Config cfg;
    cfg.mix = config::OperationMix{0.0, 0.0, 50.0, 50.0};
    cfg.operationsPerTask = 50;
    cfg.seed = 42;
    auto pool = makePool(cfg);

    runTest([&]() -> asio::awaitable<void> {
        pool->scaleTo(4);
        co_await common::sleepFor(300ms);
        co_await pool->stopAll(1s);
    });

    EXPECT_EQ(target_.kinds(), (std::set<OperationKind>{OperationKind::Insert,
                                                         OperationKind::Update}));
    EXPECT_EQ(TaskPool::activeKinds(cfg.mix),
              (std::vector<OperationKind>{OperationKind::Insert, OperationKind::Update}));
}
