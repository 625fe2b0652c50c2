#pragma once

#include <surge/config/settings.h>
#include <surge/worker/step_metrics.h>
#include <surge/worker/target_client.h>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <vector>

namespace surge::worker {

/**
 * @brief Dynamically sized set of client tasks for one worker.
 *
 * Every task is a coroutine on the worker's executor that repeatedly runs one
 * operation against the target. Tasks are stopped cooperatively: the flag is
 * checked once per iteration, so an in-flight operation always completes.
 */
class TaskPool {
public:
    struct Config {
        std::string workerId;
        config::OperationMix mix;
        std::chrono::milliseconds thinkTime{0};
        int64_t operationsPerTask{0};
        uint64_t seed{std::random_device{}()};
    };

    struct Dependencies {
        boost::asio::any_io_executor executor;
        TargetClient* target{nullptr};
        ConnectionPool* pool{nullptr}; // optional
        WorkloadValueProvider* values{nullptr};
        StepMetricsCollector* metrics{nullptr};
        std::shared_ptr<std::atomic<bool>> stopRequested;
    };

    TaskPool(Config config, Dependencies deps);
    ~TaskPool();

    TaskPool(const TaskPool&) = delete;
    TaskPool& operator=(const TaskPool&) = delete;

    /// Prunes finished tasks, then spawns or signals tasks until `target`
    /// are running. Surplus tasks are the highest-numbered ones.
    void scaleTo(int target);

    /// Signals every task and waits until all have finished or `timeout`
    /// elapsed. Returns true when nothing is left running.
    boost::asio::awaitable<bool> stopAll(std::chrono::milliseconds timeout);

    int currentTarget() const;
    int runningCount() const;

    /// Tasks signalled to stop whose last operation is still in flight.
    int drainingCount() const;

    /// Operation kinds with a non-zero share of the mix.
    static std::vector<OperationKind> activeKinds(const config::OperationMix& mix);

private:
    struct TaskState {
        int id{0};
        std::atomic<bool> stop{false};
        std::atomic<bool> done{false};
    };

    void spawnTask(int id);
    void pruneLocked();
    OperationKind pickKind();

    boost::asio::awaitable<void> runTask(std::shared_ptr<TaskState> state);

    Config config_;
    Dependencies deps_;

    mutable std::mutex mutex_;
    int currentTarget_{0};
    int nextTaskId_{1};
    std::map<int, std::shared_ptr<TaskState>> tasks_;
    std::vector<std::shared_ptr<TaskState>> draining_;

    std::vector<std::pair<OperationKind, double>> weights_;
    double totalWeight_{0.0};
    std::mutex rngMutex_;
    std::mt19937_64 rng_;
};

} // namespace surge::worker
