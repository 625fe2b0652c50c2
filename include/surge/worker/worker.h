#pragma once

#include <surge/config/settings.h>
#include <surge/control/phase_state_machine.h>
#include <surge/coordination/control_event_log.h>
#include <surge/coordination/heartbeat_registry.h>
#include <surge/store/state_store.h>
#include <surge/worker/concurrency_controller.h>
#include <surge/worker/step_metrics.h>
#include <surge/worker/target_client.h>
#include <surge/worker/task_pool.h>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <random>
#include <string>

namespace surge::worker {

enum class RendezvousOutcome {
    Start,    // run reached RUNNING
    Aborted,  // run was cancelled, stopped or finished before it started
    TimedOut, // rendezvous ceiling elapsed
};

/**
 * @brief One load-generating participant of a run.
 *
 * Registers READY, waits for the orchestrator to move the run to RUNNING,
 * then generates load until a STOP event (fixed concurrency) or the end of the
 * find-max search. Everything the orchestrator needs is published through the
 * shared store: heartbeats while alive, step records as they complete and a
 * final worker result.
 */
class Worker {
public:
    struct Config {
        std::string runId;
        std::string workerId;
        int workerGroupId{0};
        config::RendezvousSettings rendezvous;
        config::HeartbeatSettings heartbeat;
        config::WorkloadSettings workload;
        config::FindMaxSettings findMax;
        std::chrono::milliseconds drainTimeout{5000}; // until a STOP event supplies one
        uint64_t seed{std::random_device{}()};
    };

    struct Dependencies {
        boost::asio::any_io_executor executor;
        store::SharedStateStore* store{nullptr};
        TargetClient* target{nullptr};
        ConnectionPool* pool{nullptr};
        WorkloadValueProvider* values{nullptr};
    };

    Worker(Config config, Dependencies deps);
    ~Worker();

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    /// Full lifecycle. The returned result has also been written to the store.
    boost::asio::awaitable<store::WorkerResult> run();

    /// Local stop, e.g. on SIGINT. Treated like a STOP event with reason "cancelled".
    void requestStop();

    control::RunPhase phase() const noexcept { return tracker_.phase(); }
    int64_t lastSeenSequence() const noexcept { return cursor_.lastSeenSequence(); }
    const StepMetricsCollector& metrics() const noexcept { return metrics_; }

private:
    boost::asio::awaitable<RendezvousOutcome> rendezvous();
    boost::asio::awaitable<void> generateLoad();
    boost::asio::awaitable<void> heartbeatLoop();
    boost::asio::awaitable<void> controlLoop();

    /// Reads the run row and folds it into the tracker.
    void observeRun();
    void drainControlEvents();
    void applyEvent(const control::ControlEvent& event);
    void signalStop(const std::string& reason);

    void publishHeartbeat(control::WorkerStatus status);
    store::WorkerResult finish(control::RunStatus status, std::string message);

    bool stopping() const { return stopRequested_->load(std::memory_order_acquire); }

    Config config_;
    Dependencies deps_;
    coordination::ControlEventLog log_;
    coordination::HeartbeatRegistry heartbeats_;
    coordination::ControlEventCursor cursor_;
    control::RunStateTracker tracker_;

    std::shared_ptr<std::atomic<bool>> stopRequested_;
    std::atomic<bool> active_{false};
    std::string stopReason_;
    std::chrono::milliseconds drainTimeout_;
    std::optional<int> scaleTarget_;

    StepMetricsCollector metrics_;
    std::unique_ptr<TaskPool> pool_;
    std::unique_ptr<ConcurrencyController> controller_;
    std::optional<store::FindMaxResult> findMax_;
};

} // namespace surge::worker
