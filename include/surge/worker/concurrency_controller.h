#pragma once

#include <surge/config/settings.h>
#include <surge/store/records.h>
#include <surge/worker/step_metrics.h>
#include <surge/worker/task_pool.h>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace surge::worker {

inline constexpr const char* kReachedMaxReason = "reached max workers";
inline constexpr const char* kStoppedReason = "stopped";

/**
 * @brief Step search for the highest sustainable concurrency.
 *
 * Pure decision logic with no clock or I/O: callers ask next() for the level
 * to hold, measure it for one step, and feed the measurement to record().
 *
 * A step is stable while its error rate stays within max_error_rate_pct and
 * both p95 and p99 stay within baseline * (1 + 2 * latency_stability_pct / 100),
 * the baseline being the first step. Optional checks (per-kind SLOs, QPS drop)
 * and the backoff/midpoint refinement are off unless configured.
 */
class FindMaxSearch {
public:
    using Config = config::FindMaxSettings;

    struct Plan {
        int concurrency{0};
        bool isBackoff{false};
    };

    FindMaxSearch(Config config, std::vector<OperationKind> activeKinds);

    /// Level for the next step, or nullopt once the search has finished.
    std::optional<Plan> next() const;

    /// Evaluates the measurement of the planned step, appends it to the
    /// history and advances the search.
    store::StepRecord record(const StepSnapshot& snapshot, double durationSeconds);

    /// Ends the search early. The termination reason becomes "stopped"
    /// unless an unstable step already supplied one.
    void stop();

    bool finished() const noexcept { return finished_; }
    int bestConcurrency() const noexcept { return bestConcurrency_; }
    double bestQps() const noexcept { return bestQps_; }
    const std::vector<store::StepRecord>& steps() const noexcept { return steps_; }

    store::FindMaxResult result() const;

private:
    enum class Mode { Ascending, Backoff, Midpoint };

    void evaluate(store::StepRecord& step, const StepSnapshot& snapshot) const;
    void advance(const store::StepRecord& step);
    void finish(const std::string& reason);

    Config config_;
    std::vector<OperationKind> activeKinds_;

    Mode mode_{Mode::Ascending};
    Plan pending_;
    bool finished_{false};

    bool haveBaseline_{false};
    double baselineP95_{0.0};
    double baselineP99_{0.0};

    int bestConcurrency_{0};
    double bestQps_{0.0};
    int failedConcurrency_{0};
    int backoffAttempts_{0};
    std::string terminationReason_;
    std::vector<store::StepRecord> steps_;
};

/**
 * @brief Drives FindMaxSearch against a live TaskPool.
 *
 * Each step scales the pool, waits out the settle delay, resets the step
 * buffers, holds the level for step_duration and then records the step. A
 * raised stop flag abandons the step in progress.
 */
class ConcurrencyController {
public:
    using Config = config::FindMaxSettings;
    using StepCallback = std::function<void(const store::StepRecord&)>;

    struct Dependencies {
        TaskPool* pool{nullptr};
        StepMetricsCollector* metrics{nullptr};
        std::shared_ptr<std::atomic<bool>> stopRequested;
    };

    ConcurrencyController(Config config, std::vector<OperationKind> activeKinds, Dependencies deps);

    boost::asio::awaitable<store::FindMaxResult> run(StepCallback onStep = {});

    // Live state for heartbeats.
    int currentConcurrency() const noexcept {
        return currentConcurrency_.load(std::memory_order_relaxed);
    }
    int completedSteps() const noexcept { return completedSteps_.load(std::memory_order_relaxed); }

private:
    boost::asio::awaitable<bool> hold(std::chrono::milliseconds duration);
    bool stopping() const;

    Config config_;
    Dependencies deps_;
    FindMaxSearch search_;
    std::atomic<int> currentConcurrency_{0};
    std::atomic<int> completedSteps_{0};
};

} // namespace surge::worker
