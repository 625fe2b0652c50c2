#include <surge/worker/worker.h>

#include <surge/common/sleep.h>

#include <boost/asio/experimental/awaitable_operators.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <type_traits>
#include <variant>

namespace surge::worker {

namespace {

// Granularity at which fixed-concurrency load notices a stop.
constexpr std::chrono::milliseconds kLoadCheckInterval{50};

bool endsRendezvous(control::RunStatus status) {
    return control::isTerminal(status) || status == control::RunStatus::Cancelling ||
           status == control::RunStatus::Stopping;
}

} // namespace

Worker::Worker(Config config, Dependencies deps)
    : config_(std::move(config)), deps_(std::move(deps)), log_(*deps_.store),
      heartbeats_(*deps_.store, config_.heartbeat.staleTimeout),
      stopRequested_(std::make_shared<std::atomic<bool>>(false)),
      drainTimeout_(config_.drainTimeout) {}

Worker::~Worker() {
    stopRequested_->store(true, std::memory_order_release);
}

void Worker::requestStop() {
    signalStop(control::kStopCancelled);
}

void Worker::signalStop(const std::string& reason) {
    if (stopReason_.empty()) {
        stopReason_ = reason;
        spdlog::info("[Worker] {} stopping: {}", config_.workerId, reason);
    }
    stopRequested_->store(true, std::memory_order_release);
}

void Worker::observeRun() {
    auto run = deps_.store->readRun(config_.runId);
    if (!run) {
        if (run.error().code == ErrorCode::NotFound) {
            spdlog::debug("[Worker] Run {} not created yet", config_.runId);
        } else {
            spdlog::warn("[Worker] Failed to read run {}: {}", config_.runId,
                         run.error().message);
        }
        return;
    }
    tracker_.apply(run.value().status, run.value().phase);
}

void Worker::drainControlEvents() {
    auto events = cursor_.poll(log_, config_.runId);
    if (!events) {
        spdlog::warn("[Worker] Failed to read control events for {}: {}", config_.runId,
                     events.error().message);
        return;
    }
    for (const auto& event : events.value()) {
        applyEvent(event);
    }
}

void Worker::applyEvent(const control::ControlEvent& event) {
    spdlog::debug("[Worker] {} applying {} #{}", config_.workerId, toString(event.type()),
                  event.sequence);
    std::visit(
        [this](const auto& p) {
            using T = std::decay_t<decltype(p)>;
            if constexpr (std::is_same_v<T, control::SetPhasePayload>) {
                if (tracker_.applyPhase(p.phase, tracker_.status())) {
                    spdlog::info("[Worker] {} phase -> {}", config_.workerId,
                                 control::toString(p.phase));
                }
            } else if constexpr (std::is_same_v<T, control::ScaleToPayload>) {
                if (!control::appliesToGroup(p, config_.workerGroupId))
                    return;
                if (config_.workload.loadMode == config::LoadMode::FindMax) {
                    spdlog::debug("[Worker] Ignoring SCALE_TO {} during find-max", p.target);
                    return;
                }
                scaleTarget_ = p.target;
                if (pool_ && active_.load(std::memory_order_acquire)) {
                    pool_->scaleTo(p.target);
                }
            } else if constexpr (std::is_same_v<T, control::StopPayload>) {
                if (p.drainTimeoutSeconds > 0.0) {
                    drainTimeout_ = std::chrono::milliseconds(
                        static_cast<int64_t>(p.drainTimeoutSeconds * 1000.0));
                }
                signalStop(p.reason.empty() ? std::string(control::kStopCancelled) : p.reason);
            } else {
                static_assert(control::kUnhandledPayload<T>, "unhandled control payload");
            }
        },
        event.payload);
}

void Worker::publishHeartbeat(control::WorkerStatus status) {
    store::HeartbeatRecord hb;
    hb.runId = config_.runId;
    hb.workerId = config_.workerId;
    hb.workerGroupId = config_.workerGroupId;
    hb.status = status;
    hb.phase = tracker_.phase();
    hb.lastHeartbeatMs = epochMillis();
    if (pool_) {
        hb.activeTasks = pool_->runningCount();
        hb.targetConcurrency = pool_->currentTarget();
    }
    hb.operations = metrics_.totalOperations();
    hb.errors = metrics_.failedOperations();
    hb.lastError = metrics_.lastError();

    if (auto r = heartbeats_.beat(hb); !r) {
        spdlog::warn("[Worker] {} heartbeat failed: {}", config_.workerId, r.error().message);
    }
}

boost::asio::awaitable<RendezvousOutcome> Worker::rendezvous() {
    const auto started = std::chrono::steady_clock::now();
    auto lastBeat = started;

    while (true) {
        observeRun();
        drainControlEvents();

        const auto status = tracker_.status();
        if (status == control::RunStatus::Running && !stopping())
            co_return RendezvousOutcome::Start;
        if (endsRendezvous(status) || stopping())
            co_return RendezvousOutcome::Aborted;

        const auto now = std::chrono::steady_clock::now();
        if (now - started >= config_.rendezvous.timeout)
            co_return RendezvousOutcome::TimedOut;
        if (now - lastBeat >= config_.heartbeat.interval) {
            publishHeartbeat(control::WorkerStatus::Ready);
            lastBeat = now;
        }

        if (!co_await common::sleepFor(config_.rendezvous.pollInterval))
            co_return RendezvousOutcome::Aborted;
    }
}

boost::asio::awaitable<void> Worker::generateLoad() {
    if (config_.workload.loadMode == config::LoadMode::FindMax) {
        controller_ = std::make_unique<ConcurrencyController>(
            config_.findMax, TaskPool::activeKinds(config_.workload.mix),
            ConcurrencyController::Dependencies{pool_.get(), &metrics_, stopRequested_});
        findMax_ = co_await controller_->run([this](const store::StepRecord& step) {
            auto r = deps_.store->appendStepRecord(config_.runId, config_.workerId, step);
            if (!r) {
                spdlog::warn("[Worker] {} failed to persist step {}: {}", config_.workerId,
                             step.stepIndex, r.error().message);
            }
        });
    } else {
        pool_->scaleTo(scaleTarget_.value_or(config_.workload.concurrency));
        while (!stopping()) {
            if (!co_await common::sleepFor(kLoadCheckInterval))
                break;
        }
    }

    const bool drained = co_await pool_->stopAll(drainTimeout_);
    if (drained) {
        spdlog::debug("[Worker] {} drained all tasks", config_.workerId);
    }
    active_.store(false, std::memory_order_release);
}

boost::asio::awaitable<void> Worker::heartbeatLoop() {
    while (active_.load(std::memory_order_acquire)) {
        publishHeartbeat(control::WorkerStatus::Running);
        if (!co_await common::sleepFor(config_.heartbeat.interval))
            break;
    }
}

boost::asio::awaitable<void> Worker::controlLoop() {
    while (active_.load(std::memory_order_acquire)) {
        observeRun();
        drainControlEvents();
        const auto status = tracker_.status();
        if (!stopping() && endsRendezvous(status)) {
            signalStop(fmt::format("run {}", control::toString(status)));
        }
        if (!co_await common::sleepFor(config_.rendezvous.pollInterval))
            break;
    }
}

store::WorkerResult Worker::finish(control::RunStatus status, std::string message) {
    store::WorkerResult result;
    result.workerId = config_.workerId;
    result.workerGroupId = config_.workerGroupId;
    result.status = status;
    result.message = std::move(message);
    result.totalOperations = metrics_.totalOperations();
    result.failedOperations = metrics_.failedOperations();
    result.findMax = findMax_;
    result.reportedAtMs = epochMillis();

    if (auto r = deps_.store->putWorkerResult(config_.runId, result); !r) {
        spdlog::error("[Worker] {} failed to store result: {}", config_.workerId,
                      r.error().message);
    }
    // Terminal heartbeat only after the result is stored; the orchestrator
    // aggregates as soon as no worker is alive.
    publishHeartbeat(status == control::RunStatus::Failed ? control::WorkerStatus::Failed
                                                          : control::WorkerStatus::Stopped);
    spdlog::info("[Worker] {} finished {} ({} ops, {} failed)", config_.workerId,
                 control::toString(status), result.totalOperations, result.failedOperations);
    return result;
}

boost::asio::awaitable<store::WorkerResult> Worker::run() {
    spdlog::info("[Worker] {} joining run {} (group {}, mode {})", config_.workerId,
                 config_.runId, config_.workerGroupId,
                 config::toString(config_.workload.loadMode));
    publishHeartbeat(control::WorkerStatus::Ready);

    const auto outcome = co_await rendezvous();
    if (outcome == RendezvousOutcome::TimedOut) {
        spdlog::error("[Worker] {} rendezvous timed out after {}ms", config_.workerId,
                      config_.rendezvous.timeout.count());
        co_return finish(control::RunStatus::Failed,
                         fmt::format("rendezvous timed out after {}ms",
                                     config_.rendezvous.timeout.count()));
    }
    if (outcome == RendezvousOutcome::Aborted) {
        co_return finish(control::RunStatus::Cancelled,
                         stopReason_.empty() ? std::string("run ended before start")
                                             : stopReason_);
    }

    spdlog::info("[Worker] {} observed RUNNING (phase {})", config_.workerId,
                 control::toString(tracker_.phase()));

    pool_ = std::make_unique<TaskPool>(
        TaskPool::Config{config_.workerId, config_.workload.mix, config_.workload.thinkTime,
                         config_.workload.operationsPerTask, config_.seed},
        TaskPool::Dependencies{deps_.executor, deps_.target, deps_.pool, deps_.values, &metrics_,
                               stopRequested_});
    active_.store(true, std::memory_order_release);

    std::string failure;
    try {
        using namespace boost::asio::experimental::awaitable_operators;
        co_await (generateLoad() && heartbeatLoop() && controlLoop());
    } catch (const std::exception& e) {
        failure = e.what();
        spdlog::error("[Worker] {} load generation failed: {}", config_.workerId, failure);
    }
    active_.store(false, std::memory_order_release);

    if (!failure.empty()) {
        stopRequested_->store(true, std::memory_order_release);
        co_await pool_->stopAll(drainTimeout_);
        co_return finish(control::RunStatus::Failed, failure);
    }

    if (config_.workload.loadMode == config::LoadMode::FindMax) {
        const bool searchCompleted =
            findMax_ && findMax_->terminationReason != kStoppedReason;
        if (searchCompleted)
            co_return finish(control::RunStatus::Completed, findMax_->terminationReason);
        co_return finish(control::RunStatus::Cancelled, stopReason_);
    }
    if (stopReason_ == control::kStopDurationElapsed)
        co_return finish(control::RunStatus::Completed, stopReason_);
    co_return finish(control::RunStatus::Cancelled, stopReason_);
}

} // namespace surge::worker
