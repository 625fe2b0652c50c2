#include <surge/orchestrator/orchestrator.h>

#include <surge/common/sleep.h>
#include <surge/core/ids.h>
#include <surge/orchestrator/results_aggregator.h>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>
#include <type_traits>

namespace surge::orchestrator {

using control::RunPhase;
using control::RunStatus;

namespace {

// Re-runs `fn` while it returns an error, sleeping between attempts.
template <typename Fn>
boost::asio::awaitable<std::invoke_result_t<Fn&>>
retrying(const char* what, int attempts, std::chrono::milliseconds delay, Fn fn) {
    auto result = fn();
    for (int attempt = 1; !result && attempt < attempts; ++attempt) {
        spdlog::warn("[Orchestrator] {} failed (attempt {}/{}): {}", what, attempt, attempts,
                     result.error().message);
        if (!co_await common::sleepFor(delay))
            break;
        result = fn();
    }
    co_return result;
}

int countReady(const coordination::HeartbeatSummary& summary, int64_t nowMs,
               std::chrono::milliseconds staleTimeout) {
    return static_cast<int>(std::count_if(
        summary.workers.begin(), summary.workers.end(), [&](const store::HeartbeatRecord& hb) {
            return hb.status == control::WorkerStatus::Ready &&
                   !coordination::isStale(hb, nowMs, staleTimeout);
        }));
}

} // namespace

std::vector<int> distributeTargets(int total, int groups, int perWorkerCap) {
    if (groups <= 0)
        return {};
    total = std::max(total, 0);
    std::vector<int> targets(static_cast<size_t>(groups), 0);

    if (perWorkerCap > 0) {
        int remaining = total;
        for (auto& t : targets) {
            t = std::min(perWorkerCap, remaining);
            remaining -= t;
        }
        return targets;
    }

    const int base = total / groups;
    const int remainder = total % groups;
    for (int i = 0; i < groups; ++i) {
        targets[static_cast<size_t>(i)] = base + (i < remainder ? 1 : 0);
    }
    return targets;
}

Orchestrator::Orchestrator(Config config, Dependencies deps)
    : config_(std::move(config)), deps_(std::move(deps)), log_(*deps_.store),
      heartbeats_(*deps_.store, config_.heartbeat.staleTimeout) {}

double Orchestrator::drainSeconds() const {
    return std::chrono::duration<double>(config_.orchestrator.drainTimeout).count();
}

Result<store::RunRecord> Orchestrator::createRun(const std::string& runId) {
    store::RunRecord run;
    run.runId = runId.empty() ? core::generateId("run") : runId;
    run.status = RunStatus::Prepared;
    run.phase = RunPhase::Preparing;
    run.workersExpected = config_.orchestrator.workerGroupSize;
    run.loadMode = config::toString(config_.workload.loadMode);
    run.createdAtMs = epochMillis();
    run.updatedAtMs = run.createdAtMs;

    if (auto r = deps_.store->createRun(run); !r) {
        return r.error();
    }
    spdlog::info("[Orchestrator] Created run {} ({} workers, {})", run.runId,
                 run.workersExpected, run.loadMode);
    return run;
}

Result<bool> Orchestrator::advanceRun(const std::string& runId, const RunUpdate& update) {
    for (int attempt = 0; attempt < config_.retryAttempts; ++attempt) {
        auto current = deps_.store->readRun(runId);
        if (!current)
            return current.error();
        const auto& run = current.value();

        store::RunTransition t;
        t.expected = run.status;

        if (update.status && *update.status != run.status) {
            if (!control::acceptStatus(run.status, *update.status)) {
                spdlog::debug("[Orchestrator] {} already past {} (at {})", runId,
                              control::toString(*update.status), control::toString(run.status));
                return false;
            }
            t.status = update.status;
        }
        const auto effectiveStatus = t.status.value_or(run.status);
        if (update.phase && *update.phase != run.phase) {
            if (control::acceptPhase(run.phase, *update.phase, effectiveStatus)) {
                t.phase = update.phase;
            } else {
                spdlog::debug("[Orchestrator] {} phase {} rejected (at {}, status {})", runId,
                              control::toString(*update.phase), control::toString(run.phase),
                              control::toString(effectiveStatus));
            }
        }
        if (!t.status && !t.phase)
            return false;

        t.startTimeMs = update.startTimeMs;
        t.endTimeMs = update.endTimeMs;
        t.message = update.message;

        auto applied = deps_.store->transitionRun(runId, t);
        if (!applied)
            return applied.error();
        if (applied.value())
            return true;
        spdlog::debug("[Orchestrator] {} lost a status race at {}, re-reading", runId,
                      control::toString(run.status));
    }
    return Error{ErrorCode::Conflict,
                 fmt::format("run {} kept changing under {} update attempts", runId,
                             config_.retryAttempts)};
}

Result<void> Orchestrator::requestStop(const std::string& runId) {
    auto current = deps_.store->readRun(runId);
    if (!current)
        return current.error();
    const auto& run = current.value();

    if (control::isTerminal(run.status)) {
        spdlog::info("[Orchestrator] Stop ignored: run {} already {}", runId,
                     control::toString(run.status));
        return {};
    }

    if (control::statusRank(run.status) <= control::statusRank(RunStatus::Prepared) &&
        run.status != RunStatus::Starting) {
        store::RunTransition t;
        t.expected = run.status;
        t.status = RunStatus::Cancelled;
        t.phase = RunPhase::Cancelled;
        t.endTimeMs = epochMillis();
        t.message = "cancelled before start";
        auto applied = deps_.store->transitionRun(runId, t);
        if (!applied)
            return applied.error();
        if (applied.value()) {
            spdlog::info("[Orchestrator] Run {} cancelled before start", runId);
            return {};
        }
        // The run started meanwhile; fall through to a regular stop.
    }

    auto stop = log_.append(runId, control::StopPayload{control::kStopCancelled, drainSeconds()});
    if (!stop)
        return stop.error();
    auto advanced = advanceRun(runId, RunUpdate{RunStatus::Cancelling, {}, {}, {}, {}});
    if (!advanced)
        return advanced.error();
    spdlog::info("[Orchestrator] Stop requested for run {}", runId);
    return {};
}

Result<std::vector<control::ControlEvent>> Orchestrator::scaleTo(const std::string& runId,
                                                                 int total) {
    auto current = deps_.store->readRun(runId);
    if (!current)
        return current.error();
    if (current.value().status != RunStatus::Running) {
        return Error{ErrorCode::InvalidState,
                     fmt::format("run {} is {}, not RUNNING", runId,
                                 control::toString(current.value().status))};
    }

    const int groups = config_.orchestrator.workerGroupSize;
    const int cap = config_.orchestrator.perWorkerCap;
    if (cap > 0 && total > cap * groups) {
        spdlog::warn("[Orchestrator] Scale target {} exceeds {} groups x cap {}; clamping", total,
                     groups, cap);
    }

    std::vector<control::ControlEvent> events;
    const auto targets = distributeTargets(total, groups, cap);
    for (size_t group = 0; group < targets.size(); ++group) {
        auto appended = log_.append(
            runId, control::ScaleToPayload{targets[group], static_cast<int>(group)});
        if (!appended)
            return appended.error();
        events.push_back(std::move(appended).value());
    }
    spdlog::info("[Orchestrator] Run {} scaled to {} across {} group(s)", runId, total, groups);
    return events;
}

boost::asio::awaitable<Orchestrator::Readiness>
Orchestrator::awaitReadiness(const std::string& runId, std::string& detail) {
    const int expected = config_.orchestrator.workerGroupSize;
    const auto deadline =
        std::chrono::steady_clock::now() + config_.orchestrator.rendezvousTimeout;
    int lastReady = -1;

    while (true) {
        auto run = deps_.store->readRun(runId);
        if (!run) {
            spdlog::warn("[Orchestrator] Run {} read failed during rendezvous: {}", runId,
                         run.error().message);
        } else {
            const auto status = run.value().status;
            if (status == RunStatus::Cancelling || control::isTerminal(status))
                co_return Readiness::Cancelled;

            const auto nowMs = epochMillis();
            auto summary = heartbeats_.summarize(runId, nowMs);
            if (summary) {
                const int ready =
                    countReady(summary.value(), nowMs, config_.heartbeat.staleTimeout);
                if (ready != lastReady) {
                    spdlog::info("[Orchestrator] Run {}: {}/{} workers ready", runId, ready,
                                 expected);
                    lastReady = ready;
                }
                if (ready >= expected)
                    co_return Readiness::Ready;
            } else {
                spdlog::warn("[Orchestrator] Heartbeat read failed for {}: {}", runId,
                             summary.error().message);
            }
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            detail = fmt::format("rendezvous timed out after {}ms: {}/{} workers ready",
                                 config_.orchestrator.rendezvousTimeout.count(),
                                 std::max(lastReady, 0), expected);
            co_return Readiness::TimedOut;
        }
        if (!co_await common::sleepFor(config_.orchestrator.pollInterval))
            co_return Readiness::Cancelled;
    }
}

Result<void> Orchestrator::beginDrain(const std::string& runId, const std::string& reason,
                                      RunStatus status, MonitorState& state) {
    state.draining = true;
    state.drainDeadline = std::chrono::steady_clock::now() + config_.orchestrator.drainTimeout;

    auto stop = log_.append(runId, control::StopPayload{reason, drainSeconds()});
    if (!stop)
        return stop.error();
    auto advanced = advanceRun(runId, RunUpdate{status, {}, {}, {}, {}});
    if (!advanced)
        return advanced.error();
    spdlog::info("[Orchestrator] Run {} draining ({}), up to {}ms", runId, reason,
                 config_.orchestrator.drainTimeout.count());
    return {};
}

boost::asio::awaitable<Result<void>> Orchestrator::monitor(const std::string& runId,
                                                           MonitorState& state) {
    const auto& workload = config_.workload;
    const auto started = std::chrono::steady_clock::now();
    const auto warmup = std::chrono::duration<double>(workload.warmupSeconds);
    const auto window = std::chrono::duration<double>(workload.warmupSeconds +
                                                      workload.durationSeconds);
    bool warmupDone = workload.warmupSeconds <= 0.0;
    std::set<std::string> reportedDead;

    while (true) {
        if (!co_await common::sleepFor(config_.orchestrator.pollInterval))
            co_return Error{ErrorCode::OperationCancelled, "orchestrator interrupted"};

        auto run = deps_.store->readRun(runId);
        if (!run) {
            spdlog::warn("[Orchestrator] Run {} read failed: {}", runId, run.error().message);
            continue;
        }
        const auto status = run.value().status;
        if (control::isTerminal(status)) {
            spdlog::info("[Orchestrator] Run {} reached {} externally", runId,
                         control::toString(status));
            co_return Result<void>();
        }
        if (status == RunStatus::Cancelling && !state.cancelled) {
            // requestStop() already appended the STOP event. A stop that lands
            // during a drain keeps the drain deadline already running.
            state.cancelled = true;
            if (!state.draining) {
                state.draining = true;
                state.drainDeadline =
                    std::chrono::steady_clock::now() + config_.orchestrator.drainTimeout;
            }
            spdlog::info("[Orchestrator] Run {} cancelling, draining workers", runId);
        }

        const auto nowMs = epochMillis();
        auto summary = heartbeats_.summarize(runId, nowMs);
        if (!summary) {
            spdlog::warn("[Orchestrator] Heartbeat read failed for {}: {}", runId,
                         summary.error().message);
            continue;
        }
        const auto& hb = summary.value();
        const auto elapsed = std::chrono::steady_clock::now() - started;

        if (!state.draining) {
            std::vector<std::string> dead = hb.staleWorkerIds;
            for (const auto& w : hb.workers) {
                if (w.status == control::WorkerStatus::Failed)
                    dead.push_back(w.workerId);
            }
            if (!dead.empty()) {
                const bool degrade =
                    config_.orchestrator.deadWorkerPolicy == config::DeadWorkerPolicy::Degrade &&
                    hb.alive >= config_.orchestrator.minWorkers;
                if (degrade) {
                    for (const auto& id : dead) {
                        if (reportedDead.insert(id).second) {
                            spdlog::warn("[Orchestrator] Worker {} presumed dead; continuing "
                                         "degraded with {} live worker(s)",
                                         id, hb.alive);
                        }
                    }
                } else {
                    state.failed = true;
                    state.message = fmt::format("{} worker(s) dead ({} live, policy {})",
                                                dead.size(), hb.alive,
                                                config::toString(
                                                    config_.orchestrator.deadWorkerPolicy));
                    spdlog::error("[Orchestrator] Run {}: {}", runId, state.message);
                    if (auto r = beginDrain(runId, control::kStopFailed, RunStatus::Stopping,
                                            state);
                        !r) {
                        spdlog::warn("[Orchestrator] Drain request for {} failed: {}", runId,
                                     r.error().message);
                    }
                }
            }
        }

        if (!state.draining && !warmupDone && elapsed >= warmup) {
            warmupDone = true;
            auto phased = advanceRun(runId, RunUpdate{{}, RunPhase::Running, {}, {}, {}});
            if (!phased) {
                spdlog::warn("[Orchestrator] Warmup end for {} not recorded: {}", runId,
                             phased.error().message);
            }
            if (auto e = log_.append(runId, control::SetPhasePayload{RunPhase::Running}); !e) {
                spdlog::warn("[Orchestrator] SET_PHASE RUNNING for {} not appended", runId);
            }
            spdlog::info("[Orchestrator] Run {} warmup complete, measuring", runId);
        }

        if (!state.draining && workload.loadMode == config::LoadMode::Concurrency &&
            elapsed >= window) {
            if (auto r = beginDrain(runId, control::kStopDurationElapsed, RunStatus::Stopping,
                                    state);
                !r) {
                spdlog::warn("[Orchestrator] Drain request for {} failed: {}", runId,
                             r.error().message);
            }
        }

        if (!state.draining && workload.loadMode == config::LoadMode::FindMax &&
            hb.total > 0 && hb.alive == 0) {
            spdlog::info("[Orchestrator] Run {}: every worker finished its search", runId);
            co_return Result<void>();
        }

        if (state.draining) {
            if (hb.alive == 0) {
                spdlog::info("[Orchestrator] Run {}: all workers drained", runId);
                co_return Result<void>();
            }
            if (std::chrono::steady_clock::now() >= state.drainDeadline) {
                spdlog::warn("[Orchestrator] Run {}: drain timed out with {} worker(s) live",
                             runId, hb.alive);
                co_return Result<void>();
            }
        }
    }
}

boost::asio::awaitable<Result<store::RunRecord>>
Orchestrator::finalize(const std::string& runId, const MonitorState& state) {
    const int attempts = config_.retryAttempts;
    const auto delay = config_.retryDelay;

    auto processing = co_await retrying("PROCESSING phase", attempts, delay, [&] {
        return advanceRun(runId, RunUpdate{{}, RunPhase::Processing, {}, {}, {}});
    });
    if (!processing) {
        spdlog::warn("[Orchestrator] Run {} PROCESSING not recorded: {}", runId,
                     processing.error().message);
    }

    RunStatus terminal = RunStatus::Completed;
    RunPhase terminalPhase = RunPhase::Completed;
    std::string message = state.message;

    auto results = deps_.store->listWorkerResults(runId);
    if (results) {
        const auto runResult = aggregateResults(runId, results.value());
        if (auto put = deps_.store->putRunResult(runResult); !put) {
            spdlog::error("[Orchestrator] Storing results for {} failed: {}", runId,
                          put.error().message);
        }
        const auto failedWorkers = std::count_if(
            results.value().begin(), results.value().end(),
            [](const store::WorkerResult& w) { return w.status == RunStatus::Failed; });
        if (failedWorkers > 0 && message.empty()) {
            message = fmt::format("{} worker(s) failed", failedWorkers);
        }
        if (failedWorkers > 0 && !state.cancelled) {
            terminal = RunStatus::Failed;
            terminalPhase = RunPhase::Failed;
        }
        spdlog::info("[Orchestrator] Run {}: {} worker result(s), {} operations ({} failed)",
                     runId, runResult.workersReported, runResult.totalOperations,
                     runResult.failedOperations);
    } else {
        spdlog::error("[Orchestrator] Reading worker results for {} failed: {}", runId,
                      results.error().message);
    }

    if (state.cancelled) {
        terminal = RunStatus::Cancelled;
        terminalPhase = RunPhase::Cancelled;
        if (message.empty())
            message = "cancelled";
    } else if (state.failed) {
        terminal = RunStatus::Failed;
        terminalPhase = RunPhase::Failed;
    } else if (message.empty()) {
        message = "completed";
    }

    auto ended = co_await retrying("terminal status", attempts, delay, [&] {
        return advanceRun(runId,
                          RunUpdate{terminal, terminalPhase, {}, epochMillis(), message});
    });
    if (!ended)
        co_return ended.error();

    if (auto cleared = heartbeats_.clear(runId); !cleared) {
        spdlog::warn("[Orchestrator] Heartbeat teardown for {} failed: {}", runId,
                     cleared.error().message);
    }

    auto run = deps_.store->readRun(runId);
    if (run) {
        spdlog::info("[Orchestrator] Run {} finished {} ({})", runId,
                     control::toString(run.value().status), run.value().message);
    }
    co_return run;
}

boost::asio::awaitable<Result<store::RunRecord>>
Orchestrator::failRun(const std::string& runId, const std::string& message) {
    spdlog::error("[Orchestrator] Run {} failed: {}", runId, message);
    if (auto stop = log_.append(runId, control::StopPayload{control::kStopFailed, drainSeconds()});
        !stop) {
        spdlog::warn("[Orchestrator] STOP for {} not appended: {}", runId, stop.error().message);
    }
    auto failed = co_await retrying("FAILED status", config_.retryAttempts, config_.retryDelay, [&] {
        return advanceRun(runId,
                          RunUpdate{RunStatus::Failed, RunPhase::Failed, {}, epochMillis(), message});
    });
    if (!failed)
        co_return failed.error();
    if (auto cleared = heartbeats_.clear(runId); !cleared) {
        spdlog::warn("[Orchestrator] Heartbeat teardown for {} failed: {}", runId,
                     cleared.error().message);
    }
    co_return deps_.store->readRun(runId);
}

void Orchestrator::startCancelledDrain(MonitorState& state, RunStatus status) const {
    state.draining = true;
    state.cancelled = status == RunStatus::Cancelling;
    state.drainDeadline = std::chrono::steady_clock::now() + config_.orchestrator.drainTimeout;
}

boost::asio::awaitable<Result<store::RunRecord>>
Orchestrator::execute(const std::string& runId) {
    auto current = deps_.store->readRun(runId);
    if (!current)
        co_return current.error();
    if (control::isTerminal(current.value().status)) {
        spdlog::info("[Orchestrator] Run {} already {}", runId,
                     control::toString(current.value().status));
        co_return current;
    }

    const int attempts = config_.retryAttempts;
    const auto delay = config_.retryDelay;
    spdlog::info("[Orchestrator] Starting run {} (group size {}, mode {})", runId,
                 config_.orchestrator.workerGroupSize,
                 config::toString(config_.workload.loadMode));

    auto starting = co_await retrying("PREPARED->STARTING", attempts, delay, [&] {
        return advanceRun(runId, RunUpdate{RunStatus::Starting, {}, {}, {}, {}});
    });
    if (!starting)
        co_return co_await failRun(runId, "cannot start: " + starting.error().message);
    if (!starting.value()) {
        // Either already STARTING or moved on by someone else.
        auto run = deps_.store->readRun(runId);
        if (run && control::isTerminal(run.value().status))
            co_return run;
    }

    MonitorState state;
    std::string detail;
    const auto readiness = co_await awaitReadiness(runId, detail);

    if (readiness == Readiness::TimedOut)
        co_return co_await failRun(runId, detail);

    if (readiness == Readiness::Cancelled) {
        auto run = deps_.store->readRun(runId);
        if (run && control::isTerminal(run.value().status))
            co_return run;
        startCancelledDrain(state, RunStatus::Cancelling);
    } else {
        const auto initialPhase =
            config_.workload.warmupSeconds > 0.0 ? RunPhase::Warmup : RunPhase::Running;
        auto running = co_await retrying("STARTING->RUNNING", attempts, delay, [&] {
            return advanceRun(runId, RunUpdate{RunStatus::Running, initialPhase, epochMillis(),
                                               {}, {}});
        });
        if (!running)
            co_return co_await failRun(runId, "cannot enter RUNNING: " + running.error().message);

        auto observed = deps_.store->readRun(runId);
        if (!observed)
            co_return co_await failRun(runId, "run unreadable after rendezvous: " +
                                                  observed.error().message);
        const auto status = observed.value().status;
        if (control::isTerminal(status))
            co_return observed;

        if (status != RunStatus::Running) {
            // A stop won the race against the RUNNING write.
            spdlog::info("[Orchestrator] Run {} went {} before it started", runId,
                         control::toString(status));
            startCancelledDrain(state, status);
        } else {
            auto announced = co_await retrying("SET_PHASE", attempts, delay, [&] {
                return log_.append(runId, control::SetPhasePayload{initialPhase});
            });
            if (!announced)
                co_return co_await failRun(runId, "cannot announce phase: " +
                                                      announced.error().message);
            spdlog::info("[Orchestrator] Run {} RUNNING (phase {})", runId,
                         control::toString(initialPhase));
        }
    }

    auto monitored = co_await monitor(runId, state);
    if (!monitored)
        co_return co_await failRun(runId, monitored.error().message);

    auto run = deps_.store->readRun(runId);
    if (run && control::isTerminal(run.value().status))
        co_return run;
    co_return co_await finalize(runId, state);
}

} // namespace surge::orchestrator
