#include <surge/worker/concurrency_controller.h>

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace surge::worker {

namespace {

// Granularity at which a held step notices a stop request.
constexpr std::chrono::milliseconds kHoldSlice{50};

double errorRate(int64_t errors, int64_t operations) {
    return operations > 0 ? static_cast<double>(errors) * 100.0 / static_cast<double>(operations)
                          : 0.0;
}

std::vector<double> sorted(std::vector<double> values) {
    std::sort(values.begin(), values.end());
    return values;
}

} // namespace

FindMaxSearch::FindMaxSearch(Config config, std::vector<OperationKind> activeKinds)
    : config_(std::move(config)), activeKinds_(std::move(activeKinds)) {
    config_.maxConcurrency = std::max(config_.maxConcurrency, 1);
    config_.startConcurrency = std::clamp(config_.startConcurrency, 1, config_.maxConcurrency);
    config_.concurrencyIncrement = std::max(config_.concurrencyIncrement, 1);
    pending_ = Plan{config_.startConcurrency, false};
}

std::optional<FindMaxSearch::Plan> FindMaxSearch::next() const {
    if (finished_)
        return std::nullopt;
    return pending_;
}

store::StepRecord FindMaxSearch::record(const StepSnapshot& snapshot, double durationSeconds) {
    store::StepRecord step;
    step.stepIndex = static_cast<int>(steps_.size()) + 1;
    step.concurrency = pending_.concurrency;
    step.isBackoff = pending_.isBackoff;
    step.operations = snapshot.operations;
    step.errors = snapshot.errors;
    step.durationSeconds = durationSeconds;
    step.qps = durationSeconds > 0.0 ? static_cast<double>(snapshot.operations) / durationSeconds
                                     : 0.0;
    step.errorRatePct = errorRate(snapshot.errors, snapshot.operations);
    step.recordedAtMs = epochMillis();

    const auto latencies = sorted(snapshot.latenciesMs);
    step.p95LatencyMs = percentile(latencies, 95.0);
    step.p99LatencyMs = percentile(latencies, 99.0);

    for (const auto& [kind, samples] : snapshot.byKind) {
        const auto kindLatencies = sorted(samples.latenciesMs);
        store::KindStepMetrics km;
        km.p95LatencyMs = percentile(kindLatencies, 95.0);
        km.p99LatencyMs = percentile(kindLatencies, 99.0);
        km.operations = samples.operations;
        if (samples.operations > 0)
            km.errorRatePct = errorRate(samples.errors, samples.operations);
        step.kindMetrics.emplace(toString(kind), km);
    }

    if (!haveBaseline_) {
        baselineP95_ = step.p95LatencyMs;
        baselineP99_ = step.p99LatencyMs;
        haveBaseline_ = true;
    }

    evaluate(step, snapshot);
    steps_.push_back(step);
    advance(step);
    return step;
}

void FindMaxSearch::evaluate(store::StepRecord& step, const StepSnapshot& snapshot) const {
    auto unstable = [&step](std::string reason) {
        step.stable = false;
        step.stopReason = std::move(reason);
    };

    if (step.errorRatePct > config_.maxErrorRatePct) {
        unstable(fmt::format("Error rate {:.2f}% > {}%", step.errorRatePct,
                             config_.maxErrorRatePct));
        return;
    }

    const double factor = 1.0 + 2.0 * config_.latencyStabilityPct / 100.0;
    if (baselineP95_ > 0.0 && step.p95LatencyMs > baselineP95_ * factor) {
        unstable(fmt::format("P95 latency {:.1f}ms > {:.1f}ms (baseline {:.1f}ms)",
                             step.p95LatencyMs, baselineP95_ * factor, baselineP95_));
        return;
    }
    if (baselineP99_ > 0.0 && step.p99LatencyMs > baselineP99_ * factor) {
        unstable(fmt::format("P99 latency {:.1f}ms > {:.1f}ms (baseline {:.1f}ms)",
                             step.p99LatencyMs, baselineP99_ * factor, baselineP99_));
        return;
    }

    for (auto kind : activeKinds_) {
        auto sloIt = config_.slo.find(toString(kind));
        if (sloIt == config_.slo.end())
            continue;
        const auto& slo = sloIt->second;
        if (!slo.p95Ms && !slo.p99Ms && !slo.errorRatePct)
            continue;

        const char* label = toString(kind);
        auto samplesIt = snapshot.byKind.find(kind);
        if (samplesIt == snapshot.byKind.end() || samplesIt->second.operations <= 0) {
            unstable(fmt::format("{}: no operations observed", label));
            return;
        }
        const auto& samples = samplesIt->second;
        const double kindErrors = errorRate(samples.errors, samples.operations);
        if (slo.errorRatePct && kindErrors > *slo.errorRatePct) {
            unstable(fmt::format("{}: error rate {:.2f}% > {}%", label, kindErrors,
                                 *slo.errorRatePct));
            return;
        }
        const auto kindLatencies = sorted(samples.latenciesMs);
        if (slo.p99Ms) {
            const double observed = percentile(kindLatencies, 99.0);
            if (observed > *slo.p99Ms) {
                unstable(fmt::format("{}: P99 {:.1f}ms > {:.1f}ms", label, observed, *slo.p99Ms));
                return;
            }
        }
        if (slo.p95Ms) {
            const double observed = percentile(kindLatencies, 95.0);
            if (observed > *slo.p95Ms) {
                unstable(fmt::format("{}: P95 {:.1f}ms > {:.1f}ms", label, observed, *slo.p95Ms));
                return;
            }
        }
    }

    if (config_.qpsStabilityPct > 0.0) {
        auto prev = std::find_if(steps_.rbegin(), steps_.rend(),
                                 [](const auto& s) { return s.stable && !s.isBackoff; });
        if (prev != steps_.rend() && prev->qps > 0.0) {
            const double change = (step.qps - prev->qps) / prev->qps * 100.0;
            if (change < -config_.qpsStabilityPct) {
                unstable(fmt::format("QPS dropped {:.1f}% vs previous", -change));
                return;
            }
        }
    }
}

void FindMaxSearch::advance(const store::StepRecord& step) {
    switch (mode_) {
        case Mode::Ascending:
            if (step.stable) {
                bestConcurrency_ = step.concurrency;
                bestQps_ = step.qps;
                if (step.concurrency >= config_.maxConcurrency) {
                    finish(kReachedMaxReason);
                } else {
                    pending_ = Plan{std::min(step.concurrency + config_.concurrencyIncrement,
                                             config_.maxConcurrency),
                                    false};
                }
                return;
            }
            if (terminationReason_.empty() && step.stopReason)
                terminationReason_ = *step.stopReason;
            if (backoffAttempts_ < config_.maxBackoffAttempts && bestConcurrency_ > 0 &&
                bestConcurrency_ < step.concurrency) {
                ++backoffAttempts_;
                failedConcurrency_ = step.concurrency;
                mode_ = Mode::Backoff;
                pending_ = Plan{bestConcurrency_, true};
                spdlog::info("[FindMax] Backing off to {} after unstable step at {}",
                             bestConcurrency_, step.concurrency);
                return;
            }
            finish(terminationReason_);
            return;

        case Mode::Backoff: {
            const int midpoint =
                bestConcurrency_ + (failedConcurrency_ - bestConcurrency_) / 2;
            if (step.stable && midpoint > bestConcurrency_ && midpoint < failedConcurrency_) {
                mode_ = Mode::Midpoint;
                pending_ = Plan{midpoint, false};
                return;
            }
            finish(terminationReason_);
            return;
        }

        case Mode::Midpoint:
            if (step.stable) {
                bestConcurrency_ = step.concurrency;
                bestQps_ = step.qps;
                mode_ = Mode::Ascending;
                if (step.concurrency >= config_.maxConcurrency) {
                    finish(kReachedMaxReason);
                } else {
                    pending_ = Plan{std::min(step.concurrency + config_.concurrencyIncrement,
                                             config_.maxConcurrency),
                                    false};
                }
                return;
            }
            finish(terminationReason_);
            return;
    }
}

void FindMaxSearch::finish(const std::string& reason) {
    if (terminationReason_.empty())
        terminationReason_ = reason;
    finished_ = true;
}

void FindMaxSearch::stop() {
    if (!finished_)
        finish(kStoppedReason);
}

store::FindMaxResult FindMaxSearch::result() const {
    store::FindMaxResult out;
    out.finalBestConcurrency = bestConcurrency_;
    out.finalBestQps = bestQps_;
    out.baselineP95LatencyMs = baselineP95_;
    out.baselineP99LatencyMs = baselineP99_;
    out.terminationReason = terminationReason_;
    out.stepHistory = steps_;
    return out;
}

ConcurrencyController::ConcurrencyController(Config config, std::vector<OperationKind> activeKinds,
                                             Dependencies deps)
    : config_(config), deps_(std::move(deps)), search_(std::move(config), std::move(activeKinds)) {}

bool ConcurrencyController::stopping() const {
    return deps_.stopRequested && deps_.stopRequested->load(std::memory_order_acquire);
}

boost::asio::awaitable<bool> ConcurrencyController::hold(std::chrono::milliseconds duration) {
    auto executor = co_await boost::asio::this_coro::executor;
    boost::asio::steady_timer timer(executor);
    const auto deadline = std::chrono::steady_clock::now() + duration;

    while (!stopping()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline)
            co_return true;
        timer.expires_after(std::min<std::chrono::steady_clock::duration>(deadline - now,
                                                                          kHoldSlice));
        try {
            co_await timer.async_wait(boost::asio::use_awaitable);
        } catch (const boost::system::system_error& e) {
            if (e.code() == boost::asio::error::operation_aborted)
                co_return false;
            throw;
        }
    }
    co_return false;
}

boost::asio::awaitable<store::FindMaxResult> ConcurrencyController::run(StepCallback onStep) {
    spdlog::info("[FindMax] Starting search (start={}, increment={}, max={}, step={}ms)",
                 config_.startConcurrency, config_.concurrencyIncrement, config_.maxConcurrency,
                 config_.stepDuration.count());

    const double stepSeconds =
        std::chrono::duration<double>(config_.stepDuration).count();

    while (auto plan = search_.next()) {
        if (stopping()) {
            search_.stop();
            break;
        }

        currentConcurrency_.store(plan->concurrency, std::memory_order_relaxed);
        deps_.pool->scaleTo(plan->concurrency);
        spdlog::info("[FindMax] Step {}{} - holding {} tasks", search_.steps().size() + 1,
                     plan->isBackoff ? " (backoff)" : "", plan->concurrency);

        if (!co_await hold(config_.settleDelay)) {
            search_.stop();
            break;
        }
        deps_.metrics->reset();
        if (!co_await hold(config_.stepDuration)) {
            search_.stop();
            break;
        }

        const auto step = search_.record(deps_.metrics->snapshot(), stepSeconds);
        completedSteps_.fetch_add(1, std::memory_order_relaxed);
        spdlog::info("[FindMax] Step {} complete - {} tasks: {:.1f} QPS, p95={:.1f}ms, "
                     "p99={:.1f}ms, errors={:.2f}%, stable={}",
                     step.stepIndex, step.concurrency, step.qps, step.p95LatencyMs,
                     step.p99LatencyMs, step.errorRatePct, step.stable);
        if (onStep)
            onStep(step);
    }

    auto result = search_.result();
    spdlog::info("[FindMax] Finished: best concurrency {} @ {:.1f} QPS ({})",
                 result.finalBestConcurrency, result.finalBestQps, result.terminationReason);
    co_return result;
}

} // namespace surge::worker
