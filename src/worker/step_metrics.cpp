#include <surge/worker/step_metrics.h>

#include <algorithm>

namespace surge::worker {

double percentile(const std::vector<double>& sorted, double p) {
    if (sorted.empty())
        return 0.0;
    auto index = static_cast<size_t>(static_cast<double>(sorted.size()) * p / 100.0);
    index = std::min(index, sorted.size() - 1);
    return sorted[index];
}

void StepMetricsCollector::record(OperationKind kind, const OperationOutcome& outcome) {
    std::scoped_lock lock(mutex_);
    ++totalOperations_;
    ++step_.operations;
    auto& perKind = step_.byKind[kind];
    ++perKind.operations;

    if (outcome.success) {
        step_.latenciesMs.push_back(outcome.latencyMs);
        perKind.latenciesMs.push_back(outcome.latencyMs);
        return;
    }
    ++failedOperations_;
    ++step_.errors;
    ++perKind.errors;
    lastError_ = outcome.error;
}

void StepMetricsCollector::reset() {
    std::scoped_lock lock(mutex_);
    step_ = StepSnapshot{};
}

StepSnapshot StepMetricsCollector::snapshot() const {
    std::scoped_lock lock(mutex_);
    return step_;
}

int64_t StepMetricsCollector::totalOperations() const {
    std::scoped_lock lock(mutex_);
    return totalOperations_;
}

int64_t StepMetricsCollector::failedOperations() const {
    std::scoped_lock lock(mutex_);
    return failedOperations_;
}

std::string StepMetricsCollector::lastError() const {
    std::scoped_lock lock(mutex_);
    return lastError_;
}

} // namespace surge::worker
