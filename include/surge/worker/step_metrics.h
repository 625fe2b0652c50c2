#pragma once

#include <surge/worker/target_client.h>

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace surge::worker {

/// Value at percentile `p` of an ascending sequence: element
/// floor(n * p / 100) clamped to n - 1. Empty input yields 0.
double percentile(const std::vector<double>& sorted, double p);

struct KindSamples {
    int64_t operations{0};
    int64_t errors{0};
    std::vector<double> latenciesMs;
};

/// Everything recorded since the last reset.
struct StepSnapshot {
    int64_t operations{0};
    int64_t errors{0};
    std::vector<double> latenciesMs; // successful operations only
    std::map<OperationKind, KindSamples> byKind;
};

/**
 * @brief Outcome sink shared by every task of one worker.
 *
 * Step buffers are cleared by reset() at each step boundary; lifetime counters
 * survive resets and feed heartbeats and the final worker result.
 */
class StepMetricsCollector {
public:
    void record(OperationKind kind, const OperationOutcome& outcome);

    void reset();
    StepSnapshot snapshot() const;

    int64_t totalOperations() const;
    int64_t failedOperations() const;
    std::string lastError() const;

private:
    mutable std::mutex mutex_;
    StepSnapshot step_;
    int64_t totalOperations_{0};
    int64_t failedOperations_{0};
    std::string lastError_;
};

} // namespace surge::worker
