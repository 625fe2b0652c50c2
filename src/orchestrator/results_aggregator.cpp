#include <surge/orchestrator/results_aggregator.h>

#include <surge/core/types.h>

#include <algorithm>
#include <set>

namespace surge::orchestrator {

std::vector<store::AggregatedStep>
aggregateStepHistory(const std::map<std::string, std::vector<store::StepRecord>>& stepsByWorker,
                     int totalWorkers) {
    // concurrency -> worker -> step
    std::map<int, std::map<std::string, const store::StepRecord*>> byLevel;
    for (const auto& [workerId, steps] : stepsByWorker) {
        for (const auto& step : steps) {
            if (step.isBackoff)
                continue;
            byLevel[step.concurrency].emplace(workerId, &step);
        }
    }

    std::vector<store::AggregatedStep> out;
    out.reserve(byLevel.size());
    for (const auto& [concurrency, workers] : byLevel) {
        store::AggregatedStep agg;
        agg.concurrency = concurrency;
        agg.activeWorkers = static_cast<int>(workers.size());
        agg.totalWorkers = totalWorkers;
        agg.totalConcurrency = concurrency * agg.activeWorkers;

        double sumP95 = 0.0;
        double sumP99 = 0.0;
        for (const auto& [workerId, step] : workers) {
            agg.qps += step->qps;
            agg.p95LatencyMs = std::max(agg.p95LatencyMs, step->p95LatencyMs);
            agg.p99LatencyMs = std::max(agg.p99LatencyMs, step->p99LatencyMs);
            sumP95 += step->p95LatencyMs;
            sumP99 += step->p99LatencyMs;
            if (!step->stable) {
                agg.anyUnstable = true;
                if (step->stopReason)
                    agg.unstableReasons.push_back(*step->stopReason);
            }
        }
        if (agg.activeWorkers > 0) {
            agg.avgP95LatencyMs = sumP95 / agg.activeWorkers;
            agg.avgP99LatencyMs = sumP99 / agg.activeWorkers;
        }
        out.push_back(std::move(agg));
    }
    return out;
}

store::AggregatedFindMaxResult aggregateFindMax(const std::vector<store::WorkerResult>& results) {
    store::AggregatedFindMaxResult agg;
    std::set<std::string> nodes;
    std::map<std::string, std::vector<store::StepRecord>> stepsByWorker;

    for (const auto& worker : results) {
        if (!worker.findMax)
            continue;
        const auto& fm = *worker.findMax;
        ++agg.totalWorkers;
        nodes.insert(worker.workerId);
        agg.finalBestConcurrency += fm.finalBestConcurrency;
        agg.finalBestQps += fm.finalBestQps;
        agg.baselineP95LatencyMs = std::max(agg.baselineP95LatencyMs, fm.baselineP95LatencyMs);
        agg.baselineP99LatencyMs = std::max(agg.baselineP99LatencyMs, fm.baselineP99LatencyMs);
        agg.perWorkerResults.push_back({worker.workerId, worker.workerGroupId, fm});
        stepsByWorker[worker.workerId] = fm.stepHistory;
    }
    agg.totalNodes = static_cast<int>(nodes.size());
    agg.stepHistory = aggregateStepHistory(stepsByWorker, agg.totalWorkers);
    return agg;
}

store::RunResult aggregateResults(const std::string& runId,
                                  const std::vector<store::WorkerResult>& results) {
    store::RunResult run;
    run.runId = runId;
    run.workersReported = static_cast<int>(results.size());
    bool anyFindMax = false;
    for (const auto& worker : results) {
        run.totalOperations += worker.totalOperations;
        run.failedOperations += worker.failedOperations;
        anyFindMax = anyFindMax || worker.findMax.has_value();
    }
    if (anyFindMax)
        run.findMax = aggregateFindMax(results);
    run.completedAtMs = epochMillis();
    return run;
}

} // namespace surge::orchestrator
