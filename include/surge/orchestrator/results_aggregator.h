#pragma once

#include <surge/store/records.h>

#include <map>
#include <string>
#include <vector>

namespace surge::orchestrator {

/// One row per concurrency level, ascending. For each worker only its first
/// non-backoff step at a level counts. qps is summed, latencies are reported
/// as the worst and the mean across the workers that ran the level.
std::vector<store::AggregatedStep>
aggregateStepHistory(const std::map<std::string, std::vector<store::StepRecord>>& stepsByWorker,
                     int totalWorkers);

/// Sums final_best_concurrency and final_best_qps over every worker that
/// reported a find-max result. Baselines are the worst across workers.
store::AggregatedFindMaxResult aggregateFindMax(const std::vector<store::WorkerResult>& results);

/// Run-level totals. findMax is set only when at least one worker ran a search.
store::RunResult aggregateResults(const std::string& runId,
                                  const std::vector<store::WorkerResult>& results);

} // namespace surge::orchestrator
