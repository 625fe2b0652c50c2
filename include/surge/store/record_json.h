#pragma once

#include <surge/store/records.h>

#include <nlohmann/json.hpp>

// nlohmann::json conversions for the record types that are persisted as JSON
// columns (kind_metrics, find_max_result) or printed by the CLI.
namespace surge::store {

void to_json(nlohmann::json& j, const KindStepMetrics& m);
void from_json(const nlohmann::json& j, KindStepMetrics& m);

void to_json(nlohmann::json& j, const StepRecord& s);
void from_json(const nlohmann::json& j, StepRecord& s);

void to_json(nlohmann::json& j, const FindMaxResult& r);
void from_json(const nlohmann::json& j, FindMaxResult& r);

void to_json(nlohmann::json& j, const AggregatedStep& s);
void from_json(const nlohmann::json& j, AggregatedStep& s);

void to_json(nlohmann::json& j, const PerWorkerFindMax& p);
void from_json(const nlohmann::json& j, PerWorkerFindMax& p);

void to_json(nlohmann::json& j, const AggregatedFindMaxResult& r);
void from_json(const nlohmann::json& j, AggregatedFindMaxResult& r);

void to_json(nlohmann::json& j, const RunRecord& r);
void to_json(nlohmann::json& j, const HeartbeatRecord& h);
void to_json(nlohmann::json& j, const WorkerResult& w);
void to_json(nlohmann::json& j, const RunResult& r);

} // namespace surge::store
