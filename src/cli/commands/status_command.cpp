#include <surge/cli/command.h>
#include <surge/cli/surge_cli.h>
#include <surge/orchestrator/run_queries.h>
#include <surge/store/record_json.h>

#include <nlohmann/json.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <iostream>

namespace surge::cli {

using nlohmann::json;

class StatusCommand : public ICommand {
public:
    std::string getName() const override { return "status"; }

    std::string getDescription() const override {
        return "Show a run's status, workers and results (recent runs when no id is given)";
    }

    void registerCommand(CLI::App& app, SurgeCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("run-id,--run-id", runId_, "Run to inspect");
        cmd->add_flag("--steps", showSteps_, "Include per-worker find-max step history");
        cmd->add_flag("--aggregate", showAggregate_,
                      "Include step history merged per concurrency level");
        cmd->add_option("--limit", limit_, "Number of recent runs to list")
            ->check(CLI::PositiveNumber);

        cmd->callback([this]() {
            auto result = execute();
            if (!result) {
                spdlog::error("status failed: {}", result.error().message);
                throw CLI::RuntimeError(1);
            }
        });
    }

    Result<void> execute() override {
        auto settings = cli_->loadSettings();
        if (!settings)
            return settings.error();
        auto store = cli_->openStore(settings.value());
        if (!store)
            return store.error();

        orchestrator::RunQueries queries(*store.value(), settings.value().heartbeat.staleTimeout);
        if (runId_.empty())
            return listRuns(queries);
        return showRun(queries);
    }

private:
    Result<void> listRuns(orchestrator::RunQueries& queries) {
        auto runs = queries.recentRuns(limit_);
        if (!runs)
            return runs.error();

        if (cli_->getJsonOutput()) {
            std::cout << json(runs.value()).dump(2) << std::endl;
            return Result<void>();
        }
        if (runs.value().empty()) {
            std::cout << "No runs" << std::endl;
            return Result<void>();
        }
        for (const auto& run : runs.value()) {
            std::cout << fmt::format("{:<40} {:<11} {:<10} {:<11} workers={}", run.runId,
                                     control::toString(run.status), control::toString(run.phase),
                                     run.loadMode, run.workersExpected)
                      << std::endl;
        }
        return Result<void>();
    }

    Result<void> showRun(orchestrator::RunQueries& queries) {
        auto run = queries.runStatus(runId_);
        if (!run)
            return run.error();
        auto hb = queries.heartbeats(runId_);
        if (!hb)
            return hb.error();
        auto result = queries.runResult(runId_);
        if (!result)
            return result.error();

        std::optional<std::vector<store::WorkerStepRecord>> steps;
        if (showSteps_) {
            auto rows = queries.stepHistory(runId_);
            if (!rows)
                return rows.error();
            steps = std::move(rows).value();
        }
        std::optional<std::vector<store::AggregatedStep>> aggregated;
        if (showAggregate_) {
            auto rows = queries.aggregatedStepHistory(runId_);
            if (!rows)
                return rows.error();
            aggregated = std::move(rows).value();
        }

        if (cli_->getJsonOutput()) {
            json out;
            out["run"] = run.value();
            out["workers"] = json::array();
            for (const auto& w : hb.value().workers)
                out["workers"].push_back(json(w));
            out["alive"] = hb.value().alive;
            out["stale"] = hb.value().staleWorkerIds;
            out["result"] = result.value() ? json(*result.value()) : json(nullptr);
            if (steps) {
                out["steps"] = json::array();
                for (const auto& s : *steps) {
                    json row = s.step;
                    row["worker_id"] = s.workerId;
                    out["steps"].push_back(std::move(row));
                }
            }
            if (aggregated)
                out["aggregatedSteps"] = *aggregated;
            std::cout << out.dump(2) << std::endl;
            return Result<void>();
        }

        const auto& r = run.value();
        std::cout << "Run:      " << r.runId << "\n";
        std::cout << "Status:   " << control::toString(r.status) << "\n";
        std::cout << "Phase:    " << control::toString(r.phase) << "\n";
        std::cout << "Mode:     " << r.loadMode << "\n";
        if (!r.message.empty())
            std::cout << "Message:  " << r.message << "\n";
        std::cout << fmt::format("Workers:  {} expected, {} reporting, {} alive, {} stale\n",
                                 r.workersExpected, hb.value().total, hb.value().alive,
                                 hb.value().stale);
        for (const auto& w : hb.value().workers) {
            std::cout << fmt::format("  {:<36} group={} {:<8} tasks={}/{} ops={} errors={}\n",
                                     w.workerId, w.workerGroupId, control::toString(w.status),
                                     w.activeTasks, w.targetConcurrency, w.operations, w.errors);
        }
        if (result.value()) {
            const auto& res = *result.value();
            std::cout << fmt::format("Result:   {} operations, {} failed, {} workers reported\n",
                                     res.totalOperations, res.failedOperations,
                                     res.workersReported);
            if (res.findMax) {
                std::cout << fmt::format(
                    "Find-max: best concurrency {} at {:.1f} qps across {} workers\n",
                    res.findMax->finalBestConcurrency, res.findMax->finalBestQps,
                    res.findMax->totalWorkers);
            }
        }
        if (steps) {
            std::cout << "Steps:\n";
            for (const auto& s : *steps) {
                std::cout << fmt::format(
                    "  {:<36} #{:<3} c={:<5} qps={:<9.1f} p95={:<7.1f} p99={:<7.1f} err={:.2f}%{}{}\n",
                    s.workerId, s.step.stepIndex, s.step.concurrency, s.step.qps,
                    s.step.p95LatencyMs, s.step.p99LatencyMs, s.step.errorRatePct,
                    s.step.isBackoff ? " backoff" : "",
                    s.step.stable ? "" : " unstable: " + s.step.stopReason.value_or(""));
            }
        }
        if (aggregated) {
            std::cout << "Aggregated:\n";
            for (const auto& a : *aggregated) {
                std::cout << fmt::format("  c={:<5} total={:<6} qps={:<9.1f} p95max={:<7.1f} "
                                         "p99max={:<7.1f} workers={}/{}{}\n",
                                         a.concurrency, a.totalConcurrency, a.qps, a.p95LatencyMs,
                                         a.p99LatencyMs, a.activeWorkers, a.totalWorkers,
                                         a.anyUnstable ? " unstable" : "");
            }
        }
        std::cout.flush();
        return Result<void>();
    }

    SurgeCLI* cli_ = nullptr;
    std::string runId_;
    bool showSteps_ = false;
    bool showAggregate_ = false;
    int limit_ = 20;
};

std::unique_ptr<ICommand> createStatusCommand() {
    return std::make_unique<StatusCommand>();
}

} // namespace surge::cli
