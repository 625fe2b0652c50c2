#include <surge/cli/command.h>
#include <surge/cli/surge_cli.h>
#include <surge/orchestrator/orchestrator.h>
#include <surge/store/record_json.h>
#include <surge/worker/simulated_target.h>
#include <surge/worker/worker.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <nlohmann/json.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <csignal>
#include <exception>
#include <iostream>
#include <optional>
#include <vector>

namespace surge::cli {

/**
 * Orchestrator and every worker group in one process, sharing one io_context
 * and one simulated target. Coordination still goes through the state store,
 * so the run is indistinguishable from a distributed one afterwards.
 */
class LocalCommand : public ICommand {
public:
    std::string getName() const override { return "local"; }

    std::string getDescription() const override {
        return "Run the orchestrator and N workers in-process against the simulated target";
    }

    void registerCommand(CLI::App& app, SurgeCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("--run-id", runId_, "Run id (generated when omitted)");
        cmd->add_option("-n,--workers", workers_, "Number of worker groups")
            ->check(CLI::PositiveNumber);
        cmd->add_option("--mode", mode_, "Load mode")
            ->check(CLI::IsMember({"concurrency", "find_max"}));
        cmd->add_option("--concurrency", concurrency_, "Total concurrency in concurrency mode")
            ->check(CLI::NonNegativeNumber);
        cmd->add_option("--duration", durationSeconds_, "Measurement window in seconds");

        cmd->callback([this]() {
            auto result = execute();
            if (!result) {
                spdlog::error("local run failed: {}", result.error().message);
                throw CLI::RuntimeError(1);
            }
        });
    }

    Result<void> execute() override {
        auto settings = cli_->loadSettings();
        if (!settings)
            return settings.error();
        auto cfg = std::move(settings).value();
        if (workers_ > 0) {
            cfg.orchestrator.workerGroupSize = workers_;
            cfg.orchestrator.minWorkers = std::min(cfg.orchestrator.minWorkers, workers_);
        }
        if (!mode_.empty()) {
            cfg.workload.loadMode =
                mode_ == "find_max" ? config::LoadMode::FindMax : config::LoadMode::Concurrency;
        }
        if (durationSeconds_ >= 0)
            cfg.workload.durationSeconds = durationSeconds_;
        const int groups = cfg.orchestrator.workerGroupSize;
        if (concurrency_ >= 0)
            cfg.workload.concurrency = concurrency_;

        auto store = cli_->openStore(cfg);
        if (!store)
            return store.error();

        boost::asio::io_context io;
        orchestrator::Orchestrator orch(
            {.orchestrator = cfg.orchestrator, .heartbeat = cfg.heartbeat, .workload = cfg.workload},
            {.executor = io.get_executor(), .store = store.value().get()});
        auto created = orch.createRun(runId_);
        if (!created)
            return created.error();
        const std::string runId = created.value().runId;

        worker::SimulatedTargetClient target(io.get_executor(), cfg.target);
        std::optional<worker::BoundedConnectionPool> pool;
        if (cfg.target.connectionLimit > 0)
            pool.emplace(io.get_executor(), cfg.target.connectionLimit);

        // Each worker starts with its share of the total, remainder to the lowest ids.
        const auto shares =
            orchestrator::distributeTargets(cfg.workload.concurrency, groups, 0);
        std::vector<std::unique_ptr<worker::ShardedValueProvider>> values;
        std::vector<std::unique_ptr<worker::Worker>> workers;
        for (int group = 0; group < groups; ++group) {
            auto workload = cfg.workload;
            workload.concurrency = shares[static_cast<size_t>(group)];
            values.push_back(std::make_unique<worker::ShardedValueProvider>(group, groups));
            workers.push_back(std::make_unique<worker::Worker>(
                worker::Worker::Config{.runId = runId,
                                       .workerId = fmt::format("{}-worker-{}", runId, group),
                                       .workerGroupId = group,
                                       .rendezvous = cfg.rendezvous,
                                       .heartbeat = cfg.heartbeat,
                                       .workload = workload,
                                       .findMax = cfg.findMax},
                worker::Worker::Dependencies{.executor = io.get_executor(),
                                             .store = store.value().get(),
                                             .target = &target,
                                             .pool = pool ? &*pool : nullptr,
                                             .values = values.back().get()}));
        }

        boost::asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signo) {
            if (ec)
                return;
            spdlog::warn("[Local] Signal {} received, stopping run {}", signo, runId);
            if (auto stopped = orch.requestStop(runId); !stopped)
                spdlog::error("[Local] Stop failed: {}", stopped.error().message);
        });

        spdlog::info("[Local] Run {} with {} workers against the simulated target", runId,
                     groups);
        for (auto& w : workers) {
            boost::asio::co_spawn(io, w->run(),
                                  [](std::exception_ptr e, const store::WorkerResult& result) {
                                      if (e) {
                                          try {
                                              std::rethrow_exception(e);
                                          } catch (const std::exception& ex) {
                                              spdlog::error("[Local] Worker crashed: {}",
                                                            ex.what());
                                          }
                                          return;
                                      }
                                      spdlog::debug("[Local] {} returned {}", result.workerId,
                                                    control::toString(result.status));
                                  });
        }

        auto task = [&]() -> boost::asio::awaitable<Result<void>> {
            auto finalRun = co_await orch.execute(runId);
            // Workers that outlived the drain deadline are told to stop here.
            for (auto& w : workers)
                w->requestStop();
            signals.cancel();
            if (!finalRun)
                co_return finalRun.error();
            print(finalRun.value(), *store.value());
            co_return Result<void>();
        };
        return cli_->runToCompletion(io, task());
    }

private:
    void print(const store::RunRecord& run, store::SharedStateStore& stateStore) const {
        auto result = stateStore.readRunResult(run.runId);
        if (cli_->getJsonOutput()) {
            nlohmann::json out;
            out["run"] = run;
            out["result"] =
                result && result.value() ? nlohmann::json(*result.value()) : nlohmann::json(nullptr);
            std::cout << out.dump(2) << std::endl;
            return;
        }
        std::cout << run.runId << " " << control::toString(run.status);
        if (!run.message.empty())
            std::cout << " (" << run.message << ")";
        std::cout << "\n";
        if (result && result.value()) {
            const auto& res = *result.value();
            std::cout << fmt::format("{} operations, {} failed, {} workers reported\n",
                                     res.totalOperations, res.failedOperations,
                                     res.workersReported);
            if (res.findMax) {
                std::cout << fmt::format("Best total concurrency {} at {:.1f} qps\n",
                                         res.findMax->finalBestConcurrency,
                                         res.findMax->finalBestQps);
                for (const auto& step : res.findMax->stepHistory) {
                    std::cout << fmt::format("  total={:<6} qps={:<9.1f} p95={:<7.1f} p99={:.1f}{}\n",
                                             step.totalConcurrency, step.qps, step.p95LatencyMs,
                                             step.p99LatencyMs,
                                             step.anyUnstable ? " unstable" : "");
                }
            }
        }
        std::cout.flush();
    }

    SurgeCLI* cli_ = nullptr;
    std::string runId_;
    int workers_ = 0;
    std::string mode_;
    int concurrency_ = -1;
    double durationSeconds_ = -1.0;
};

std::unique_ptr<ICommand> createLocalCommand() {
    return std::make_unique<LocalCommand>();
}

} // namespace surge::cli
