#include <surge/cli/command.h>
#include <surge/cli/surge_cli.h>
#include <surge/core/ids.h>
#include <surge/store/record_json.h>
#include <surge/worker/simulated_target.h>
#include <surge/worker/worker.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <nlohmann/json.hpp>

#include <spdlog/spdlog.h>

#include <csignal>
#include <iostream>
#include <optional>

namespace surge::cli {

class WorkerCommand : public ICommand {
public:
    std::string getName() const override { return "worker"; }

    std::string getDescription() const override {
        return "Join a run and generate load against the simulated target";
    }

    void registerCommand(CLI::App& app, SurgeCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("--run-id", runId_, "Run to join")->required();
        cmd->add_option("--worker-id", workerId_, "Worker id (generated when omitted)");
        cmd->add_option("--group-id", groupId_, "Worker group id in [0, groups)")
            ->check(CLI::NonNegativeNumber);
        cmd->add_option("--groups", groups_, "Total worker groups (default: worker_group_size)")
            ->check(CLI::PositiveNumber);
        cmd->add_option("--concurrency", concurrency_, "Initial task count")
            ->check(CLI::NonNegativeNumber);

        cmd->callback([this]() {
            auto result = execute();
            if (!result) {
                spdlog::error("worker failed: {}", result.error().message);
                throw CLI::RuntimeError(1);
            }
        });
    }

    Result<void> execute() override {
        auto settings = cli_->loadSettings();
        if (!settings)
            return settings.error();
        auto cfg = std::move(settings).value();
        if (concurrency_ >= 0)
            cfg.workload.concurrency = concurrency_;
        const int groups = groups_ > 0 ? groups_ : cfg.orchestrator.workerGroupSize;
        if (groupId_ >= groups) {
            return Error{ErrorCode::InvalidArgument,
                         "group-id " + std::to_string(groupId_) + " is outside [0, " +
                             std::to_string(groups) + ")"};
        }
        if (workerId_.empty())
            workerId_ = core::generateId("worker");

        auto store = cli_->openStore(cfg);
        if (!store)
            return store.error();

        // The run row carries the load mode the orchestrator was configured with.
        auto run = store.value()->readRun(runId_);
        if (!run)
            return run.error();
        if (run.value().loadMode == config::toString(config::LoadMode::FindMax))
            cfg.workload.loadMode = config::LoadMode::FindMax;
        else
            cfg.workload.loadMode = config::LoadMode::Concurrency;

        boost::asio::io_context io;
        worker::SimulatedTargetClient target(io.get_executor(), cfg.target);
        std::optional<worker::BoundedConnectionPool> pool;
        if (cfg.target.connectionLimit > 0)
            pool.emplace(io.get_executor(), cfg.target.connectionLimit);
        worker::ShardedValueProvider values(groupId_, groups);

        worker::Worker w(
            {.runId = runId_,
             .workerId = workerId_,
             .workerGroupId = groupId_,
             .rendezvous = cfg.rendezvous,
             .heartbeat = cfg.heartbeat,
             .workload = cfg.workload,
             .findMax = cfg.findMax},
            {.executor = io.get_executor(),
             .store = store.value().get(),
             .target = &target,
             .pool = pool ? &*pool : nullptr,
             .values = &values});

        boost::asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signo) {
            if (ec)
                return;
            spdlog::warn("[Worker] Signal {} received, stopping {}", signo, workerId_);
            w.requestStop();
        });

        auto task = [&]() -> boost::asio::awaitable<Result<void>> {
            auto result = co_await w.run();
            signals.cancel();
            if (cli_->getJsonOutput()) {
                std::cout << nlohmann::json(result).dump(2) << std::endl;
            } else {
                std::cout << result.workerId << " " << control::toString(result.status) << " ops="
                          << result.totalOperations << " errors=" << result.failedOperations;
                if (result.findMax) {
                    std::cout << " best=" << result.findMax->finalBestConcurrency
                              << " qps=" << result.findMax->finalBestQps;
                }
                std::cout << std::endl;
            }
            if (result.status == control::RunStatus::Failed)
                co_return Error{ErrorCode::InvalidState, result.message};
            co_return Result<void>();
        };
        return cli_->runToCompletion(io, task());
    }

private:
    SurgeCLI* cli_ = nullptr;
    std::string runId_;
    std::string workerId_;
    int groupId_ = 0;
    int groups_ = 0;
    int concurrency_ = -1;
};

std::unique_ptr<ICommand> createWorkerCommand() {
    return std::make_unique<WorkerCommand>();
}

} // namespace surge::cli
