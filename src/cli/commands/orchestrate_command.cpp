#include <surge/cli/command.h>
#include <surge/cli/surge_cli.h>
#include <surge/orchestrator/orchestrator.h>
#include <surge/store/record_json.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <nlohmann/json.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <csignal>
#include <iostream>

namespace surge::cli {

class OrchestrateCommand : public ICommand {
public:
    std::string getName() const override { return "orchestrate"; }

    std::string getDescription() const override {
        return "Drive a run from PREPARED to a terminal status";
    }

    void registerCommand(CLI::App& app, SurgeCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("--run-id", runId_, "Run to drive (created when missing)");
        cmd->add_option("--workers", workers_, "Number of worker groups expected")
            ->check(CLI::PositiveNumber);
        cmd->add_option("--mode", mode_, "Load mode")
            ->check(CLI::IsMember({"concurrency", "find_max"}));
        cmd->add_option("--duration", durationSeconds_, "Measurement window in seconds");
        cmd->add_option("--warmup", warmupSeconds_, "Warmup in seconds");

        cmd->callback([this]() {
            auto result = execute();
            if (!result) {
                spdlog::error("orchestrate failed: {}", result.error().message);
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
        if (warmupSeconds_ >= 0)
            cfg.workload.warmupSeconds = warmupSeconds_;

        auto store = cli_->openStore(cfg);
        if (!store)
            return store.error();

        boost::asio::io_context io;
        orchestrator::Orchestrator orch(
            {.orchestrator = cfg.orchestrator, .heartbeat = cfg.heartbeat, .workload = cfg.workload},
            {.executor = io.get_executor(), .store = store.value().get()});

        std::string runId = runId_;
        auto existing = runId.empty() ? Result<store::RunRecord>(ErrorCode::NotFound)
                                      : store.value()->readRun(runId);
        if (!existing) {
            if (existing.error().code != ErrorCode::NotFound)
                return existing.error();
            auto created = orch.createRun(runId);
            if (!created)
                return created.error();
            runId = created.value().runId;
        }
        spdlog::info("[Orchestrator] Driving run {} ({} worker groups, mode {})", runId,
                     cfg.orchestrator.workerGroupSize, config::toString(cfg.workload.loadMode));

        boost::asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signo) {
            if (ec)
                return;
            spdlog::warn("[Orchestrator] Signal {} received, stopping run {}", signo, runId);
            if (auto stopped = orch.requestStop(runId); !stopped)
                spdlog::error("[Orchestrator] Stop failed: {}", stopped.error().message);
        });

        auto task = [&]() -> boost::asio::awaitable<Result<void>> {
            auto finalRun = co_await orch.execute(runId);
            signals.cancel();
            if (!finalRun)
                co_return finalRun.error();
            print(finalRun.value());
            co_return Result<void>();
        };
        return cli_->runToCompletion(io, task());
    }

private:
    void print(const store::RunRecord& run) const {
        if (cli_->getJsonOutput()) {
            std::cout << nlohmann::json(run).dump(2) << std::endl;
            return;
        }
        std::cout << run.runId << " " << control::toString(run.status) << " "
                  << control::toString(run.phase);
        if (!run.message.empty())
            std::cout << " (" << run.message << ")";
        std::cout << std::endl;
    }

    SurgeCLI* cli_ = nullptr;
    std::string runId_;
    int workers_ = 0;
    std::string mode_;
    double durationSeconds_ = -1.0;
    double warmupSeconds_ = -1.0;
};

std::unique_ptr<ICommand> createOrchestrateCommand() {
    return std::make_unique<OrchestrateCommand>();
}

} // namespace surge::cli
