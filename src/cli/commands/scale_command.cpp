#include <surge/cli/command.h>
#include <surge/cli/surge_cli.h>
#include <surge/orchestrator/orchestrator.h>

#include <boost/asio/io_context.hpp>

#include <spdlog/spdlog.h>

#include <iostream>

namespace surge::cli {

class ScaleCommand : public ICommand {
public:
    std::string getName() const override { return "scale"; }

    std::string getDescription() const override {
        return "Change the total concurrency of a running fixed-concurrency run";
    }

    void registerCommand(CLI::App& app, SurgeCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("run-id,--run-id", runId_, "Run to scale")->required();
        cmd->add_option("--total", total_, "Total concurrency across all worker groups")
            ->required()
            ->check(CLI::NonNegativeNumber);
        cmd->add_option("--per-worker-cap", perWorkerCap_,
                        "Fill groups up to this many tasks instead of splitting evenly")
            ->check(CLI::NonNegativeNumber);

        cmd->callback([this]() {
            auto result = execute();
            if (!result) {
                spdlog::error("scale failed: {}", result.error().message);
                throw CLI::RuntimeError(1);
            }
        });
    }

    Result<void> execute() override {
        auto settings = cli_->loadSettings();
        if (!settings)
            return settings.error();
        auto cfg = std::move(settings).value();
        if (perWorkerCap_ >= 0)
            cfg.orchestrator.perWorkerCap = perWorkerCap_;

        auto store = cli_->openStore(cfg);
        if (!store)
            return store.error();

        // Group count comes from the run, not from local settings.
        auto run = store.value()->readRun(runId_);
        if (!run)
            return run.error();
        cfg.orchestrator.workerGroupSize = run.value().workersExpected;
        cfg.orchestrator.minWorkers = 1;

        boost::asio::io_context io;
        orchestrator::Orchestrator orch(
            {.orchestrator = cfg.orchestrator, .heartbeat = cfg.heartbeat, .workload = cfg.workload},
            {.executor = io.get_executor(), .store = store.value().get()});
        auto events = orch.scaleTo(runId_, total_);
        if (!events)
            return events.error();

        for (const auto& event : events.value()) {
            const auto& p = std::get<control::ScaleToPayload>(event.payload);
            std::cout << "seq=" << event.sequence << " group="
                      << (p.workerGroupId ? std::to_string(*p.workerGroupId) : "all")
                      << " target=" << p.target << std::endl;
        }
        return Result<void>();
    }

private:
    SurgeCLI* cli_ = nullptr;
    std::string runId_;
    int total_ = 0;
    int perWorkerCap_ = -1;
};

std::unique_ptr<ICommand> createScaleCommand() {
    return std::make_unique<ScaleCommand>();
}

} // namespace surge::cli
