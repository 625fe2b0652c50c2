#include <surge/cli/command.h>
#include <surge/cli/surge_cli.h>
#include <surge/orchestrator/orchestrator.h>
#include <surge/store/record_json.h>

#include <boost/asio/io_context.hpp>

#include <nlohmann/json.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iostream>

namespace surge::cli {

class CreateRunCommand : public ICommand {
public:
    std::string getName() const override { return "create-run"; }

    std::string getDescription() const override {
        return "Create a PREPARED run for workers to join";
    }

    void registerCommand(CLI::App& app, SurgeCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("--run-id", runId_, "Run id (generated when omitted)");
        cmd->add_option("--workers", workers_, "Number of worker groups expected")
            ->check(CLI::PositiveNumber);
        cmd->add_option("--mode", mode_, "Load mode")
            ->check(CLI::IsMember({"concurrency", "find_max"}));

        cmd->callback([this]() {
            auto result = execute();
            if (!result) {
                spdlog::error("create-run failed: {}", result.error().message);
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

        auto store = cli_->openStore(cfg);
        if (!store)
            return store.error();

        boost::asio::io_context io;
        orchestrator::Orchestrator orch(
            {.orchestrator = cfg.orchestrator, .heartbeat = cfg.heartbeat, .workload = cfg.workload},
            {.executor = io.get_executor(), .store = store.value().get()});
        auto run = orch.createRun(runId_);
        if (!run)
            return run.error();

        if (cli_->getJsonOutput()) {
            std::cout << nlohmann::json(run.value()).dump(2) << std::endl;
        } else {
            std::cout << run.value().runId << std::endl;
        }
        return Result<void>();
    }

private:
    SurgeCLI* cli_ = nullptr;
    std::string runId_;
    int workers_ = 0;
    std::string mode_;
};

std::unique_ptr<ICommand> createCreateRunCommand() {
    return std::make_unique<CreateRunCommand>();
}

} // namespace surge::cli
