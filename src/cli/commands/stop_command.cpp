#include <surge/cli/command.h>
#include <surge/cli/surge_cli.h>
#include <surge/orchestrator/orchestrator.h>

#include <boost/asio/io_context.hpp>

#include <spdlog/spdlog.h>

#include <iostream>

namespace surge::cli {

class StopCommand : public ICommand {
public:
    std::string getName() const override { return "stop"; }

    std::string getDescription() const override { return "Cancel a run"; }

    void registerCommand(CLI::App& app, SurgeCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("run-id,--run-id", runId_, "Run to cancel")->required();

        cmd->callback([this]() {
            auto result = execute();
            if (!result) {
                spdlog::error("stop failed: {}", result.error().message);
                throw CLI::RuntimeError(1);
            }
        });
    }

    Result<void> execute() override {
        auto settings = cli_->loadSettings();
        if (!settings)
            return settings.error();
        const auto& cfg = settings.value();
        auto store = cli_->openStore(cfg);
        if (!store)
            return store.error();

        boost::asio::io_context io;
        orchestrator::Orchestrator orch(
            {.orchestrator = cfg.orchestrator, .heartbeat = cfg.heartbeat, .workload = cfg.workload},
            {.executor = io.get_executor(), .store = store.value().get()});
        if (auto stopped = orch.requestStop(runId_); !stopped)
            return stopped.error();

        auto run = store.value()->readRun(runId_);
        if (!run)
            return run.error();
        std::cout << runId_ << " " << control::toString(run.value().status) << std::endl;
        return Result<void>();
    }

private:
    SurgeCLI* cli_ = nullptr;
    std::string runId_;
};

std::unique_ptr<ICommand> createStopCommand() {
    return std::make_unique<StopCommand>();
}

} // namespace surge::cli
