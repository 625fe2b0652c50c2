#pragma once

#include <surge/core/types.h>

#include <CLI/CLI.hpp>

#include <memory>
#include <string>

namespace surge::cli {

class SurgeCLI;

/**
 * One `surge <name>` subcommand. registerCommand() declares its options on
 * the CLI11 app and wires the callback that ends in execute().
 */
class ICommand {
public:
    virtual ~ICommand() = default;

    virtual std::string getName() const = 0;

    virtual std::string getDescription() const = 0;

    virtual void registerCommand(CLI::App& app, SurgeCLI* cli) = 0;

    virtual Result<void> execute() = 0;
};

std::unique_ptr<ICommand> createCreateRunCommand();
std::unique_ptr<ICommand> createOrchestrateCommand();
std::unique_ptr<ICommand> createWorkerCommand();
std::unique_ptr<ICommand> createStatusCommand();
std::unique_ptr<ICommand> createStopCommand();
std::unique_ptr<ICommand> createScaleCommand();
std::unique_ptr<ICommand> createLocalCommand();

} // namespace surge::cli
