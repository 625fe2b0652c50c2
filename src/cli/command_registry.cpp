#include <surge/cli/command_registry.h>
#include <surge/cli/surge_cli.h>

namespace surge::cli {

void CommandRegistry::registerAllCommands(SurgeCLI* cli) {
    cli->registerCommand(createCreateRunCommand());
    cli->registerCommand(createOrchestrateCommand());
    cli->registerCommand(createWorkerCommand());
    cli->registerCommand(createStatusCommand());
    cli->registerCommand(createStopCommand());
    cli->registerCommand(createScaleCommand());
    cli->registerCommand(createLocalCommand());
}

} // namespace surge::cli
