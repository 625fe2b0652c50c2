#pragma once

#include <surge/cli/command.h>

namespace surge::cli {

class SurgeCLI;

// Adds create-run, orchestrate, worker, status, stop, scale and local.
class CommandRegistry {
public:
    static void registerAllCommands(SurgeCLI* cli);
};

} // namespace surge::cli
