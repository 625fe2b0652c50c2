#pragma once

#include <surge/cli/command.h>
#include <surge/config/settings.h>
#include <surge/core/types.h>
#include <surge/store/state_store.h>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>

#include <CLI/CLI.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace surge::cli {

/**
 * Main CLI application class
 */
class SurgeCLI {
public:
    SurgeCLI();
    ~SurgeCLI();

    int run(int argc, char* argv[]);

    void registerCommand(std::unique_ptr<ICommand> command);

    /**
     * Settings from the config file and environment with global flags
     * (--store, --log-level) applied on top. Configures logging on first use.
     */
    Result<config::Settings> loadSettings();

    Result<std::unique_ptr<store::SharedStateStore>> openStore(const config::Settings& settings);

    bool getJsonOutput() const { return jsonOutput_; }

    /**
     * Runs `task` on `io` until it and every other handler on `io` finish.
     * Callers cancel their own signal sets before the task returns.
     */
    Result<void> runToCompletion(boost::asio::io_context& io,
                                 boost::asio::awaitable<Result<void>> task);

private:
    void registerBuiltinCommands();

    std::unique_ptr<CLI::App> app_;
    std::vector<std::unique_ptr<ICommand>> commands_;

    std::string configPath_;
    std::string storePath_;
    std::string logLevel_;
    std::string logFile_;
    bool verbose_ = false;
    bool jsonOutput_ = false;
    bool loggingConfigured_ = false;
};

} // namespace surge::cli
