#include <surge/cli/command_registry.h>
#include <surge/cli/surge_cli.h>
#include <surge/common/log_setup.h>
#include <surge/store/sqlite_state_store.h>

#include <spdlog/spdlog.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_future.hpp>

#include <iostream>

namespace surge::cli {

SurgeCLI::SurgeCLI() {
    app_ = std::make_unique<CLI::App>("surge - distributed load-test coordinator");
    app_->require_subcommand(1);
    app_->set_version_flag("--version", "surge 0.1.0");

    app_->add_option("-c,--config", configPath_, "Config file (default: $SURGE_CONFIG or XDG)");
    app_->add_option("--store", storePath_, "Shared state store (SQLite file)");
    app_->add_option("--log-level", logLevel_, "trace, debug, info, warn, error");
    app_->add_option("--log-file", logFile_, "Also log to a rotating file");
    app_->add_flag("-v,--verbose", verbose_, "Enable verbose output");
    app_->add_flag("--json", jsonOutput_, "Output in JSON format");

    registerBuiltinCommands();
}

SurgeCLI::~SurgeCLI() = default;

void SurgeCLI::registerBuiltinCommands() {
    CommandRegistry::registerAllCommands(this);
}

void SurgeCLI::registerCommand(std::unique_ptr<ICommand> command) {
    command->registerCommand(*app_, this);
    commands_.push_back(std::move(command));
}

int SurgeCLI::run(int argc, char* argv[]) {
    try {
        app_->parse(argc, argv);
        return 0;
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    } catch (const std::exception& e) {
        std::cerr << "[FAIL] Unexpected error: " << e.what() << "\n";
        spdlog::error("Unexpected error: {}", e.what());
        return 1;
    }
}

Result<config::Settings> SurgeCLI::loadSettings() {
    auto loaded = config::loadSettings(configPath_);
    if (!loaded)
        return loaded.error();

    auto settings = std::move(loaded).value();
    if (!storePath_.empty())
        settings.store.path = storePath_;
    if (!logLevel_.empty())
        settings.logging.level = logLevel_;
    else if (verbose_)
        settings.logging.level = "debug";
    if (!logFile_.empty())
        settings.logging.file = logFile_;

    if (auto ok = config::validate(settings); !ok)
        return ok.error();

    if (!loggingConfigured_) {
        common::configureLogging(settings.logging, "surge");
        loggingConfigured_ = true;
    }
    return settings;
}

Result<std::unique_ptr<store::SharedStateStore>>
SurgeCLI::openStore(const config::Settings& settings) {
    auto opened = store::SqliteStateStore::open(
        {.path = settings.store.path, .busyTimeout = settings.store.busyTimeout});
    if (!opened)
        return opened.error();
    spdlog::debug("[CLI] Using state store {}", opened.value()->path());
    return std::unique_ptr<store::SharedStateStore>(std::move(opened).value());
}

Result<void> SurgeCLI::runToCompletion(boost::asio::io_context& io,
                                       boost::asio::awaitable<Result<void>> task) {
    auto future = boost::asio::co_spawn(io, std::move(task), boost::asio::use_future);
    io.run();
    try {
        return future.get();
    } catch (const std::exception& e) {
        return Error{ErrorCode::InternalError, e.what()};
    }
}

} // namespace surge::cli
