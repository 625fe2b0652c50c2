#include <surge/cli/surge_cli.h>

#include <spdlog/spdlog.h>

#include <exception>

int main(int argc, char* argv[]) {
    try {
        // Conservative default until SurgeCLI::loadSettings() applies the configured level
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        surge::cli::SurgeCLI cli;
        return cli.run(argc, argv);

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
