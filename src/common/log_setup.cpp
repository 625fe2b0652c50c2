#include <surge/common/log_setup.h>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>
#include <vector>

namespace surge::common {

namespace {

spdlog::level::level_enum parseLevel(const std::string& level) {
    if (level == "trace")
        return spdlog::level::trace;
    if (level == "debug")
        return spdlog::level::debug;
    if (level == "warn")
        return spdlog::level::warn;
    if (level == "error")
        return spdlog::level::err;
    return spdlog::level::info;
}

} // namespace

void configureLogging(const config::LoggingSettings& logging, const std::string& loggerName) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!logging.file.empty()) {
        try {
            std::filesystem::path logPath(logging.file);
            if (logPath.has_parent_path()) {
                std::filesystem::create_directories(logPath.parent_path());
            }
            const size_t max_size = 10 * 1024 * 1024; // 10MB per file
            const size_t max_files = 5;
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logPath.string(), max_size, max_files));
        } catch (const std::exception& e) {
            spdlog::warn("Cannot open log file {}: {}", logging.file, e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>(loggerName, sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S] [%l] %v");
    spdlog::set_level(parseLevel(logging.level));
    spdlog::flush_on(spdlog::level::warn);
}

} // namespace surge::common
