#pragma once

#include <surge/config/settings.h>

#include <string>

namespace surge::common {

/// Installs the process-wide spdlog default logger: a colored console sink,
/// plus a rotating file sink (10MB x 5 files) when `logging.file` is set.
/// Unknown levels fall back to info.
void configureLogging(const config::LoggingSettings& logging, const std::string& loggerName);

} // namespace surge::common
