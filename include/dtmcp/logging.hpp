#pragma once
#include <optional>
#include <string>
#include <log4cplus/logger.h>

namespace dtmcp {

/// Process-wide loggers. Output goes to stderr only; stdout is reserved
/// for protocol responses.
log4cplus::Logger& server_logger();
log4cplus::Logger& transport_logger();
log4cplus::Logger& tools_logger();

/// Apply a log4cplus properties file when one is given and exists, otherwise
/// install a stderr console appender at `level` (TRACE..FATAL or OFF).
void init_logging(const std::optional<std::string>& config_path,
                  const std::string& level = "OFF");

} // namespace dtmcp
