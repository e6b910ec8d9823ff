#include "dtmcp/logging.hpp"

#include <filesystem>
#include <memory>

#include <log4cplus/configurator.h>
#include <log4cplus/consoleappender.h>
#include <log4cplus/helpers/loglog.h>
#include <log4cplus/layout.h>
#include <log4cplus/loglevel.h>

namespace dtmcp {

log4cplus::Logger& server_logger() {
    static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("datetime_mcp"));
    return logger;
}

log4cplus::Logger& transport_logger() {
    static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("datetime_mcp.transport"));
    return logger;
}

log4cplus::Logger& tools_logger() {
    static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("datetime_mcp.tools"));
    return logger;
}

void init_logging(const std::optional<std::string>& config_path, const std::string& level) {
    if (config_path) {
        std::error_code ec;
        if (std::filesystem::exists(*config_path, ec)) {
            log4cplus::PropertyConfigurator::doConfigure(LOG4CPLUS_STRING_TO_TSTRING(*config_path));
            return;
        }
        log4cplus::helpers::LogLog::getLogLog()->warn(
            LOG4CPLUS_TEXT("Logging config not found: ") + LOG4CPLUS_STRING_TO_TSTRING(*config_path));
    }

    // logToStdErr = true, immediateFlush = true
    log4cplus::SharedAppenderPtr appender(new log4cplus::ConsoleAppender(true, true));
    appender->setName(LOG4CPLUS_TEXT("stderr"));
    appender->setLayout(std::make_unique<log4cplus::PatternLayout>(
        LOG4CPLUS_TEXT("%D{%Y-%m-%d %H:%M:%S.%q} %-5p [%c] %m%n")));

    log4cplus::Logger root = log4cplus::Logger::getRoot();
    root.removeAllAppenders();
    root.addAppender(appender);

    log4cplus::LogLevel ll = log4cplus::getLogLevelManager().fromString(LOG4CPLUS_STRING_TO_TSTRING(level));
    if (ll == log4cplus::NOT_SET_LOG_LEVEL) {
        ll = log4cplus::OFF_LOG_LEVEL;
    }
    root.setLogLevel(ll);
}

} // namespace dtmcp
