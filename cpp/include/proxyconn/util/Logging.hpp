#pragma once

#include <string>
#include <string_view>

namespace proxyconn::util {

enum class LogLevel {
    trace,
    debug,
    info,
    warn,
    error
};

void initLogging(LogLevel level);
LogLevel currentLogLevel();
bool shouldLog(LogLevel level);
void log(LogLevel level, const std::string& message);

// Unknown names fall back to info.
LogLevel parseLogLevel(std::string_view name);
const char* toString(LogLevel level);

} // namespace proxyconn::util
