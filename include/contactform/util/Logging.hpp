#pragma once

#include <string>
#include <string_view>

namespace contactform::util {

enum class LogLevel {
    trace,
    debug,
    info,
    warn,
    error
};

void initLogging(LogLevel level);
LogLevel parseLogLevel(std::string_view text);
void log(LogLevel level, const std::string& message);

} // namespace contactform::util
