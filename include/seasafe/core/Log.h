#pragma once

#include <string>
#include <string_view>

namespace seasafe::core {

enum class LogLevel {
  Trace = 0,
  Debug = 1,
  Info  = 2,
  Warn  = 3,
  Error = 4,
  Off   = 5
};

void setLogLevel(LogLevel level);
LogLevel getLogLevel();

std::string_view toString(LogLevel level);

// Parse "trace", "debug", "info", "warn", "error" or "off" (case-insensitive).
// Returns false and leaves `out` untouched on unknown input.
bool parseLogLevel(std::string_view text, LogLevel& out);

// Writes "[HH:MM:SS.mmm][LEVEL] message" to stderr.
void log(LogLevel level, std::string_view message);

} // namespace seasafe::core

#define SEASAFE_LOG_TRACE(msg) ::seasafe::core::log(::seasafe::core::LogLevel::Trace, (msg))
#define SEASAFE_LOG_DEBUG(msg) ::seasafe::core::log(::seasafe::core::LogLevel::Debug, (msg))
#define SEASAFE_LOG_INFO(msg)  ::seasafe::core::log(::seasafe::core::LogLevel::Info,  (msg))
#define SEASAFE_LOG_WARN(msg)  ::seasafe::core::log(::seasafe::core::LogLevel::Warn,  (msg))
#define SEASAFE_LOG_ERROR(msg) ::seasafe::core::log(::seasafe::core::LogLevel::Error, (msg))
