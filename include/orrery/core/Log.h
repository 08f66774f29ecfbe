#pragma once

#include <functional>
#include <string_view>

namespace orrery::core {

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

// Redirects log lines (already filtered by level) to a custom sink.
// Passing an empty function restores console output.
using LogSink = std::function<void(LogLevel, std::string_view)>;
void setLogSink(LogSink sink);

void log(LogLevel level, std::string_view message);

} // namespace orrery::core

#define ORRERY_LOG_TRACE(msg) ::orrery::core::log(::orrery::core::LogLevel::Trace, (msg))
#define ORRERY_LOG_DEBUG(msg) ::orrery::core::log(::orrery::core::LogLevel::Debug, (msg))
#define ORRERY_LOG_INFO(msg)  ::orrery::core::log(::orrery::core::LogLevel::Info,  (msg))
#define ORRERY_LOG_WARN(msg)  ::orrery::core::log(::orrery::core::LogLevel::Warn,  (msg))
#define ORRERY_LOG_ERROR(msg) ::orrery::core::log(::orrery::core::LogLevel::Error, (msg))
