#include "orrery/core/Log.h"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace orrery::core {
namespace {
  std::mutex g_logMutex;
  std::atomic<LogLevel> g_level{LogLevel::Info};
  LogSink g_sink; // guarded by g_logMutex

  std::tm localTime(std::time_t t) {
    std::tm out{};
  #if defined(_WIN32)
    localtime_s(&out, &t);
  #else
    localtime_r(&t, &out);
  #endif
    return out;
  }

  std::string timestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto tm = localTime(std::chrono::system_clock::to_time_t(now));

    std::ostringstream oss;
    oss << std::put_time(&tm, "%H:%M:%S");
    return oss.str();
  }
} // namespace

void setLogLevel(LogLevel level) { g_level.store(level); }
LogLevel getLogLevel() { return g_level.load(); }

std::string_view toString(LogLevel level) {
  switch (level) {
    case LogLevel::Trace: return "TRACE";
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Off:   return "OFF";
  }
  return "UNKNOWN";
}

void setLogSink(LogSink sink) {
  std::lock_guard<std::mutex> lock(g_logMutex);
  g_sink = std::move(sink);
}

void log(LogLevel level, std::string_view message) {
  const LogLevel threshold = g_level.load();
  if (threshold == LogLevel::Off || level < threshold) {
    return;
  }

  std::lock_guard<std::mutex> lock(g_logMutex);

  if (g_sink) {
    g_sink(level, message);
    return;
  }

  std::ostream& os = (level >= LogLevel::Warn) ? std::cerr : std::cout;
  os << "[" << timestamp() << "]"
     << "[" << toString(level) << "] "
     << message
     << "\n";
}

} // namespace orrery::core
