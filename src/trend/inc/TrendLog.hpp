#ifndef BENCHTREND_TRENDLOG_HPP
#define BENCHTREND_TRENDLOG_HPP
/**
 * @file TrendLog.hpp
 * @brief Leveled stderr logging shared by the collator, updater, and worker.
 *
 * Lines look like "[WARN] timeline: worker fault: ...". The minimum level is
 * process-wide and normally set once from TrendConfig::minLevel.
 */

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <string_view>

namespace benchtrend {
namespace trend {

/* ------------------------------- LogLevel ------------------------------- */

enum class LogLevel : int { Debug = 0, Info = 1, Warning = 2, Error = 3 };

inline std::atomic<int> gMinLogLevel{static_cast<int>(LogLevel::Info)};

/**
 * @brief Map "DEBUG" | "INFO" | "WARNING" | "WARN" | "ERROR" to a level.
 * Unknown names map to Info.
 * @note RT-safe (pure computation).
 */
inline LogLevel parseLogLevel(std::string_view name) noexcept {
  if (name == "DEBUG") {
    return LogLevel::Debug;
  }
  if (name == "WARNING" || name == "WARN") {
    return LogLevel::Warning;
  }
  if (name == "ERROR" || name == "FATAL") {
    return LogLevel::Error;
  }
  return LogLevel::Info;
}

/** @note RT-safe (atomic store). */
inline void setMinLogLevel(LogLevel level) noexcept {
  gMinLogLevel.store(static_cast<int>(level), std::memory_order_relaxed);
}

/** @note RT-safe (atomic load). */
inline bool logEnabled(LogLevel level) noexcept {
  return static_cast<int>(level) >= gMinLogLevel.load(std::memory_order_relaxed);
}

inline const char* logTag(LogLevel level) noexcept {
  switch (level) {
  case LogLevel::Debug:
    return "[DEBUG]";
  case LogLevel::Info:
    return "[INFO]";
  case LogLevel::Warning:
    return "[WARN]";
  case LogLevel::Error:
    return "[ERROR]";
  }
  return "[INFO]";
}

/**
 * @brief printf-style log line to stderr, prefixed with level tag and component.
 * @note NOT RT-safe (console I/O).
 */
#if defined(__GNUC__) || defined(__clang__)
__attribute__((format(printf, 3, 4)))
#endif
inline void logf(LogLevel level, const char* component, const char* fmt, ...) {
  if (!logEnabled(level)) {
    return;
  }
  char line[1024];
  va_list args;
  va_start(args, fmt);
  std::vsnprintf(line, sizeof(line), fmt, args);
  va_end(args);
  // single fprintf keeps concurrent lines from interleaving
  std::fprintf(stderr, "%s %s: %s\n", logTag(level), component, line);
}

} // namespace trend
} // namespace benchtrend

#endif // BENCHTREND_TRENDLOG_HPP
