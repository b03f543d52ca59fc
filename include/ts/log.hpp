/**
 * @file log.hpp
 * @brief Synchronous printf-style logging to stderr with runtime and
 *        compile-time level filtering.
 *
 * Output format (debug builds):
 *   [2026-01-01 12:00:00.123] [INFO] [Supervisor] message (file.hpp:42)
 * Release builds omit the source location.
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef TS_LOG_HPP_
#define TS_LOG_HPP_

#include "ts/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <mutex>

#include <sys/time.h>

/// Compile-time floor: 0=debug 1=info 2=warn 3=error 4=fatal 5=off.
#ifndef TS_LOG_MIN_LEVEL
#ifdef NDEBUG
#define TS_LOG_MIN_LEVEL 1
#else
#define TS_LOG_MIN_LEVEL 0
#endif
#endif

namespace ts {
namespace log {

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5
};

namespace detail {

inline std::atomic<uint8_t>& LogLevelRef() noexcept {
#ifdef NDEBUG
  static std::atomic<uint8_t> level{static_cast<uint8_t>(Level::kInfo)};
#else
  static std::atomic<uint8_t> level{static_cast<uint8_t>(Level::kDebug)};
#endif
  return level;
}

inline std::atomic<bool>& InitFlagRef() noexcept {
  static std::atomic<bool> flag{false};
  return flag;
}

/// Serializes whole lines so concurrent probes do not interleave output.
inline std::mutex& WriteMutex() noexcept {
  static std::mutex mtx;
  return mtx;
}

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug: return "DEBUG";
    case Level::kInfo:  return "INFO";
    case Level::kWarn:  return "WARN";
    case Level::kError: return "ERROR";
    case Level::kFatal: return "FATAL";
    case Level::kOff:   return "OFF";
  }
  return "?";
}

inline const char* Basename(const char* path) noexcept {
  const char* base = path;
  for (const char* p = path; *p != '\0'; ++p) {
    if (*p == '/') {
      base = p + 1;
    }
  }
  return base;
}

inline void FormatTimestamp(char* buf, size_t size) noexcept {
  struct timeval tv;
  ::gettimeofday(&tv, nullptr);
  struct tm tm_buf;
  ::localtime_r(&tv.tv_sec, &tm_buf);
  size_t n = std::strftime(buf, size, "%Y-%m-%d %H:%M:%S", &tm_buf);
  if (n > 0 && n < size) {
    (void)std::snprintf(buf + n, size - n, ".%03ld",
                        static_cast<long>(tv.tv_usec / 1000));
  }
}

}  // namespace detail

// ============================================================================
// Runtime Control
// ============================================================================

inline void SetLevel(Level level) noexcept {
  detail::LogLevelRef().store(static_cast<uint8_t>(level),
                              std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return static_cast<Level>(
      detail::LogLevelRef().load(std::memory_order_relaxed));
}

/// @brief Parse "debug", "info", "warn", "error", "off" (case-sensitive).
inline bool ParseLevel(const char* text, Level& out) noexcept {
  if (text == nullptr) return false;
  struct Named { const char* name; Level level; };
  static constexpr Named kNames[] = {
      {"debug", Level::kDebug}, {"info", Level::kInfo},
      {"warn", Level::kWarn},   {"error", Level::kError},
      {"off", Level::kOff}};
  for (const auto& n : kNames) {
    const char* a = n.name;
    const char* b = text;
    while (*a != '\0' && *a == *b) { ++a; ++b; }
    if (*a == '\0' && *b == '\0') {
      out = n.level;
      return true;
    }
  }
  return false;
}

inline void Init() noexcept {
  detail::InitFlagRef().store(true, std::memory_order_release);
}

inline void Shutdown() noexcept {
  (void)std::fflush(stderr);
  detail::InitFlagRef().store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::InitFlagRef().load(std::memory_order_acquire);
}

// ============================================================================
// Write Path
// ============================================================================

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  if (static_cast<uint8_t>(level) <
      detail::LogLevelRef().load(std::memory_order_relaxed)) {
    return;
  }

  char msg[1024];
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);
  char ts_buf[40];
  detail::FormatTimestamp(ts_buf, sizeof(ts_buf));

  std::lock_guard<std::mutex> lock(detail::WriteMutex());
#ifdef NDEBUG
  (void)file;
  (void)line;
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s\n", ts_buf,
                     detail::LevelTag(level), category, msg);
#else
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s (%s:%d)\n", ts_buf,
                     detail::LevelTag(level), category, msg,
                     detail::Basename(file), line);
#endif
}

inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept
    __attribute__((format(printf, 5, 6)));

inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace ts

// ============================================================================
// Macros
// ============================================================================

#define TS_LOG_DEBUG(cat, fmt, ...)                                       \
  do {                                                                    \
    if (TS_LOG_MIN_LEVEL <= 0) {                                          \
      ::ts::log::LogWrite(::ts::log::Level::kDebug, cat, __FILE__,        \
                          __LINE__, fmt, ##__VA_ARGS__);                  \
    }                                                                     \
  } while (0)

#define TS_LOG_INFO(cat, fmt, ...)                                        \
  do {                                                                    \
    if (TS_LOG_MIN_LEVEL <= 1) {                                          \
      ::ts::log::LogWrite(::ts::log::Level::kInfo, cat, __FILE__,         \
                          __LINE__, fmt, ##__VA_ARGS__);                  \
    }                                                                     \
  } while (0)

#define TS_LOG_WARN(cat, fmt, ...)                                        \
  do {                                                                    \
    if (TS_LOG_MIN_LEVEL <= 2) {                                          \
      ::ts::log::LogWrite(::ts::log::Level::kWarn, cat, __FILE__,         \
                          __LINE__, fmt, ##__VA_ARGS__);                  \
    }                                                                     \
  } while (0)

#define TS_LOG_ERROR(cat, fmt, ...)                                       \
  do {                                                                    \
    if (TS_LOG_MIN_LEVEL <= 3) {                                          \
      ::ts::log::LogWrite(::ts::log::Level::kError, cat, __FILE__,        \
                          __LINE__, fmt, ##__VA_ARGS__);                  \
    }                                                                     \
  } while (0)

#define TS_LOG_FATAL(cat, fmt, ...)                                       \
  do {                                                                    \
    ::ts::log::LogWrite(::ts::log::Level::kFatal, cat, __FILE__,          \
                        __LINE__, fmt, ##__VA_ARGS__);                    \
    std::abort();                                                         \
  } while (0)

#endif  // TS_LOG_HPP_
