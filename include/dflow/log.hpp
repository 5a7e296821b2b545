/**
 * @file log.hpp
 * @brief Synchronous leveled logging with printf-style macros.
 *
 * Output format:
 *   [2026-01-01 12:00:00.123] [INFO] [Stage] message (file.hpp:42)
 *
 * Each line is formatted into a stack buffer and written with a single
 * fprintf so lines from concurrent stage threads never interleave.
 *
 * Compile-time configuration:
 *   DFLOW_LOG_MIN_LEVEL -- 0=DEBUG .. 4=FATAL, 5=OFF (default 0, or 1 with
 *                          NDEBUG). Calls below it compile to nothing.
 *
 * Compatible with -fno-exceptions -fno-rtti, C++17.
 */

#ifndef DFLOW_LOG_HPP_
#define DFLOW_LOG_HPP_

#include "dflow/platform.hpp"

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>

#ifndef DFLOW_LOG_MIN_LEVEL
#ifdef NDEBUG
#define DFLOW_LOG_MIN_LEVEL 1
#else
#define DFLOW_LOG_MIN_LEVEL 0
#endif
#endif

namespace dflow {
namespace log {

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5,
};

namespace detail {

inline std::atomic<Level>& LogLevelRef() noexcept {
#ifdef NDEBUG
  static std::atomic<Level> level{Level::kInfo};
#else
  static std::atomic<Level> level{Level::kDebug};
#endif
  return level;
}

inline std::atomic<bool>& InitializedRef() noexcept {
  static std::atomic<bool> initialized{false};
  return initialized;
}

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug:
      return "DEBUG";
    case Level::kInfo:
      return "INFO";
    case Level::kWarn:
      return "WARN";
    case Level::kError:
      return "ERROR";
    case Level::kFatal:
      return "FATAL";
    default:
      return "?";
  }
}

/// Strip directory components from __FILE__.
inline const char* Basename(const char* path) noexcept {
  if (path == nullptr) {
    return "";
  }
  const char* slash = std::strrchr(path, '/');
  return (slash != nullptr) ? slash + 1 : path;
}

inline void FormatTimestamp(char* buf, size_t size) noexcept {
  auto now = std::chrono::system_clock::now();
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch())
                .count() %
            1000;
  std::time_t secs = std::chrono::system_clock::to_time_t(now);
  std::tm tm_buf{};
  (void)localtime_r(&secs, &tm_buf);
  size_t n = std::strftime(buf, size, "%Y-%m-%d %H:%M:%S", &tm_buf);
  if (n > 0U && n < size) {
    (void)std::snprintf(buf + n, size - n, ".%03d", static_cast<int>(ms));
  }
}

}  // namespace detail

// ============================================================================
// Runtime Control
// ============================================================================

inline Level GetLevel() noexcept {
  return detail::LogLevelRef().load(std::memory_order_relaxed);
}

inline void SetLevel(Level level) noexcept {
  detail::LogLevelRef().store(level, std::memory_order_relaxed);
}

/// Mark the logger ready; optional, logging works without it.
inline void Init() noexcept {
  detail::InitializedRef().store(true, std::memory_order_release);
}

inline void Shutdown() noexcept {
  (void)std::fflush(stderr);
  detail::InitializedRef().store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::InitializedRef().load(std::memory_order_acquire);
}

// ============================================================================
// Write
// ============================================================================

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  if (static_cast<uint8_t>(level) <
      static_cast<uint8_t>(detail::LogLevelRef().load(
          std::memory_order_relaxed))) {
    return;
  }

  char ts_buf[32];
  detail::FormatTimestamp(ts_buf, sizeof(ts_buf));

  char msg_buf[512];
  (void)std::vsnprintf(msg_buf, sizeof(msg_buf), fmt, args);

  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s (%s:%d)\n", ts_buf,
                     detail::LevelTag(level),
                     (category != nullptr) ? category : "-", msg_buf,
                     detail::Basename(file), line);

  if (level >= Level::kError) {
    (void)std::fflush(stderr);
  }
  if (level == Level::kFatal) {
    std::abort();
  }
}

inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace dflow

// ============================================================================
// Macros
// ============================================================================

#define DFLOW_LOG_DEBUG(cat, fmt, ...)                                      \
  do {                                                                      \
    if (DFLOW_LOG_MIN_LEVEL <= 0) {                                         \
      ::dflow::log::LogWrite(::dflow::log::Level::kDebug, cat, __FILE__,    \
                             __LINE__, fmt, ##__VA_ARGS__);                 \
    }                                                                       \
  } while (0)

#define DFLOW_LOG_INFO(cat, fmt, ...)                                       \
  do {                                                                      \
    if (DFLOW_LOG_MIN_LEVEL <= 1) {                                         \
      ::dflow::log::LogWrite(::dflow::log::Level::kInfo, cat, __FILE__,     \
                             __LINE__, fmt, ##__VA_ARGS__);                 \
    }                                                                       \
  } while (0)

#define DFLOW_LOG_WARN(cat, fmt, ...)                                       \
  do {                                                                      \
    if (DFLOW_LOG_MIN_LEVEL <= 2) {                                         \
      ::dflow::log::LogWrite(::dflow::log::Level::kWarn, cat, __FILE__,     \
                             __LINE__, fmt, ##__VA_ARGS__);                 \
    }                                                                       \
  } while (0)

#define DFLOW_LOG_ERROR(cat, fmt, ...)                                      \
  do {                                                                      \
    if (DFLOW_LOG_MIN_LEVEL <= 3) {                                         \
      ::dflow::log::LogWrite(::dflow::log::Level::kError, cat, __FILE__,    \
                             __LINE__, fmt, ##__VA_ARGS__);                 \
    }                                                                       \
  } while (0)

#define DFLOW_LOG_FATAL(cat, fmt, ...)                                      \
  do {                                                                      \
    if (DFLOW_LOG_MIN_LEVEL <= 4) {                                         \
      ::dflow::log::LogWrite(::dflow::log::Level::kFatal, cat, __FILE__,    \
                             __LINE__, fmt, ##__VA_ARGS__);                 \
    }                                                                       \
  } while (0)

#endif  // DFLOW_LOG_HPP_
