/**
 * @file log.hpp
 * @brief Lightweight synchronous logger with printf-style category macros.
 *
 * Output format (stderr):
 *   [2026-01-01 12:00:00.123] [INFO] [Server] message (file.hpp:42)
 *
 * Two filters apply: the compile-time floor CLIPSYNC_LOG_MIN_LEVEL removes
 * calls entirely, the runtime level (SetLevel) gates the remaining ones.
 * ERROR and FATAL are flushed immediately; FATAL aborts the process.
 */

#ifndef CLIPSYNC_LOG_HPP_
#define CLIPSYNC_LOG_HPP_

#include "clipsync/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>

#include <sys/time.h>
#include <time.h>

/// 0=DEBUG 1=INFO 2=WARN 3=ERROR 4=FATAL
#ifndef CLIPSYNC_LOG_MIN_LEVEL
#ifdef NDEBUG
#define CLIPSYNC_LOG_MIN_LEVEL 1
#else
#define CLIPSYNC_LOG_MIN_LEVEL 0
#endif
#endif

namespace clipsync {
namespace log {

// ============================================================================
// Level
// ============================================================================

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5
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

/// Serializes whole lines so watcher and event loop output never interleave.
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
    default:            return "?";
  }
}

inline const char* Basename(const char* path) noexcept {
  const char* base = path;
  for (const char* p = path; *p != '\0'; ++p) {
    if (*p == '/') base = p + 1;
  }
  return base;
}

inline bool StrCaseEqual(const char* a, const char* b) noexcept {
  while (*a != '\0' && *b != '\0') {
    char la = (*a >= 'A' && *a <= 'Z') ? static_cast<char>(*a + 32) : *a;
    char lb = (*b >= 'A' && *b <= 'Z') ? static_cast<char>(*b + 32) : *b;
    if (la != lb) return false;
    ++a; ++b;
  }
  return *a == *b;
}

}  // namespace detail

// ============================================================================
// Public API
// ============================================================================

inline void SetLevel(Level level) noexcept {
  detail::LogLevelRef().store(level, std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return detail::LogLevelRef().load(std::memory_order_relaxed);
}

/**
 * @brief Parse a level name ("debug", "info", "warn", "error", "fatal",
 *        "off"), case-insensitive.
 * @return true and fill @p out on a known name.
 */
inline bool ParseLevel(const char* name, Level& out) noexcept {
  if (name == nullptr) return false;
  static constexpr struct {
    const char* name;
    Level level;
  } kNames[] = {{"debug", Level::kDebug}, {"info", Level::kInfo},
                {"warn", Level::kWarn},   {"warning", Level::kWarn},
                {"error", Level::kError}, {"fatal", Level::kFatal},
                {"off", Level::kOff}};
  for (const auto& n : kNames) {
    if (detail::StrCaseEqual(name, n.name)) {
      out = n.level;
      return true;
    }
  }
  return false;
}

/** @brief Mark the logger as started (line buffering on stderr). */
inline void Init() noexcept {
  (void)std::setvbuf(stderr, nullptr, _IOLBF, 0);
  detail::InitializedRef().store(true, std::memory_order_release);
}

inline void Shutdown() noexcept {
  (void)std::fflush(stderr);
  detail::InitializedRef().store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::InitializedRef().load(std::memory_order_acquire);
}

/** @brief Format and write one log line. */
inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  if (static_cast<uint8_t>(level) <
      static_cast<uint8_t>(detail::LogLevelRef().load(
          std::memory_order_relaxed))) {
    return;
  }

  struct timeval tv;
  (void)::gettimeofday(&tv, nullptr);
  struct tm tm_buf;
  time_t sec = tv.tv_sec;
  (void)::localtime_r(&sec, &tm_buf);

  char ts[32];
  (void)std::snprintf(ts, sizeof(ts), "%04d-%02d-%02d %02d:%02d:%02d.%03d",
                      tm_buf.tm_year + 1900, tm_buf.tm_mon + 1,
                      tm_buf.tm_mday, tm_buf.tm_hour, tm_buf.tm_min,
                      tm_buf.tm_sec, static_cast<int>(tv.tv_usec / 1000));

  char msg[512];
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);

  {
    std::lock_guard<std::mutex> lock(detail::WriteMutex());
    (void)std::fprintf(stderr, "[%s] [%s] [%s] %s (%s:%d)\n", ts,
                       detail::LevelTag(level),
                       (category != nullptr) ? category : "",
                       msg, detail::Basename(file), line);
    if (static_cast<uint8_t>(level) >= static_cast<uint8_t>(Level::kError)) {
      (void)std::fflush(stderr);
    }
  }

  if (level == Level::kFatal) {
    std::abort();
  }
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
}  // namespace clipsync

// ============================================================================
// Macros
// ============================================================================

#define CLIPSYNC_LOG_DEBUG(cat, fmt, ...)                                    \
  do {                                                                       \
    if (CLIPSYNC_LOG_MIN_LEVEL <= 0) {                                       \
      ::clipsync::log::LogWrite(::clipsync::log::Level::kDebug, cat,         \
                                __FILE__, __LINE__, fmt, ##__VA_ARGS__);     \
    }                                                                        \
  } while (0)

#define CLIPSYNC_LOG_INFO(cat, fmt, ...)                                     \
  do {                                                                       \
    if (CLIPSYNC_LOG_MIN_LEVEL <= 1) {                                       \
      ::clipsync::log::LogWrite(::clipsync::log::Level::kInfo, cat,          \
                                __FILE__, __LINE__, fmt, ##__VA_ARGS__);     \
    }                                                                        \
  } while (0)

#define CLIPSYNC_LOG_WARN(cat, fmt, ...)                                     \
  do {                                                                       \
    if (CLIPSYNC_LOG_MIN_LEVEL <= 2) {                                       \
      ::clipsync::log::LogWrite(::clipsync::log::Level::kWarn, cat,          \
                                __FILE__, __LINE__, fmt, ##__VA_ARGS__);     \
    }                                                                        \
  } while (0)

#define CLIPSYNC_LOG_ERROR(cat, fmt, ...)                                    \
  do {                                                                       \
    if (CLIPSYNC_LOG_MIN_LEVEL <= 3) {                                       \
      ::clipsync::log::LogWrite(::clipsync::log::Level::kError, cat,         \
                                __FILE__, __LINE__, fmt, ##__VA_ARGS__);     \
    }                                                                        \
  } while (0)

#define CLIPSYNC_LOG_FATAL(cat, fmt, ...)                                    \
  ::clipsync::log::LogWrite(::clipsync::log::Level::kFatal, cat, __FILE__,   \
                            __LINE__, fmt, ##__VA_ARGS__)

#endif  // CLIPSYNC_LOG_HPP_
