/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file log.hpp
 * @brief Leveled printf-style logging to stderr.
 *
 * Header-only, C++17. Usage:
 * @code
 *   ferry::log::SetLevel(ferry::log::Level::kInfo);
 *   FERRY_LOG_INFO("Receiver", "OK %s (%llu bytes)", name, size);
 * @endcode
 *
 * Output format:
 *   [2026-01-01 12:00:00.123] [INFO ] [Receiver] message (file.cpp:42)
 * The "(file:line)" suffix is only emitted in debug builds.
 *
 * Compile-time configuration:
 *   FERRY_LOG_MIN_LEVEL -- levels below this value compile to nothing
 *                          (0=DEBUG, 1=INFO, 2=WARN, 3=ERROR, 4=FATAL).
 */

#ifndef FERRY_LOG_HPP_
#define FERRY_LOG_HPP_

#include "ferry/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <mutex>

#include <time.h>

#ifndef FERRY_LOG_MIN_LEVEL
#define FERRY_LOG_MIN_LEVEL 0
#endif

namespace ferry {
namespace log {

enum class Level : uint8_t {
  kDebug = 0,
  kInfo,
  kWarn,
  kError,
  kFatal,
  kOff
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

/// Serializes writers so concurrent lines are never interleaved.
inline std::mutex& WriteMutex() noexcept {
  static std::mutex mtx;
  return mtx;
}

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug: return "DEBUG";
    case Level::kInfo:  return "INFO ";
    case Level::kWarn:  return "WARN ";
    case Level::kError: return "ERROR";
    case Level::kFatal: return "FATAL";
    default:            return "?????";
  }
}

inline const char* Basename(const char* path) noexcept {
  const char* base = path;
  for (const char* p = path; *p != '\0'; ++p) {
    if (*p == '/') base = p + 1;
  }
  return base;
}

inline void FormatTimestamp(char* buf, size_t size) noexcept {
  struct timespec ts;
  ::clock_gettime(CLOCK_REALTIME, &ts);
  struct tm tm_buf;
  ::localtime_r(&ts.tv_sec, &tm_buf);
  (void)std::snprintf(buf, size, "%04d-%02d-%02d %02d:%02d:%02d.%03ld",
                      tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
                      tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                      static_cast<long>(ts.tv_nsec / 1000000L));
}

inline bool TextEqualNoCase(const char* a, const char* b) noexcept {
  while (*a != '\0' && *b != '\0') {
    char la = (*a >= 'A' && *a <= 'Z') ? static_cast<char>(*a + 32) : *a;
    char lb = (*b >= 'A' && *b <= 'Z') ? static_cast<char>(*b + 32) : *b;
    if (la != lb) return false;
    ++a;
    ++b;
  }
  return *a == *b;
}

}  // namespace detail

// ============================================================================
// Runtime control
// ============================================================================

inline void SetLevel(Level level) noexcept {
  detail::LogLevelRef().store(level, std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return detail::LogLevelRef().load(std::memory_order_relaxed);
}

/**
 * @brief Parse a level name ("debug", "info", "warn", "error", "fatal", "off").
 * @return false if @p text is not a known level; @p out is left unchanged.
 */
inline bool ParseLevel(const char* text, Level& out) noexcept {
  if (text == nullptr) return false;
  static const struct {
    const char* name;
    Level level;
  } kNames[] = {{"debug", Level::kDebug}, {"info", Level::kInfo},
                {"warn", Level::kWarn},   {"warning", Level::kWarn},
                {"error", Level::kError}, {"fatal", Level::kFatal},
                {"off", Level::kOff}};
  for (const auto& n : kNames) {
    if (detail::TextEqualNoCase(text, n.name)) {
      out = n.level;
      return true;
    }
  }
  return false;
}

/** @brief Mark the logger as in use. stderr needs no setup. */
inline void Init() noexcept {
  detail::InitializedRef().store(true, std::memory_order_release);
}

/** @brief Flush pending output and mark the logger as stopped. */
inline void Shutdown() noexcept {
  std::lock_guard<std::mutex> lock(detail::WriteMutex());
  (void)std::fflush(stderr);
  detail::InitializedRef().store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::InitializedRef().load(std::memory_order_acquire);
}

// ============================================================================
// Write path
// ============================================================================

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  if (static_cast<uint8_t>(level) < static_cast<uint8_t>(GetLevel())) {
    return;
  }
  char ts_buf[32];
  detail::FormatTimestamp(ts_buf, sizeof(ts_buf));
  char msg[512];
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);

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
  if (static_cast<uint8_t>(level) >= static_cast<uint8_t>(Level::kError)) {
    (void)std::fflush(stderr);
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
}  // namespace ferry

// ============================================================================
// Macros
// ============================================================================

#define FERRY_LOG_DEBUG(cat, fmt, ...)                                       \
  do {                                                                       \
    if (FERRY_LOG_MIN_LEVEL <= 0) {                                          \
      ::ferry::log::LogWrite(::ferry::log::Level::kDebug, cat, __FILE__,     \
                             __LINE__, fmt, ##__VA_ARGS__);                  \
    }                                                                        \
  } while (0)

#define FERRY_LOG_INFO(cat, fmt, ...)                                        \
  do {                                                                       \
    if (FERRY_LOG_MIN_LEVEL <= 1) {                                          \
      ::ferry::log::LogWrite(::ferry::log::Level::kInfo, cat, __FILE__,      \
                             __LINE__, fmt, ##__VA_ARGS__);                  \
    }                                                                        \
  } while (0)

#define FERRY_LOG_WARN(cat, fmt, ...)                                        \
  do {                                                                       \
    if (FERRY_LOG_MIN_LEVEL <= 2) {                                          \
      ::ferry::log::LogWrite(::ferry::log::Level::kWarn, cat, __FILE__,      \
                             __LINE__, fmt, ##__VA_ARGS__);                  \
    }                                                                        \
  } while (0)

#define FERRY_LOG_ERROR(cat, fmt, ...)                                       \
  do {                                                                       \
    if (FERRY_LOG_MIN_LEVEL <= 3) {                                          \
      ::ferry::log::LogWrite(::ferry::log::Level::kError, cat, __FILE__,     \
                             __LINE__, fmt, ##__VA_ARGS__);                  \
    }                                                                        \
  } while (0)

#define FERRY_LOG_FATAL(cat, fmt, ...)                                       \
  do {                                                                       \
    ::ferry::log::LogWrite(::ferry::log::Level::kFatal, cat, __FILE__,       \
                           __LINE__, fmt, ##__VA_ARGS__);                    \
  } while (0)

#endif  // FERRY_LOG_HPP_
