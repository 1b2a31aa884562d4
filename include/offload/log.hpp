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
 * @brief Lightweight printf-style logging with category tags.
 *
 * Output format:
 *   [2024-01-01 12:00:00.123] [ERROR] [WorkerPool] message (worker_pool.hpp:210)
 *
 * Two filters apply:
 *   - OFFLOAD_LOG_MIN_LEVEL compiles out levels below the floor
 *     (0=DEBUG, 1=INFO, 2=WARN, 3=ERROR, 4=FATAL, 5=OFF).
 *   - SetLevel() filters at runtime.
 *
 * Lines go to stderr unless a sink is installed with SetSink(). Writes are
 * serialized by a mutex so lines from worker threads never interleave.
 */

#ifndef OFFLOAD_LOG_HPP_
#define OFFLOAD_LOG_HPP_

#include "offload/platform.hpp"

#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <ctime>

#include <atomic>
#include <chrono>
#include <mutex>

#ifndef OFFLOAD_LOG_MIN_LEVEL
#ifdef NDEBUG
#define OFFLOAD_LOG_MIN_LEVEL 1
#else
#define OFFLOAD_LOG_MIN_LEVEL 0
#endif
#endif

#ifndef OFFLOAD_LOG_LINE_SIZE
#define OFFLOAD_LOG_LINE_SIZE 512U
#endif

namespace offload {
namespace log {

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5,
};

/// Receives one fully formatted line (no trailing newline).
using SinkFn = void (*)(Level level, const char* line, void* ctx);

namespace detail {

struct LogState {
  std::atomic<Level> level{
#ifdef NDEBUG
      Level::kInfo
#else
      Level::kDebug
#endif
  };
  std::atomic<bool> initialized{false};
  std::mutex write_mtx;
  SinkFn sink{nullptr};
  void* sink_ctx{nullptr};
};

inline LogState& State() noexcept {
  static LogState state;
  return state;
}

/// Set while the calling thread is inside the installed sink.
inline bool& InSink() noexcept {
  static thread_local bool in_sink = false;
  return in_sink;
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
      return "OFF";
  }
}

inline const char* Basename(const char* path) noexcept {
  const char* base = path;
  for (const char* p = path; *p != '\0'; ++p) {
    if (*p == '/' || *p == '\\') {
      base = p + 1;
    }
  }
  return base;
}

inline void FormatWallclock(char* buf, size_t size) noexcept {
  const auto now = std::chrono::system_clock::now();
  const std::time_t secs = std::chrono::system_clock::to_time_t(now);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch())
                      .count() %
                  1000;
  std::tm tm_buf{};
#if defined(OFFLOAD_PLATFORM_WINDOWS)
  (void)localtime_s(&tm_buf, &secs);
#else
  (void)localtime_r(&secs, &tm_buf);
#endif
  char date[24];
  (void)std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &tm_buf);
  (void)std::snprintf(buf, size, "%s.%03d", date, static_cast<int>(ms));
}

}  // namespace detail

// ============================================================================
// Runtime control
// ============================================================================

inline void SetLevel(Level level) noexcept {
  detail::State().level.store(level, std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return detail::State().level.load(std::memory_order_relaxed);
}

inline void Init() noexcept {
  detail::State().initialized.store(true, std::memory_order_release);
}

inline void Shutdown() noexcept {
  auto& st = detail::State();
  {
    std::lock_guard<std::mutex> lk(st.write_mtx);
    (void)std::fflush(stderr);
  }
  st.initialized.store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::State().initialized.load(std::memory_order_acquire);
}

/**
 * @brief Redirect formatted lines to @p sink (nullptr restores stderr).
 *
 * The sink runs under the write lock, one line at a time. Lines logged from
 * inside the sink bypass it and go straight to stderr. A sink must not call
 * SetSink().
 */
inline void SetSink(SinkFn sink, void* ctx = nullptr) noexcept {
  auto& st = detail::State();
  std::lock_guard<std::mutex> lk(st.write_mtx);
  st.sink = sink;
  st.sink_ctx = ctx;
}

// ============================================================================
// Write path
// ============================================================================

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  if (static_cast<uint8_t>(level) < static_cast<uint8_t>(GetLevel())) {
    return;
  }

  char msg[OFFLOAD_LOG_LINE_SIZE];
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);

  char stamp[32];
  detail::FormatWallclock(stamp, sizeof(stamp));

  char out[OFFLOAD_LOG_LINE_SIZE + 128U];
  (void)std::snprintf(out, sizeof(out), "[%s] [%s] [%s] %s (%s:%d)", stamp,
                      detail::LevelTag(level),
                      (category != nullptr) ? category : "-", msg,
                      detail::Basename(file), line);

  if (detail::InSink()) {
    (void)std::fprintf(stderr, "%s\n", out);
    return;
  }

  auto& st = detail::State();
  std::lock_guard<std::mutex> lk(st.write_mtx);
  if (st.sink != nullptr) {
    detail::InSink() = true;
    st.sink(level, out, st.sink_ctx);
    detail::InSink() = false;
  } else {
    (void)std::fprintf(stderr, "%s\n", out);
    if (level >= Level::kError) {
      (void)std::fflush(stderr);
    }
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
}  // namespace offload

// ============================================================================
// Macros
// ============================================================================

#define OFFLOAD_LOG_DEBUG(cat, fmt, ...)                                      \
  do {                                                                        \
    if (OFFLOAD_LOG_MIN_LEVEL <= 0) {                                         \
      ::offload::log::LogWrite(::offload::log::Level::kDebug, cat, __FILE__,  \
                               __LINE__, fmt, ##__VA_ARGS__);                 \
    }                                                                         \
  } while (0)

#define OFFLOAD_LOG_INFO(cat, fmt, ...)                                       \
  do {                                                                        \
    if (OFFLOAD_LOG_MIN_LEVEL <= 1) {                                         \
      ::offload::log::LogWrite(::offload::log::Level::kInfo, cat, __FILE__,   \
                               __LINE__, fmt, ##__VA_ARGS__);                 \
    }                                                                         \
  } while (0)

#define OFFLOAD_LOG_WARN(cat, fmt, ...)                                       \
  do {                                                                        \
    if (OFFLOAD_LOG_MIN_LEVEL <= 2) {                                         \
      ::offload::log::LogWrite(::offload::log::Level::kWarn, cat, __FILE__,   \
                               __LINE__, fmt, ##__VA_ARGS__);                 \
    }                                                                         \
  } while (0)

#define OFFLOAD_LOG_ERROR(cat, fmt, ...)                                      \
  do {                                                                        \
    if (OFFLOAD_LOG_MIN_LEVEL <= 3) {                                         \
      ::offload::log::LogWrite(::offload::log::Level::kError, cat, __FILE__,  \
                               __LINE__, fmt, ##__VA_ARGS__);                 \
    }                                                                         \
  } while (0)

#define OFFLOAD_LOG_FATAL(cat, fmt, ...)                                      \
  do {                                                                        \
    ::offload::log::LogWrite(::offload::log::Level::kFatal, cat, __FILE__,    \
                             __LINE__, fmt, ##__VA_ARGS__);                   \
    std::abort();                                                             \
  } while (0)

#endif  // OFFLOAD_LOG_HPP_
