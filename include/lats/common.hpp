#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * @file common.hpp
 * @brief Logging macros and shared helpers
 *
 * Printf-style logging used across liblats. Every call carries a bracketed
 * scope tag, e.g. LATS_LOG_DEBUG("[search::run] Iteration %d", i).
 *
 * Minimum level is read once from the LATS_LOG_LEVEL environment variable
 * (debug|info|warn|error|off, default warn) and can be changed at runtime
 * with log::set_level(). The sink defaults to stderr and can be replaced
 * with log::set_sink() so embedders can route output into their own logger.
 */

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <mutex>
#include <string>
#include <utility>

namespace lats::log {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

using Sink = std::function<void(Level, const std::string&)>;

namespace detail {

inline Level level_from_env() {
  const char* env = std::getenv("LATS_LOG_LEVEL");
  if (!env) return Level::Warn;
  if (std::strcmp(env, "debug") == 0) return Level::Debug;
  if (std::strcmp(env, "info") == 0) return Level::Info;
  if (std::strcmp(env, "warn") == 0) return Level::Warn;
  if (std::strcmp(env, "error") == 0) return Level::Error;
  if (std::strcmp(env, "off") == 0) return Level::Off;
  return Level::Warn;
}

inline std::atomic<int>& level_ref() {
  static std::atomic<int> level{static_cast<int>(level_from_env())};
  return level;
}

inline std::mutex& sink_mutex() {
  static std::mutex mu;
  return mu;
}

inline Sink& sink_ref() {
  static Sink sink;
  return sink;
}

inline const char* level_name(Level level) {
  switch (level) {
    case Level::Debug: return "DEBUG";
    case Level::Info:  return "INFO";
    case Level::Warn:  return "WARN";
    case Level::Error: return "ERROR";
    default:           return "";
  }
}

}  // namespace detail

inline void set_level(Level level) {
  detail::level_ref().store(static_cast<int>(level));
}

inline Level get_level() {
  return static_cast<Level>(detail::level_ref().load());
}

inline bool enabled(Level level) {
  return level != Level::Off &&
         static_cast<int>(level) >= detail::level_ref().load();
}

/**
 * Replace the output sink
 *
 * Pass an empty Sink to restore the default stderr output.
 */
inline void set_sink(Sink sink) {
  std::lock_guard<std::mutex> lock(detail::sink_mutex());
  detail::sink_ref() = std::move(sink);
}

#if defined(__GNUC__) || defined(__clang__)
__attribute__((format(printf, 2, 3)))
#endif
inline void write(Level level, const char* fmt, ...) {
  if (!enabled(level)) return;

  char buf[1024];
  va_list args;
  va_start(args, fmt);
  std::vsnprintf(buf, sizeof(buf), fmt, args);
  va_end(args);

  // Sink runs unlocked so it may log or replace itself
  Sink sink;
  {
    std::lock_guard<std::mutex> lock(detail::sink_mutex());
    sink = detail::sink_ref();
  }
  if (sink) {
    sink(level, buf);
    return;
  }
  std::fprintf(stderr, "[lats] %s %s\n", detail::level_name(level), buf);
}

}  // namespace lats::log

#define LATS_LOG_DEBUG(...) ::lats::log::write(::lats::log::Level::Debug, __VA_ARGS__)
#define LATS_LOG_INFO(...)  ::lats::log::write(::lats::log::Level::Info, __VA_ARGS__)
#define LATS_LOG_WARN(...)  ::lats::log::write(::lats::log::Level::Warn, __VA_ARGS__)
#define LATS_LOG_ERROR(...) ::lats::log::write(::lats::log::Level::Error, __VA_ARGS__)

namespace lats {

/**
 * Truncate text to at most max_chars bytes, appending "..." when cut
 */
inline std::string truncate(const std::string& text, size_t max_chars) {
  if (text.size() <= max_chars) return text;
  return text.substr(0, max_chars) + "...";
}

}  // namespace lats
