/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Logging utilities for pollcast (loghelper-compatible interface).
 * Provides POLLCAST_LOG_DEBUG, POLLCAST_LOG_INFO, POLLCAST_LOG_WARN,
 * POLLCAST_LOG_ERROR macros.
 */

#ifndef POLLCAST_LOG_HPP_
#define POLLCAST_LOG_HPP_

#include "vocabulary.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>

namespace pollcast {

class Logger {
 public:
  enum class Level : uint8_t { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3, kOff = 4 };

  static void set_level(Level level) { threshold().store(level, std::memory_order_relaxed); }
  static Level level() { return threshold().load(std::memory_order_relaxed); }

  static bool enabled(Level level) {
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(threshold().load(std::memory_order_relaxed));
  }

  // Lines from the reactor and the bridge thread must not interleave
  static void log(Level level, const std::string& msg) {
    if (!enabled(level) || level == Level::kOff) return;
    static const char* prefix[] = {"[DEBUG]", "[INFO]", "[WARN]", "[ERROR]"};

    auto now = std::chrono::system_clock::now();
    std::time_t secs = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm_buf{};
    localtime_r(&secs, &tm_buf);
    char stamp[32];
    std::snprintf(stamp, sizeof(stamp), "%02d:%02d:%02d.%03d", tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms));

    std::lock_guard<std::mutex> lock(mutex());
    std::cerr << stamp << " " << prefix[static_cast<int>(level)] << " " << msg << std::endl;
  }

  static expected<Level, ErrorCode> parse_level(std::string_view name) {
    if (name == "debug") return expected<Level, ErrorCode>::success(Level::kDebug);
    if (name == "info") return expected<Level, ErrorCode>::success(Level::kInfo);
    if (name == "warn") return expected<Level, ErrorCode>::success(Level::kWarn);
    if (name == "error") return expected<Level, ErrorCode>::success(Level::kError);
    if (name == "off") return expected<Level, ErrorCode>::success(Level::kOff);
    return expected<Level, ErrorCode>::error(ErrorCode::kInvalidArgument);
  }

 private:
  static std::atomic<Level>& threshold() {
    static std::atomic<Level> level{Level::kInfo};
    return level;
  }

  static std::mutex& mutex() {
    static std::mutex m;
    return m;
  }
};

#define POLLCAST_LOG_AT(lvl, msg)                        \
  do {                                                   \
    if (::pollcast::Logger::enabled(lvl)) {              \
      ::pollcast::Logger::log(lvl, msg);                 \
    }                                                    \
  } while (0)

#define POLLCAST_LOG_DEBUG(msg) POLLCAST_LOG_AT(::pollcast::Logger::Level::kDebug, msg)
#define POLLCAST_LOG_INFO(msg) POLLCAST_LOG_AT(::pollcast::Logger::Level::kInfo, msg)
#define POLLCAST_LOG_WARN(msg) POLLCAST_LOG_AT(::pollcast::Logger::Level::kWarn, msg)
#define POLLCAST_LOG_ERROR(msg) POLLCAST_LOG_AT(::pollcast::Logger::Level::kError, msg)

}  // namespace pollcast

#endif  // POLLCAST_LOG_HPP_
