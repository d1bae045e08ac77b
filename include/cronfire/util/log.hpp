#pragma once

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

namespace cronfire::log {

enum class Level : std::uint8_t {
  Trace,
  Debug,
  Info,
  Warn,
  Error
};

[[nodiscard]] constexpr auto level_name(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view names[] = {"trace", "debug", "info", "warn",
                                        "error"};
  return names[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto level_color(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view colors[] = {
      "\033[90m",  // trace: gray
      "\033[36m",  // debug: cyan
      "\033[32m",  // info: green
      "\033[33m",  // warn: yellow
      "\033[31m"   // error: red
  };
  return colors[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto parse_level(std::string_view name) noexcept
    -> Level {
  if (name == "trace")
    return Level::Trace;
  if (name == "debug")
    return Level::Debug;
  if (name == "warn")
    return Level::Warn;
  if (name == "error")
    return Level::Error;
  return Level::Info;
}

// Synchronous logger; one line per call, written to stderr so that
// occurrence listings on stdout stay machine-readable.
class Logger {
  std::atomic<Level> level_{Level::Warn};
  std::mutex mutex_;
  std::FILE* sink_{stderr};

public:
  Logger() = default;

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto enabled(Level level) const noexcept -> bool {
    return level >= level_.load(std::memory_order_acquire);
  }

  auto set_sink(std::FILE* sink) -> void {
    std::lock_guard lock(mutex_);
    sink_ = sink;
  }

  template <typename... Args>
  auto log(Level level, fmt::format_string<Args...> format, Args&&... args)
      -> void {
    if (!enabled(level))
      return;

    auto now = std::chrono::floor<std::chrono::seconds>(
        std::chrono::system_clock::now());
    auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;

    auto line = fmt::format("[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] [{}] {}\n", now,
                            level_color(level), level_name(level), "\033[0m",
                            tid, fmt::format(format, std::forward<Args>(args)...));

    std::lock_guard lock(mutex_);
    std::fputs(line.c_str(), sink_);
    std::fflush(sink_);
  }
};

// Global logger instance
inline Logger& logger() {
  static Logger instance;
  return instance;
}

// Public API
inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name));
}

template <typename... Args>
auto trace(fmt::format_string<Args...> format, Args&&... args) -> void {
  logger().log(Level::Trace, format, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(fmt::format_string<Args...> format, Args&&... args) -> void {
  logger().log(Level::Debug, format, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(fmt::format_string<Args...> format, Args&&... args) -> void {
  logger().log(Level::Info, format, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(fmt::format_string<Args...> format, Args&&... args) -> void {
  logger().log(Level::Warn, format, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(fmt::format_string<Args...> format, Args&&... args) -> void {
  logger().log(Level::Error, format, std::forward<Args>(args)...);
}

}  // namespace cronfire::log
