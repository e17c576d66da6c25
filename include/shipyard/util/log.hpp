#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace shipyard::log {

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

// Receives the level and the formatted message without decoration.
using Sink = std::function<void(Level, std::string_view)>;

// Synchronous logger writing to stderr, so diagnostics never interleave with
// the plan printed on stdout.
class Logger {
  std::atomic<Level> level_{Level::Info};
  std::mutex sink_mutex_;
  Sink sink_;

  auto write_stderr(Level level, std::string_view message) -> void {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::floor<std::chrono::milliseconds>(now);
    auto line = std::format("[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] {}\n", time,
                            level_color(level), level_name(level), "\033[0m",
                            message);
    std::fputs(line.c_str(), stderr);
  }

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

  // An empty sink restores the stderr writer.
  auto set_sink(Sink sink) -> void {
    std::lock_guard lock(sink_mutex_);
    sink_ = std::move(sink);
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args&&... args)
      -> void {
    if (level < level_.load(std::memory_order_acquire))
      return;

    auto message = std::format(fmt, std::forward<Args>(args)...);

    std::lock_guard lock(sink_mutex_);
    if (sink_) {
      sink_(level, message);
      return;
    }
    write_stderr(level, message);
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
  Level level = Level::Info;
  if (name == "trace")
    level = Level::Trace;
  else if (name == "debug")
    level = Level::Debug;
  else if (name == "warn")
    level = Level::Warn;
  else if (name == "error")
    level = Level::Error;
  logger().set_level(level);
}

inline auto set_sink(Sink sink) -> void {
  logger().set_sink(std::move(sink));
}

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

}  // namespace shipyard::log
