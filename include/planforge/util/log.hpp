#pragma once

#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <functional>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

namespace planforge::log {

enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error };

inline constexpr std::array<std::string_view, 5> level_names = {
    "trace", "debug", "info", "warn", "error"};

inline constexpr std::array<std::string_view, 5> level_colors = {
    "\o{33}[90m", // trace: gray
    "\o{33}[36m", // debug: cyan
    "\o{33}[32m", // info: green
    "\o{33}[33m", // warn: yellow
    "\o{33}[31m"  // error: red
};

[[nodiscard]] inline auto level_name(Level level) -> std::string_view {
  return level_names.at(std::to_underlying(level));
}

[[nodiscard]] inline auto level_color(Level level) -> std::string_view {
  return level_colors.at(std::to_underlying(level));
}

[[nodiscard]] inline auto parse_level(std::string_view name) noexcept
    -> std::optional<Level> {
  const auto *it = std::ranges::find(level_names, name);
  if (it == level_names.end()) {
    return std::nullopt;
  }
  return static_cast<Level>(std::distance(level_names.begin(), it));
}

// Asynchronous line logger. Formatting happens on the calling thread, the
// writer thread only batches and writes. Before start() and after stop()
// lines are written synchronously.
class Logger {
  static constexpr std::size_t kQueueCapacity = 8192;
  static constexpr std::size_t kBatchSize = 64;
  using LineChannel = boost::asio::experimental::concurrent_channel<
      boost::asio::io_context::executor_type,
      void(boost::system::error_code, std::string)>;

public:
  Logger() = default;
  ~Logger();

  Logger(const Logger &) = delete;
  auto operator=(const Logger &) -> Logger & = delete;

  auto start() -> void;
  auto stop() -> void;

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }
  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }
  [[nodiscard]] auto enabled(Level level) const noexcept -> bool {
    return level >= level_.load(std::memory_order_acquire);
  }

  auto set_output_stdout() -> void;
  auto set_output_stderr() -> void;
  // Empty path restores stdout. Returns false if the file cannot be opened.
  auto set_output_file(std::string_view path) -> bool;

  [[nodiscard]] auto dropped() const noexcept -> std::uint64_t {
    return dropped_.load(std::memory_order_relaxed);
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args &&...args)
      -> void {
    if (!enabled(level)) {
      return;
    }
    submit(format_line(level, std::format(fmt, std::forward<Args>(args)...)));
  }

private:
  [[nodiscard]] static auto format_line(Level level, std::string_view message)
      -> std::string;
  auto submit(std::string line) -> void;
  auto write_lines(std::span<const std::string> lines) -> void;
  auto writer_loop(std::shared_ptr<LineChannel> queue) -> void;
  auto replace_output(FILE *out, FILE *owned) -> void;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> dropped_{0};

  std::mutex output_mu_;
  FILE *output_{stdout};
  FILE *owned_file_{nullptr};

  boost::asio::io_context queue_ctx_{1};
  std::atomic<std::shared_ptr<LineChannel>> queue_;
  std::jthread writer_;
};

[[nodiscard]] auto logger() -> Logger &;

inline auto start() -> void { logger().start(); }
inline auto stop() -> void { logger().stop(); }

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

// Unknown names fall back to info.
inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name).value_or(Level::Info));
}

inline auto set_output_stderr() -> void { logger().set_output_stderr(); }

inline auto set_output_file(std::string_view path) -> bool {
  return logger().set_output_file(path);
}

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

} // namespace planforge::log
