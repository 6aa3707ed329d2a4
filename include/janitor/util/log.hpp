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
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>

namespace janitor::log {

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

inline constexpr std::string_view kColorReset = "\o{33}[0m";

[[nodiscard]] inline auto level_name(Level level) -> std::string_view {
  return level_names.at(std::to_underlying(level));
}

[[nodiscard]] inline auto level_color(Level level) -> std::string_view {
  return level_colors.at(std::to_underlying(level));
}

[[nodiscard]] inline auto parse_level(std::string_view name)
    -> std::optional<Level> {
  const auto *it = std::ranges::find(level_names, name);
  if (it == level_names.end()) {
    return std::nullopt;
  }
  return static_cast<Level>(std::distance(level_names.begin(), it));
}

// Lines are formatted on the calling thread. After start() they are handed to
// a writer thread through a bounded channel; before start() (one-shot runs,
// tests) they are written inline.
class Logger {
  static constexpr std::size_t kQueueCapacity = 4096;
  static constexpr std::size_t kMaxBatch = 64;
  using LineChannel = boost::asio::experimental::concurrent_channel<
      boost::asio::io_context::executor_type,
      void(boost::system::error_code, std::string)>;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<FILE *> output_{stderr};
  std::atomic<bool> colored_{false};
  FILE *file_{nullptr};
  boost::asio::io_context channel_ctx_{1};
  std::shared_ptr<LineChannel> channel_;
  std::jthread writer_;

  static auto is_terminal(FILE *out) noexcept -> bool {
    const int fd = ::fileno(out);
    return fd >= 0 && ::isatty(fd) != 0;
  }

  auto sink() const noexcept -> FILE * {
    auto *out = output_.load(std::memory_order_acquire);
    return out != nullptr ? out : stderr;
  }

  auto write_batch(const std::vector<std::string> &batch) -> void {
    auto *out = sink();
    for (const auto &line : batch) {
      std::fwrite(line.data(), 1, line.size(), out);
    }
    std::fflush(out);
  }

  auto writer_loop(std::shared_ptr<LineChannel> channel) -> void {
    std::vector<std::string> batch;
    batch.reserve(kMaxBatch);

    for (;;) {
      batch.clear();
      boost::system::error_code recv_ec;
      channel->async_receive(
          [&](const boost::system::error_code &ec, std::string line) {
            recv_ec = ec;
            if (!ec) {
              batch.push_back(std::move(line));
            }
          });
      channel_ctx_.restart();
      (void)channel_ctx_.run_one();
      if (recv_ec || batch.empty()) {
        break;
      }

      while (batch.size() < kMaxBatch &&
             channel->try_receive(
                 [&](const boost::system::error_code &ec, std::string line) {
                   if (!ec) {
                     batch.push_back(std::move(line));
                   }
                 })) {
      }
      write_batch(batch);
    }

    // Whatever is still buffered after close() is written before returning.
    batch.clear();
    while (channel->try_receive(
        [&](const boost::system::error_code &ec, std::string line) {
          if (!ec) {
            batch.push_back(std::move(line));
          }
        })) {
    }
    write_batch(batch);
  }

public:
  Logger() { colored_.store(is_terminal(stderr), std::memory_order_release); }

  ~Logger() {
    stop();
    if (file_ != nullptr) {
      std::fclose(file_);
    }
  }

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  auto start() -> void {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
      return;
    }
    channel_ = std::make_shared<LineChannel>(channel_ctx_.get_executor(),
                                             kQueueCapacity);
    writer_ = std::jthread([this, channel = channel_] { writer_loop(channel); });
  }

  auto stop() -> void {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
      return;
    }
    channel_->close();
    if (writer_.joinable()) {
      writer_.join();
    }
    channel_.reset();
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  auto set_output_stderr() noexcept -> void {
    output_.store(stderr, std::memory_order_release);
    colored_.store(is_terminal(stderr), std::memory_order_release);
  }

  // Must be called before start(); the writer thread does not reopen sinks.
  auto set_output_file(std::string_view path) -> bool {
    if (running_.load(std::memory_order_acquire)) {
      return false;
    }
    FILE *f = std::fopen(std::string(path).c_str(), "a");
    if (f == nullptr) {
      return false;
    }
    std::setvbuf(f, nullptr, _IOLBF, 0);
    output_.store(f, std::memory_order_release);
    colored_.store(false, std::memory_order_release);
    if (file_ != nullptr) {
      std::fclose(file_);
    }
    file_ = f;
    return true;
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args &&...args)
      -> void {
    if (level < level_.load(std::memory_order_acquire)) {
      return;
    }

    const auto now = std::chrono::floor<std::chrono::seconds>(
        std::chrono::system_clock::now());
    const bool colored = colored_.load(std::memory_order_acquire);
    const auto color = colored ? level_color(level) : std::string_view{};
    const auto reset = colored ? kColorReset : std::string_view{};
    auto line = std::format("[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] {}\n", now, color,
                            level_name(level), reset,
                            std::format(fmt, std::forward<Args>(args)...));

    if (running_.load(std::memory_order_acquire) && channel_ &&
        channel_->try_send(boost::system::error_code{}, line)) {
      return;
    }
    auto *out = sink();
    std::fwrite(line.data(), 1, line.size(), out);
    std::fflush(out);
  }
};

inline Logger &logger() {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

// Unknown names fall back to info.
inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name).value_or(Level::Info));
}

inline auto set_output_file(std::string_view path) -> bool {
  return logger().set_output_file(path);
}

inline auto set_output_stderr() noexcept -> void {
  logger().set_output_stderr();
}

inline auto start() -> void { logger().start(); }
inline auto stop() -> void { logger().stop(); }

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

} // namespace janitor::log
