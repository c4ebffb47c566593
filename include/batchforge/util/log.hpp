#pragma once

#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <format>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>

namespace batchforge::log {

enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error };

inline constexpr std::array<std::string_view, 5> level_names = {
    "trace", "debug", "info", "warn", "error"};

inline constexpr std::array<std::string_view, 5> level_colors = {
    "\o{33}[90m", "\o{33}[36m", "\o{33}[32m", "\o{33}[33m", "\o{33}[31m"};

[[nodiscard]] inline auto level_name(Level level) -> std::string_view {
  return level_names.at(std::to_underlying(level));
}

[[nodiscard]] inline auto level_color(Level level) -> std::string_view {
  return level_colors.at(std::to_underlying(level));
}

// Async logger. Producers format on their own thread and hand the line to a
// bounded concurrent_channel; a single writer thread drains it in batches.
class Logger {
  static constexpr std::size_t kQueueCapacity = 8192;
  static constexpr std::size_t kBatchSize = 64;
  using LineChannel = boost::asio::experimental::concurrent_channel<
      boost::asio::io_context::executor_type,
      void(boost::system::error_code, std::string)>;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};

  // Guards out_/file_ swaps against the writer thread.
  std::mutex sink_mu_;
  FILE *out_{stdout};
  FILE *file_{nullptr};
  std::atomic<bool> color_{true};

  boost::asio::io_context queue_ctx_{1};
  std::atomic<std::shared_ptr<LineChannel>> queue_;
  std::jthread writer_;

  auto write_lines(std::span<const std::string> lines) -> void {
    std::scoped_lock lock(sink_mu_);
    for (const auto &line : lines) {
      std::fwrite(line.data(), 1, line.size(), out_);
    }
    std::fflush(out_);
  }

  auto drain(LineChannel &queue, std::vector<std::string> &batch) -> void {
    while (batch.size() < kBatchSize) {
      std::optional<std::string> line;
      const bool received = queue.try_receive(
          [&](const boost::system::error_code &ec, std::string item) {
            if (!ec) {
              line = std::move(item);
            }
          });
      if (!received) {
        break;
      }
      if (line) {
        batch.push_back(std::move(*line));
      }
    }
  }

  auto writer_loop(std::shared_ptr<LineChannel> queue) -> void {
    std::vector<std::string> batch;
    batch.reserve(kBatchSize);

    while (running_.load(std::memory_order_acquire)) {
      boost::system::error_code recv_ec;
      std::optional<std::string> first;
      queue->async_receive(
          [&](const boost::system::error_code &ec, std::string item) {
            recv_ec = ec;
            if (!ec) {
              first = std::move(item);
            }
          });
      queue_ctx_.restart();
      (void)queue_ctx_.run_one();
      if (recv_ec || !first) {
        break;
      }
      batch.clear();
      batch.push_back(std::move(*first));
      drain(*queue, batch);
      write_lines(batch);
    }

    for (;;) {
      batch.clear();
      drain(*queue, batch);
      if (batch.empty()) {
        break;
      }
      write_lines(batch);
    }
  }

  [[nodiscard]] auto format_line(Level level, std::string_view body) const
      -> std::string {
    const auto now = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    const auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;
    if (!color_.load(std::memory_order_relaxed)) {
      return std::format("[{:%Y-%m-%d %H:%M:%S}] [{}] [{}] {}\n", now,
                         level_name(level), tid, body);
    }
    return std::format("[{:%Y-%m-%d %H:%M:%S}] [{}{}\o{33}[0m] [{}] {}\n", now,
                       level_color(level), level_name(level), tid, body);
  }

public:
  Logger() = default;
  ~Logger() {
    stop();
    if (file_) {
      std::fclose(file_);
    }
  }

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  auto start() -> void {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
      return;
    }
    queue_ctx_.restart();
    auto queue =
        std::make_shared<LineChannel>(queue_ctx_.get_executor(), kQueueCapacity);
    queue_.store(queue, std::memory_order_release);
    writer_ = std::jthread([this, q = std::move(queue)] { writer_loop(q); });
  }

  auto stop() -> void {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
      return;
    }
    if (auto queue = queue_.exchange(nullptr, std::memory_order_acq_rel)) {
      queue->close();
    }
    queue_ctx_.stop();
    if (writer_.joinable()) {
      writer_.join();
    }
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  auto set_output_stderr() -> void {
    std::scoped_lock lock(sink_mu_);
    out_ = stderr;
    color_ = ::isatty(::fileno(stderr)) != 0;
  }

  // Empty path restores stdout.
  auto set_output_file(std::string_view path) -> bool {
    std::scoped_lock lock(sink_mu_);
    if (path.empty()) {
      out_ = stdout;
      color_ = true;
      if (file_) {
        std::fclose(file_);
        file_ = nullptr;
      }
      return true;
    }
    FILE *f = std::fopen(std::string(path).c_str(), "a");
    if (!f) {
      return false;
    }
    std::setvbuf(f, nullptr, _IOLBF, 0);
    if (file_) {
      std::fclose(file_);
    }
    file_ = f;
    out_ = f;
    color_ = false;
    return true;
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args &&...args)
      -> void {
    if (level < level_.load(std::memory_order_acquire)) {
      return;
    }
    auto line =
        format_line(level, std::format(fmt, std::forward<Args>(args)...));

    auto queue = queue_.load(std::memory_order_acquire);
    if (queue && queue->try_send(boost::system::error_code{}, line)) {
      return;
    }
    if (queue && running_.load(std::memory_order_acquire)) {
      // Queue full: drop rather than block scheduler threads.
      return;
    }
    write_lines(std::span<const std::string>(&line, 1));
  }
};

inline Logger &logger() {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  const auto *it = std::ranges::find(level_names, name);
  logger().set_level(
      it != level_names.end()
          ? static_cast<Level>(std::distance(level_names.begin(), it))
          : Level::Info);
}

inline auto set_output_file(std::string_view path) -> bool {
  return logger().set_output_file(path);
}

inline auto set_output_stderr() -> void { logger().set_output_stderr(); }

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

} // namespace batchforge::log
