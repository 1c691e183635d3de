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
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace goalflow::log {

enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error, Off };

inline constexpr std::array<std::string_view, 6> level_names = {
    "trace", "debug", "info", "warn", "error", "off"};

[[nodiscard]] inline auto level_name(Level level) -> std::string_view {
  return level_names.at(std::to_underlying(level));
}

[[nodiscard]] inline auto parse_level(std::string_view name) noexcept
    -> std::optional<Level> {
  const auto *it = std::ranges::find(level_names, name);
  if (it == level_names.end()) {
    return std::nullopt;
  }
  return static_cast<Level>(std::distance(level_names.begin(), it));
}

// Async logger: producers format on their own thread and hand the line to a
// single writer thread through a Boost concurrent_channel. Before start() (and
// after stop()) lines are written synchronously.
class Logger {
  static constexpr std::size_t kQueueCapacity = 4096;
  static constexpr std::size_t kBatchSize = 64;
  using LogChannel = boost::asio::experimental::concurrent_channel<
      boost::asio::io_context::executor_type,
      void(boost::system::error_code, std::string)>;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> dropped_{0};

  std::mutex out_mu_;
  FILE *out_{stderr};
  FILE *file_{nullptr};

  boost::asio::io_context queue_ctx_{1};
  std::atomic<std::shared_ptr<LogChannel>> queue_;
  std::jthread writer_;

  auto write_lines(const std::vector<std::string> &lines) -> void {
    std::lock_guard lock(out_mu_);
    for (const auto &line : lines) {
      std::fwrite(line.data(), 1, line.size(), out_);
    }
    std::fflush(out_);
  }

  auto writer_loop(std::shared_ptr<LogChannel> queue) -> void {
    std::vector<std::string> batch;
    batch.reserve(kBatchSize);

    for (;;) {
      std::optional<std::string> first;
      boost::system::error_code recv_ec;
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
      while (batch.size() < kBatchSize &&
             queue->try_receive([&](const boost::system::error_code &ec,
                                    std::string item) {
               if (!ec) {
                 batch.push_back(std::move(item));
               }
             })) {
      }
      write_lines(batch);
    }

    // Channel closed: flush whatever producers managed to enqueue.
    batch.clear();
    while (queue->try_receive(
        [&](const boost::system::error_code &ec, std::string item) {
          if (!ec) {
            batch.push_back(std::move(item));
          }
        })) {
    }
    write_lines(batch);
  }

  [[nodiscard]] static auto format_line(Level level, std::string_view message)
      -> std::string {
    const auto now = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    const auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;
    return std::format("[{:%Y-%m-%d %H:%M:%S}] [{}] [{}] {}\n", now,
                       level_name(level), tid, message);
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
    if (running_.exchange(true, std::memory_order_acq_rel))
      return;
    queue_ctx_.restart();
    auto queue = std::make_shared<LogChannel>(queue_ctx_.get_executor(),
                                              kQueueCapacity);
    queue_.store(queue, std::memory_order_release);
    writer_ = std::jthread(
        [this, queue = std::move(queue)] { writer_loop(queue); });
  }

  auto stop() -> void {
    if (!running_.exchange(false, std::memory_order_acq_rel))
      return;
    if (auto queue = queue_.exchange(nullptr, std::memory_order_acq_rel)) {
      queue->close();
    }
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

  [[nodiscard]] auto dropped() const noexcept -> std::uint64_t {
    return dropped_.load(std::memory_order_relaxed);
  }

  auto set_output_stderr() -> void {
    std::lock_guard lock(out_mu_);
    out_ = stderr;
  }

  auto set_output_stdout() -> void {
    std::lock_guard lock(out_mu_);
    out_ = stdout;
  }

  // Appends to `path`; an empty path switches back to stderr.
  auto set_output_file(std::string_view path) -> bool {
    std::lock_guard lock(out_mu_);
    if (path.empty()) {
      out_ = stderr;
      if (file_) {
        std::fclose(file_);
        file_ = nullptr;
      }
      return true;
    }
    FILE *f = std::fopen(std::string(path).c_str(), "a");
    if (!f)
      return false;
    std::setvbuf(f, nullptr, _IOLBF, 0);
    if (file_)
      std::fclose(file_);
    file_ = f;
    out_ = f;
    return true;
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args &&...args)
      -> void {
    if (level < level_.load(std::memory_order_acquire))
      return;

    auto line =
        format_line(level, std::format(fmt, std::forward<Args>(args)...));

    if (auto queue = queue_.load(std::memory_order_acquire)) {
      if (queue->try_send(boost::system::error_code{}, std::move(line))) {
        return;
      }
      // Never block a worker thread on a full queue.
      dropped_.fetch_add(1, std::memory_order_relaxed);
      return;
    }

    std::lock_guard lock(out_mu_);
    std::fwrite(line.data(), 1, line.size(), out_);
    std::fflush(out_);
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
  logger().set_level(parse_level(name).value_or(Level::Info));
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

} // namespace goalflow::log
