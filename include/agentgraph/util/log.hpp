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
#include <string>
#include <string_view>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>

namespace agentgraph::log {

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

[[nodiscard]] inline auto parse_level(std::string_view name,
                                      Level fallback = Level::Info) -> Level {
  const auto *it = std::ranges::find(level_names, name);
  return it != level_names.end()
             ? static_cast<Level>(std::distance(level_names.begin(), it))
             : fallback;
}

// Lines are formatted on the calling thread and handed to a single writer
// thread through a bounded channel. Before start() (and after stop()) lines
// are written synchronously.
class Logger {
  static constexpr std::size_t kQueueCapacity = 4096;
  static constexpr std::size_t kMaxBatch = 64;
  using LineChannel = boost::asio::experimental::concurrent_channel<
      void(boost::system::error_code, std::string)>;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> dropped_{0};

  // Guards the sink; the writer holds it for a whole batch.
  std::mutex sink_mutex_;
  FILE *sink_{stdout};
  FILE *owned_file_{nullptr};
  std::atomic<bool> colored_{true};

  boost::asio::io_context writer_ctx_{1};
  std::unique_ptr<LineChannel> channel_;
  std::jthread writer_;

  auto write_batch(const std::vector<std::string> &batch) -> void {
    std::lock_guard lock(sink_mutex_);
    for (const auto &line : batch) {
      std::fwrite(line.data(), 1, line.size(), sink_);
    }
    std::fflush(sink_);
  }

  auto writer_loop() -> void {
    std::vector<std::string> batch;
    batch.reserve(kMaxBatch);

    for (;;) {
      boost::system::error_code recv_ec;
      channel_->async_receive(
          [&](boost::system::error_code ec, std::string line) {
            recv_ec = ec;
            if (!ec) {
              batch.push_back(std::move(line));
            }
          });
      writer_ctx_.restart();
      (void)writer_ctx_.run_one();
      if (recv_ec) {
        break;
      }

      while (batch.size() < kMaxBatch &&
             channel_->try_receive(
                 [&](boost::system::error_code ec, std::string line) {
                   if (!ec) {
                     batch.push_back(std::move(line));
                   }
                 })) {
      }
      write_batch(batch);
      batch.clear();
    }

    // Closed: whatever is still buffered goes out before the thread exits.
    while (channel_->try_receive(
        [&](boost::system::error_code ec, std::string line) {
          if (!ec) {
            batch.push_back(std::move(line));
          }
        })) {
    }
    write_batch(batch);
  }

  [[nodiscard]] auto format_line(Level level, std::string_view message)
      -> std::string {
    const auto now = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    const auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;
    const auto idx = std::to_underlying(level);
    if (colored_.load(std::memory_order_relaxed)) {
      return std::format("[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] [{}] {}\n", now,
                         level_colors.at(idx), level_names.at(idx),
                         kColorReset, tid, message);
    }
    return std::format("[{:%Y-%m-%d %H:%M:%S}] [{}] [{}] {}\n", now,
                       level_names.at(idx), tid, message);
  }

  auto write_direct(const std::string &line) -> void {
    std::lock_guard lock(sink_mutex_);
    std::fwrite(line.data(), 1, line.size(), sink_);
    std::fflush(sink_);
  }

  auto replace_sink(FILE *sink, FILE *owned) -> void {
    std::lock_guard lock(sink_mutex_);
    if (owned_file_ != nullptr) {
      std::fclose(owned_file_);
    }
    sink_ = sink;
    owned_file_ = owned;
    colored_.store(owned == nullptr && ::isatty(::fileno(sink)) != 0,
                   std::memory_order_relaxed);
  }

public:
  Logger() {
    colored_.store(::isatty(::fileno(stdout)) != 0, std::memory_order_relaxed);
  }
  ~Logger() {
    stop();
    if (owned_file_ != nullptr) {
      std::fclose(owned_file_);
    }
  }

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  // start() and stop() belong to the main thread.
  auto start() -> void {
    if (running_.load(std::memory_order_acquire)) {
      return;
    }
    channel_ =
        std::make_unique<LineChannel>(writer_ctx_.get_executor(), kQueueCapacity);
    writer_ = std::jthread([this] { writer_loop(); });
    running_.store(true, std::memory_order_release);
  }

  auto stop() -> void {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
      return;
    }
    // The closed channel stays allocated: a racing log() call sees try_send
    // fail and falls back to a direct write.
    channel_->close();
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

  auto set_output_stdout() -> void { replace_sink(stdout, nullptr); }
  auto set_output_stderr() -> void { replace_sink(stderr, nullptr); }

  // Empty path restores stdout. Returns false if the file cannot be opened.
  auto set_output_file(std::string_view path) -> bool {
    if (path.empty()) {
      set_output_stdout();
      return true;
    }
    FILE *f = std::fopen(std::string(path).c_str(), "a");
    if (f == nullptr) {
      return false;
    }
    std::setvbuf(f, nullptr, _IOLBF, 0);
    replace_sink(f, f);
    return true;
  }

  [[nodiscard]] auto dropped() const noexcept -> std::uint64_t {
    return dropped_.load(std::memory_order_relaxed);
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args &&...args)
      -> void {
    if (level < level_.load(std::memory_order_acquire)) {
      return;
    }
    auto line =
        format_line(level, std::format(fmt, std::forward<Args>(args)...));

    if (!running_.load(std::memory_order_acquire)) {
      write_direct(line);
      return;
    }
    if (!channel_->try_send(boost::system::error_code{}, line)) {
      if (!running_.load(std::memory_order_acquire)) {
        write_direct(line);
        return;
      }
      // Full queue: drop rather than block a coroutine thread.
      dropped_.fetch_add(1, std::memory_order_relaxed);
    }
  }
};

inline auto logger() -> Logger & {
  static Logger instance;
  return instance;
}

inline auto start() -> void { logger().start(); }
inline auto stop() -> void { logger().stop(); }

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) -> void {
  logger().set_level(parse_level(name));
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

} // namespace agentgraph::log
