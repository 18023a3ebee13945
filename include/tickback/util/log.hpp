#pragma once

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <deque>
#include <format>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <unistd.h>

namespace tickback::log {

enum class Level : std::uint8_t {
  Trace,
  Debug,
  Info,
  Warn,
  Error
};

enum class Format : std::uint8_t {
  Text,
  Json
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
    -> std::optional<Level> {
  constexpr std::string_view names[] = {"trace", "debug", "info", "warn",
                                        "error"};
  for (std::uint8_t i = 0; i < std::size(names); ++i) {
    if (names[i] == name) {
      return static_cast<Level>(i);
    }
  }
  return std::nullopt;
}

[[nodiscard]] constexpr auto parse_format(std::string_view name) noexcept
    -> std::optional<Format> {
  if (name == "text") return Format::Text;
  if (name == "json") return Format::Json;
  return std::nullopt;
}

// Async logger: callers format a line and hand it to a writer thread through
// a bounded queue. Lines are written synchronously when the queue is full or
// the writer is not running.
class Logger {
  static constexpr std::size_t QUEUE_CAPACITY = 8192;

  std::atomic<Level> level_{Level::Info};
  std::atomic<Format> format_{Format::Text};
  std::atomic<bool> running_{false};

  std::mutex mu_;
  std::condition_variable cv_;
  std::deque<std::string> queue_;
  std::thread writer_;

  std::FILE* sink_{stdout};
  bool owns_sink_{false};
  bool color_{::isatty(STDOUT_FILENO) != 0};

  auto write(std::string_view line) -> void {
    std::fwrite(line.data(), 1, line.size(), sink_);
  }

  auto writer_loop() -> void {
    std::vector<std::string> batch;
    batch.reserve(64);

    std::unique_lock lock(mu_);
    while (true) {
      cv_.wait(lock, [this] {
        return !queue_.empty() || !running_.load(std::memory_order_acquire);
      });
      if (queue_.empty()) {
        break;
      }
      while (!queue_.empty() && batch.size() < 64) {
        batch.push_back(std::move(queue_.front()));
        queue_.pop_front();
      }
      lock.unlock();

      for (const auto& line : batch) {
        write(line);
      }
      std::fflush(sink_);
      batch.clear();

      lock.lock();
    }
  }

  [[nodiscard]] auto format_line(Level level, std::string_view message) const
      -> std::string {
    auto now = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;

    if (format_.load(std::memory_order_relaxed) == Format::Json) {
      nlohmann::json j = {
          {"timestamp", std::format("{:%Y-%m-%dT%H:%M:%S}Z", now)},
          {"level", std::string(level_name(level))},
          {"thread", tid},
          {"message", std::string(message)},
      };
      auto line = j.dump(-1, ' ', false,
                         nlohmann::json::error_handler_t::replace);
      line.push_back('\n');
      return line;
    }

    if (color_) {
      return std::format("[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] [{}] {}\n", now,
                         level_color(level), level_name(level), "\033[0m", tid,
                         message);
    }
    return std::format("[{:%Y-%m-%d %H:%M:%S}] [{}] [{}] {}\n", now,
                       level_name(level), tid, message);
  }

public:
  Logger() = default;
  ~Logger() {
    stop();
    if (owns_sink_) {
      std::fclose(sink_);
    }
  }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  auto start() -> void {
    if (running_.exchange(true))
      return;
    writer_ = std::thread([this] { writer_loop(); });
  }

  auto stop() -> void {
    {
      std::lock_guard lock(mu_);
      if (!running_.exchange(false))
        return;
    }
    cv_.notify_all();
    if (writer_.joinable()) {
      writer_.join();
    }
    std::fflush(sink_);
  }

  // Must be called before start().
  [[nodiscard]] auto open_file(const std::string& path) -> bool {
    std::FILE* f = std::fopen(path.c_str(), "a");
    if (f == nullptr) {
      return false;
    }
    if (owns_sink_) {
      std::fclose(sink_);
    }
    sink_ = f;
    owns_sink_ = true;
    color_ = false;
    return true;
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  auto set_format(Format format) noexcept -> void {
    format_.store(format, std::memory_order_release);
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args&&... args)
      -> void {
    if (level < level_.load(std::memory_order_acquire))
      return;

    auto line =
        format_line(level, std::format(fmt, std::forward<Args>(args)...));

    {
      std::lock_guard lock(mu_);
      if (running_.load(std::memory_order_acquire) &&
          queue_.size() < QUEUE_CAPACITY) {
        queue_.push_back(std::move(line));
        cv_.notify_one();
        return;
      }
    }
    write(line);
  }
};

inline Logger& logger() {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name).value_or(Level::Info));
}

inline auto set_format(std::string_view name) noexcept -> void {
  logger().set_format(parse_format(name).value_or(Format::Text));
}

[[nodiscard]] inline auto open_file(const std::string& path) -> bool {
  return logger().open_file(path);
}

inline auto start() -> void {
  logger().start();
}
inline auto stop() -> void {
  logger().stop();
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

}  // namespace tickback::log
