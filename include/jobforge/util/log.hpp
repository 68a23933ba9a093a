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
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace jobforge::log {

enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error };

inline constexpr std::array<std::string_view, 5> level_names = {
    "trace", "debug", "info", "warn", "error"};

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

/// Writer-side record. Redirect records carry a target path instead of text;
/// an empty path switches back to the standard stream.
struct Record {
  enum class Kind : std::uint8_t { Line, Redirect };
  Kind kind{Kind::Line};
  std::string text;
};

// Lines are formatted on the calling thread and handed to a single writer
// thread through a bounded channel. When the channel is full the line is
// written synchronously.
class Logger {
  static constexpr std::size_t kQueueCapacity = 4096;
  static constexpr std::size_t kBatchSize = 64;
  using Channel = boost::asio::experimental::concurrent_channel<
      boost::asio::io_context::executor_type,
      void(boost::system::error_code, Record)>;

public:
  Logger() = default;
  ~Logger() {
    stop();
    close_file();
  }

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  auto start() -> void {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
      return;
    }
    writer_ctx_.restart();
    auto channel =
        std::make_shared<Channel>(writer_ctx_.get_executor(), kQueueCapacity);
    channel_.store(channel, std::memory_order_release);
    writer_ = std::jthread([this, channel] { drain(channel); });
  }

  auto stop() -> void {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
      return;
    }
    if (auto channel = channel_.exchange(nullptr, std::memory_order_acq_rel)) {
      channel->close();
    }
    writer_ctx_.stop();
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

  auto set_output_stderr() noexcept -> void {
    stream_.store(stderr, std::memory_order_release);
  }

  auto set_output_file(std::string_view path) -> bool {
    if (auto channel = channel_.load(std::memory_order_acquire)) {
      return channel->try_send(
          boost::system::error_code{},
          Record{.kind = Record::Kind::Redirect, .text = std::string(path)});
    }
    return redirect(path);
  }

  template <typename... Args>
  auto write(Level level, std::format_string<Args...> fmt, Args &&...args)
      -> void {
    if (level < level_.load(std::memory_order_acquire)) {
      return;
    }

    const auto now =
        std::chrono::floor<std::chrono::milliseconds>(
            std::chrono::system_clock::now());
    std::string line;
    line.reserve(128);
    std::format_to(std::back_inserter(line), "[{:%Y-%m-%d %H:%M:%S}] [{}] ",
                   now, level_name(level));
    std::format_to(std::back_inserter(line), fmt, std::forward<Args>(args)...);
    line.push_back('\n');

    auto channel = channel_.load(std::memory_order_acquire);
    if (channel &&
        channel->try_send(boost::system::error_code{},
                          Record{.kind = Record::Kind::Line, .text = line})) {
      return;
    }
    emit(line);
  }

private:
  auto target() const noexcept -> FILE * {
    auto *out = stream_.load(std::memory_order_acquire);
    return out != nullptr ? out : stdout;
  }

  auto emit(std::string_view text) const -> void {
    auto *out = target();
    std::fwrite(text.data(), 1, text.size(), out);
    std::fflush(out);
  }

  auto close_file() -> void {
    if (file_ != nullptr) {
      std::fclose(file_);
      file_ = nullptr;
    }
  }

  auto redirect(std::string_view path) -> bool {
    if (path.empty()) {
      stream_.store(stdout, std::memory_order_release);
      close_file();
      return true;
    }
    FILE *f = std::fopen(std::string(path).c_str(), "a");
    if (f == nullptr) {
      return false;
    }
    std::setvbuf(f, nullptr, _IOLBF, 0);
    stream_.store(f, std::memory_order_release);
    close_file();
    file_ = f;
    return true;
  }

  auto apply(Record record) -> void {
    if (record.kind == Record::Kind::Redirect) {
      if (!redirect(record.text)) {
        emit(std::format("log: cannot open '{}'\n", record.text));
      }
      return;
    }
    std::fwrite(record.text.data(), 1, record.text.size(), target());
  }

  auto drain(std::shared_ptr<Channel> channel) -> void {
    while (running_.load(std::memory_order_acquire)) {
      std::optional<Record> first;
      boost::system::error_code closed;
      channel->async_receive(
          [&](boost::system::error_code ec, Record record) {
            closed = ec;
            if (!ec) {
              first = std::move(record);
            }
          });
      writer_ctx_.restart();
      (void)writer_ctx_.run_one();
      if (closed || !first) {
        break;
      }

      apply(std::move(*first));
      for (std::size_t n = 1; n < kBatchSize; ++n) {
        const bool got = channel->try_receive(
            [&](boost::system::error_code ec, Record record) {
              if (!ec) {
                apply(std::move(record));
              }
            });
        if (!got) {
          break;
        }
      }
      std::fflush(target());
    }

    // Flush whatever was queued before close.
    while (channel->try_receive(
        [&](boost::system::error_code ec, Record record) {
          if (!ec) {
            apply(std::move(record));
          }
        })) {
    }
    std::fflush(target());
  }

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<FILE *> stream_{stdout};
  FILE *file_{nullptr};
  boost::asio::io_context writer_ctx_{1};
  std::atomic<std::shared_ptr<Channel>> channel_;
  std::jthread writer_;
};

inline auto logger() -> Logger & {
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

inline auto set_output_stderr() noexcept -> void {
  logger().set_output_stderr();
}

inline auto start() -> void { logger().start(); }
inline auto stop() -> void { logger().stop(); }

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().write(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().write(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().write(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().write(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().write(Level::Error, fmt, std::forward<Args>(args)...);
}

} // namespace jobforge::log
