#pragma once

#include "jobforge/core/coroutine.hpp"
#include "jobforge/core/error.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/use_future.hpp>

#include <atomic>
#include <cassert>
#include <limits>
#include <memory>
#include <optional>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace jobforge {

using shard_id = unsigned;

inline constexpr shard_id kInvalidShard = std::numeric_limits<shard_id>::max();

/// Shard that owns supervisor, store and schedule state.
inline constexpr shard_id kControlShard = 0;

class Runtime {
public:
  using executor_type = boost::asio::io_context::executor_type;

  explicit Runtime(unsigned num_shards = 0);
  ~Runtime() noexcept;

  Runtime(const Runtime &) = delete;
  Runtime &operator=(const Runtime &) = delete;

  [[nodiscard]] auto start() -> Result<void>;
  auto stop() noexcept -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  [[nodiscard]] auto shard_count() const noexcept -> unsigned {
    return num_shards_;
  }
  [[nodiscard]] auto current_shard() const noexcept -> shard_id;

  [[nodiscard]] auto context(shard_id id) noexcept
      -> boost::asio::io_context & {
    assert(id < num_shards_);
    return *contexts_[id];
  }

  [[nodiscard]] auto executor_for(shard_id id) -> executor_type {
    assert(id < num_shards_);
    return contexts_[id]->get_executor();
  }

  /// Round-robin over the shards that do not own control state. Falls back
  /// to the control shard on a single-shard runtime.
  [[nodiscard]] auto next_worker_shard() noexcept -> shard_id;

  template <typename T> auto spawn_on(shard_id target, task<T> coro) -> void {
    co_spawn(executor_for(target), std::move(coro), detached);
  }

  template <typename F> auto post_to(shard_id target, F &&fn) -> void {
    boost::asio::post(executor_for(target), std::forward<F>(fn));
  }

  /// Run `fn` on the target shard and resume the caller with its result.
  template <typename F>
  auto invoke_on(shard_id target, F fn) -> task<std::invoke_result_t<F &>> {
    using R = std::invoke_result_t<F &>;
    co_return co_await co_spawn(
        executor_for(target),
        [fn = std::move(fn)]() mutable -> task<R> { co_return fn(); },
        use_awaitable);
  }

  /// Block the calling thread until `coro` completes on the target shard.
  /// Must not be called from that shard's own thread.
  template <typename T>
  auto sync_wait(task<T> coro, shard_id target = kControlShard) -> T {
    assert(current_shard() != target);
    auto fut =
        co_spawn(executor_for(target), std::move(coro), boost::asio::use_future);
    return fut.get();
  }

private:
  auto run_shard(shard_id id) -> void;

  std::atomic<bool> running_{false};
  unsigned num_shards_;
  std::vector<std::unique_ptr<boost::asio::io_context>> contexts_;
  std::vector<std::optional<boost::asio::executor_work_guard<executor_type>>>
      work_guards_;
  std::vector<std::jthread> threads_;
  std::atomic<std::uint64_t> worker_rr_{0};
};

} // namespace jobforge
