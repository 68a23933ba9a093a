#include "jobforge/core/runtime.hpp"

#include "jobforge/util/log.hpp"

#include <algorithm>
#include <ranges>

namespace jobforge {

namespace detail {
inline thread_local shard_id current_shard_id = kInvalidShard;
inline thread_local const Runtime *current_runtime = nullptr;
} // namespace detail

Runtime::Runtime(unsigned num_shards) {
  if (num_shards == 0) {
    num_shards = std::max(2U, std::thread::hardware_concurrency());
  }
  num_shards_ = num_shards;

  contexts_.reserve(num_shards);
  work_guards_.resize(num_shards);
  for ([[maybe_unused]] auto i : std::views::iota(0U, num_shards)) {
    contexts_.emplace_back(std::make_unique<boost::asio::io_context>(1));
  }
}

Runtime::~Runtime() noexcept { stop(); }

auto Runtime::start() -> Result<void> {
  if (running_.exchange(true)) {
    return ok();
  }

  log::debug("Starting runtime with {} shards", num_shards_);

  threads_.reserve(num_shards_);
  for (auto i : std::views::iota(0U, num_shards_)) {
    auto &ctx = *contexts_[i];
    ctx.restart();
    work_guards_[i].emplace(boost::asio::make_work_guard(ctx));
    threads_.emplace_back([this, i] { run_shard(i); });
  }
  return ok();
}

auto Runtime::stop() noexcept -> void {
  if (!running_.exchange(false)) {
    return;
  }

  for (auto i : std::views::iota(0U, num_shards_)) {
    if (work_guards_[i].has_value()) {
      work_guards_[i]->reset();
      work_guards_[i].reset();
    }
    contexts_[i]->stop();
  }

  // std::jthread joins on destruction
  threads_.clear();
}

auto Runtime::is_running() const noexcept -> bool {
  return running_.load(std::memory_order_acquire);
}

auto Runtime::current_shard() const noexcept -> shard_id {
  return detail::current_runtime == this ? detail::current_shard_id
                                         : kInvalidShard;
}

auto Runtime::next_worker_shard() noexcept -> shard_id {
  if (num_shards_ <= 1) {
    return kControlShard;
  }
  const auto n = worker_rr_.fetch_add(1, std::memory_order_relaxed);
  return static_cast<shard_id>(1 + n % (num_shards_ - 1));
}

auto Runtime::run_shard(shard_id id) -> void {
  detail::current_shard_id = id;
  detail::current_runtime = this;

  contexts_[id]->run();

  detail::current_shard_id = kInvalidShard;
  detail::current_runtime = nullptr;
}

} // namespace jobforge
