#include "jobforge/core/runtime.hpp"

#include <atomic>
#include <chrono>
#include <thread>

#include "gtest/gtest.h"

using namespace jobforge;

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(1);
constexpr auto kTaskTimeout = std::chrono::seconds(1);

auto increment_counter(std::atomic<int> *count_ptr) -> spawn_task {
  count_ptr->fetch_add(1);
  co_return;
}

template <typename Pred> auto wait_for(Pred pred) -> bool {
  auto deadline = std::chrono::steady_clock::now() + kTaskTimeout;
  while (!pred() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(kPollInterval);
  }
  return pred();
}

} // namespace

TEST(RuntimeTest, BasicStartStop) {
  Runtime rt(1);
  EXPECT_FALSE(rt.is_running());
  ASSERT_TRUE(rt.start());
  EXPECT_TRUE(rt.is_running());
  rt.stop();
  EXPECT_FALSE(rt.is_running());
}

TEST(RuntimeTest, ShardCount) {
  Runtime rt(1);
  EXPECT_EQ(rt.shard_count(), 1U);

  Runtime rt4(4);
  EXPECT_EQ(rt4.shard_count(), 4U);
}

TEST(RuntimeTest, ZeroShardsPicksAtLeastTwo) {
  Runtime rt(0);
  EXPECT_GE(rt.shard_count(), 2U);
}

TEST(RuntimeTest, StopIsIdempotent) {
  Runtime rt(2);
  ASSERT_TRUE(rt.start());
  rt.stop();
  rt.stop();
  EXPECT_FALSE(rt.is_running());
}

TEST(RuntimeTest, RestartAfterStop) {
  Runtime rt(2);
  ASSERT_TRUE(rt.start());
  rt.stop();
  ASSERT_TRUE(rt.start());

  std::atomic<int> count = 0;
  rt.spawn_on(1, increment_counter(&count));
  EXPECT_TRUE(wait_for([&] { return count.load() == 1; }));
  rt.stop();
}

TEST(RuntimeTest, CurrentShardReturnsInvalidOutsideContext) {
  Runtime rt(2);
  ASSERT_TRUE(rt.start());
  EXPECT_EQ(rt.current_shard(), kInvalidShard);
  rt.stop();
}

TEST(RuntimeTest, SpawnOnTargetShard) {
  Runtime rt(3);
  ASSERT_TRUE(rt.start());

  std::atomic<unsigned> observed{kInvalidShard};
  auto on_target = [&]() -> spawn_task {
    observed.store(rt.current_shard(), std::memory_order_relaxed);
    co_return;
  };
  rt.spawn_on(2, on_target());

  EXPECT_TRUE(wait_for([&] { return observed.load() != kInvalidShard; }));
  EXPECT_EQ(observed.load(), 2U);
  rt.stop();
}

TEST(RuntimeTest, WorkerShardsSkipControlShard) {
  Runtime rt(3);
  for (int i = 0; i < 10; ++i) {
    auto shard = rt.next_worker_shard();
    EXPECT_NE(shard, kControlShard);
    EXPECT_LT(shard, 3U);
  }

  Runtime single(1);
  EXPECT_EQ(single.next_worker_shard(), kControlShard);
}

TEST(RuntimeTest, InvokeOnRunsOnTargetAndReturnsValue) {
  Runtime rt(2);
  ASSERT_TRUE(rt.start());

  auto shard = rt.sync_wait(
      rt.invoke_on(1, [&rt] { return rt.current_shard(); }), kControlShard);
  EXPECT_EQ(shard, 1U);

  auto sum = rt.sync_wait(rt.invoke_on(kControlShard, [] { return 40 + 2; }),
                          1);
  EXPECT_EQ(sum, 42);
  rt.stop();
}

TEST(RuntimeTest, PostToRunsCallable) {
  Runtime rt(2);
  ASSERT_TRUE(rt.start());

  std::atomic<bool> ran{false};
  rt.post_to(1, [&ran] { ran.store(true); });
  EXPECT_TRUE(wait_for([&] { return ran.load(); }));
  rt.stop();
}

TEST(RuntimeTest, AsyncSleepCompletes) {
  Runtime rt(1);
  ASSERT_TRUE(rt.start());

  auto slept = rt.sync_wait([]() -> task<Result<void>> {
    co_return co_await async_sleep(std::chrono::milliseconds(5));
  }());
  EXPECT_TRUE(slept.has_value());
  rt.stop();
}
