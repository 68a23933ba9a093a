#include "jobforge/supervisor/stuck_detector.hpp"

#include "test_utils.hpp"

#include <chrono>
#include <thread>

#include "gtest/gtest.h"

using namespace jobforge;
using namespace jobforge::test;
using namespace std::chrono_literals;

namespace {

class StuckDetectorTest : public ::testing::Test {
protected:
  void SetUp() override { h_.start(); }

  auto sweep(std::chrono::system_clock::time_point since)
      -> Result<std::vector<TaskId>> {
    return h_.block_on(h_.detector().sweep(since));
  }

  Harness h_;
};

} // namespace

TEST_F(StuckDetectorTest, InterruptsStaleRunningTaskAndPromotesQueue) {
  const auto id = job_id("stuck");
  h_.add_job(make_job("stuck", single_action("gate"), 1));
  auto first = h_.fire(id);
  auto second = h_.fire(id);
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  ASSERT_EQ(second->status, TaskStatus::Queued);
  ASSERT_TRUE(poll_until([&] { return h_.gate().entered() == 1; }, 5s));
  EXPECT_EQ(h_.running_count(id), 1);

  auto swept = sweep(std::chrono::system_clock::now() + 1s);
  ASSERT_TRUE(swept.has_value());
  ASSERT_EQ(swept->size(), 1U);
  EXPECT_EQ(swept->front(), first->id);

  auto stuck = h_.stored_task(first->id);
  ASSERT_TRUE(stuck.has_value());
  EXPECT_EQ(stuck->status, TaskStatus::Interrupted);
  EXPECT_TRUE(stuck->status_message.starts_with("no update since "));

  // Exactly one slot was released and handed to the queued task.
  EXPECT_EQ(h_.status_of(second->id), TaskStatus::Running);
  EXPECT_EQ(h_.running_count(id), 1);
  EXPECT_EQ(h_.queued_count(id), 0U);

  // The interrupted chain notices the stop; its late result is ignored.
  ASSERT_TRUE(poll_until([&] { return h_.gate().entered() == 2; }, 5s));
  std::this_thread::sleep_for(50ms);
  EXPECT_EQ(h_.status_of(first->id), TaskStatus::Interrupted);
  EXPECT_EQ(h_.running_count(id), 1);
}

TEST_F(StuckDetectorTest, FreshTasksAreLeftAlone) {
  const auto id = job_id("fresh");
  h_.add_job(make_job("fresh", single_action("gate")));
  auto t = h_.fire(id);
  ASSERT_TRUE(t.has_value());

  auto swept = sweep(std::chrono::system_clock::now() - 1h);
  ASSERT_TRUE(swept.has_value());
  EXPECT_TRUE(swept->empty());
  EXPECT_EQ(h_.status_of(t->id), TaskStatus::Running);
}

TEST_F(StuckDetectorTest, PausedTasksAreNotStuck) {
  const auto id = job_id("paused");
  h_.add_job(make_job("paused", single_action("gate")));
  auto t = h_.fire(id);
  ASSERT_TRUE(t.has_value());
  ASSERT_TRUE(poll_until([&] { return h_.gate().entered() == 1; }, 5s));
  ASSERT_TRUE(h_.block_on(h_.supervisor().control(
                              CtrlCommand{.cmd = Command::Pause,
                                          .job_id = id,
                                          .task_id = t->id}))
                  .has_value());

  auto swept = sweep(std::chrono::system_clock::now() + 1s);
  ASSERT_TRUE(swept.has_value());
  EXPECT_TRUE(swept->empty());
  EXPECT_EQ(h_.status_of(t->id), TaskStatus::Paused);
}

TEST_F(StuckDetectorTest, RepairsOrphanedRunningRecord) {
  const auto id = job_id("orphan");
  h_.add_job(make_job("orphan", single_action("noop")));
  const auto old = std::chrono::system_clock::now() - 2h;
  Task orphan{.id = TaskId{"orphan-task"},
              .job_id = id,
              .status = TaskStatus::Running,
              .status_message = "running",
              .start_time = old,
              .last_update = old};
  ASSERT_TRUE(h_.on_control([&] { return h_.store().put_task(orphan); })
                  .has_value());

  auto swept = sweep(std::chrono::system_clock::now() - 1h);
  ASSERT_TRUE(swept.has_value());
  ASSERT_EQ(swept->size(), 1U);
  EXPECT_EQ(swept->front(), orphan.id);

  auto repaired = h_.stored_task(orphan.id);
  ASSERT_TRUE(repaired.has_value());
  EXPECT_EQ(repaired->status, TaskStatus::Interrupted);
  EXPECT_FALSE(repaired->can_stop);
  EXPECT_GT(repaired->end_time, old);
}
