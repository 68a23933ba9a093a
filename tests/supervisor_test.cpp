#include "jobforge/supervisor/task_supervisor.hpp"

#include "test_utils.hpp"

#include <algorithm>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

using namespace jobforge;
using namespace jobforge::test;
using namespace std::chrono_literals;

namespace {

class SupervisorTest : public ::testing::Test {
protected:
  void SetUp() override { h_.start(); }

  auto command(Command cmd, const JobId &job, TaskId task = {},
               std::string owner = "tester") -> Result<CtrlCommandResponse> {
    return h_.block_on(h_.supervisor().control(CtrlCommand{
        .cmd = cmd, .job_id = job, .task_id = std::move(task),
        .owner_id = std::move(owner)}));
  }

  auto wait_entered(int n) -> bool {
    return poll_until([&] { return h_.gate().entered() >= n; }, 5s);
  }

  Harness h_;
};

} // namespace

TEST_F(SupervisorTest, FireUnknownJobIsNotFound) {
  auto r = h_.fire(job_id("nope"));
  EXPECT_EQ(r.error(), make_error_code(Error::NotFound));
}

TEST_F(SupervisorTest, TaskRunsToFinished) {
  h_.add_job(make_job("quick", single_action("noop")));
  auto t = h_.fire(job_id("quick"), "cli");
  ASSERT_TRUE(t.has_value());
  EXPECT_EQ(t->status, TaskStatus::Running);
  ASSERT_TRUE(h_.wait_for_status(t->id, TaskStatus::Finished));

  auto stored = h_.stored_task(t->id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->trigger_owner, "cli");
  EXPECT_FLOAT_EQ(stored->progress, 1.0F);
  EXPECT_EQ(stored->action_logs.size(), 1U);
  EXPECT_GE(stored->end_time, stored->start_time);
  EXPECT_EQ(h_.running_count(job_id("quick")), 0);
}

TEST_F(SupervisorTest, ConcurrencyCeilingQueuesInOrder) {
  const auto id = job_id("limited");
  h_.add_job(make_job("limited", single_action("gate"), 2));

  std::vector<Task> fired;
  for (int i = 0; i < 5; ++i) {
    auto t = h_.fire(id);
    ASSERT_TRUE(t.has_value());
    fired.push_back(*t);
  }
  EXPECT_EQ(fired[0].status, TaskStatus::Running);
  EXPECT_EQ(fired[1].status, TaskStatus::Running);
  for (std::size_t i = 2; i < fired.size(); ++i) {
    EXPECT_EQ(fired[i].status, TaskStatus::Queued);
    EXPECT_EQ(h_.status_of(fired[i].id), TaskStatus::Queued);
  }
  ASSERT_TRUE(wait_entered(2));
  EXPECT_EQ(h_.running_count(id), 2);
  EXPECT_EQ(h_.queued_count(id), 3U);

  h_.gate().open();
  for (const auto &t : fired) {
    ASSERT_TRUE(h_.wait_for_status(t.id, TaskStatus::Finished));
  }
  EXPECT_LE(h_.gate().max_inside(), 2);
  EXPECT_EQ(h_.gate().entered(), 5);
  EXPECT_EQ(h_.running_count(id), 0);
  EXPECT_EQ(h_.queued_count(id), 0U);

  // Queued tasks were promoted first come, first served.
  for (std::size_t i = 3; i < fired.size(); ++i) {
    EXPECT_LE(h_.stored_task(fired[i - 1].id)->start_time,
              h_.stored_task(fired[i].id)->start_time);
  }
}

TEST(SupervisorDefaultsTest, DefaultLimitAppliesToUnboundedJobs) {
  Harness h(SupervisorOptions{.default_max_concurrency = 1});
  h.start();
  h.add_job(make_job("j", single_action("gate")));
  auto first = h.fire(job_id("j"));
  auto second = h.fire(job_id("j"));
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(first->status, TaskStatus::Running);
  EXPECT_EQ(second->status, TaskStatus::Queued);
}

TEST_F(SupervisorTest, PauseAndResumeRunningTask) {
  const auto id = job_id("pausable");
  h_.add_job(make_job("pausable", single_action("gate")));
  auto t = h_.fire(id);
  ASSERT_TRUE(t.has_value());
  ASSERT_TRUE(wait_entered(1));

  auto paused = command(Command::Pause, id, t->id);
  ASSERT_TRUE(paused.has_value());
  EXPECT_EQ(paused->msg, "pause applied to 1 task(s)");
  EXPECT_EQ(h_.status_of(t->id), TaskStatus::Paused);
  // A paused task keeps its slot.
  EXPECT_EQ(h_.running_count(id), 1);

  EXPECT_EQ(command(Command::Pause, id, t->id).error(),
            make_error_code(Error::InvalidState));

  ASSERT_TRUE(command(Command::Resume, id, t->id).has_value());
  EXPECT_EQ(h_.status_of(t->id), TaskStatus::Running);
  EXPECT_EQ(command(Command::Resume, id, t->id).error(),
            make_error_code(Error::InvalidState));
}

TEST_F(SupervisorTest, PauseOnFinishedTaskIsInvalid) {
  const auto id = job_id("done");
  h_.add_job(make_job("done", single_action("noop")));
  auto t = h_.fire(id);
  ASSERT_TRUE(t.has_value());
  ASSERT_TRUE(h_.wait_for_status(t->id, TaskStatus::Finished));

  EXPECT_EQ(command(Command::Pause, id, t->id).error(),
            make_error_code(Error::InvalidState));
  EXPECT_EQ(h_.status_of(t->id), TaskStatus::Finished);
}

TEST_F(SupervisorTest, NonStoppableRunningTaskRefusesStopAndDelete) {
  const auto id = job_id("pinned");
  h_.add_job(make_job("pinned", single_action("pinned_gate")));
  auto t = h_.fire(id);
  ASSERT_TRUE(t.has_value());
  EXPECT_FALSE(t->can_stop);
  EXPECT_TRUE(t->can_pause);
  ASSERT_TRUE(wait_entered(1));

  EXPECT_EQ(command(Command::Stop, id, t->id).error(),
            make_error_code(Error::InvalidState));
  EXPECT_EQ(command(Command::Delete, id, t->id).error(),
            make_error_code(Error::InvalidState));
  // Job-wide commands skip it as well.
  EXPECT_EQ(command(Command::Stop, id).error(),
            make_error_code(Error::InvalidState));
  EXPECT_EQ(h_.status_of(t->id), TaskStatus::Running);
  EXPECT_EQ(h_.running_count(id), 1);

  h_.gate().open();
  ASSERT_TRUE(h_.wait_for_status(t->id, TaskStatus::Finished));
  auto stored = h_.stored_task(t->id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_FALSE(stored->can_stop);
  EXPECT_FALSE(stored->can_pause);
}

TEST_F(SupervisorTest, NonPausableRunningTaskRefusesPause) {
  const auto id = job_id("unpausable");
  h_.add_job(make_job("unpausable", single_action("unpausable_gate")));
  auto t = h_.fire(id);
  ASSERT_TRUE(t.has_value());
  EXPECT_FALSE(t->can_pause);
  ASSERT_TRUE(wait_entered(1));

  EXPECT_EQ(command(Command::Pause, id, t->id).error(),
            make_error_code(Error::InvalidState));
  EXPECT_EQ(h_.status_of(t->id), TaskStatus::Running);

  // Stopping is still allowed.
  ASSERT_TRUE(command(Command::Stop, id, t->id).has_value());
  EXPECT_EQ(h_.status_of(t->id), TaskStatus::Interrupted);
}

TEST_F(SupervisorTest, OneRestrictedHandlerRestrictsTheWholeTask) {
  ActionTree tree;
  ASSERT_TRUE(tree.add_root(make_action("gate", "held")).has_value());
  ASSERT_TRUE(tree.add_root(make_action("pinned_gate", "pinned")).has_value());
  h_.add_job(make_job("mixed", std::move(tree)));
  auto t = h_.fire(job_id("mixed"));
  ASSERT_TRUE(t.has_value());
  EXPECT_FALSE(t->can_stop);
  EXPECT_TRUE(t->can_pause);
  h_.gate().open();
  ASSERT_TRUE(h_.wait_for_status(t->id, TaskStatus::Finished));
}

TEST_F(SupervisorTest, SingleActionTaskReportsNoPartialProgress) {
  const auto id = job_id("opaque");
  h_.add_job(make_job("opaque", single_action("gate")));
  auto t = h_.fire(id);
  ASSERT_TRUE(t.has_value());
  EXPECT_FALSE(t->has_progress);
  ASSERT_TRUE(wait_entered(1));
  EXPECT_FLOAT_EQ(h_.stored_task(t->id)->progress, 0.0F);

  h_.gate().open();
  ASSERT_TRUE(h_.wait_for_status(t->id, TaskStatus::Finished));
  EXPECT_FLOAT_EQ(h_.stored_task(t->id)->progress, 1.0F);
}

TEST_F(SupervisorTest, MultiActionTaskReportsPartialProgress) {
  ActionTree tree;
  ASSERT_TRUE(tree.add_root(make_action("noop", "quick")).has_value());
  ASSERT_TRUE(tree.add_root(make_action("gate", "held")).has_value());
  h_.add_job(make_job("stepped", std::move(tree)));
  auto t = h_.fire(job_id("stepped"));
  ASSERT_TRUE(t.has_value());
  EXPECT_TRUE(t->has_progress);
  ASSERT_TRUE(wait_entered(1));
  ASSERT_TRUE(poll_until(
      [&] { return h_.stored_task(t->id)->progress >= 0.5F; }, 5s));
  EXPECT_LT(h_.stored_task(t->id)->progress, 1.0F);

  h_.gate().open();
  ASSERT_TRUE(h_.wait_for_status(t->id, TaskStatus::Finished));
}

TEST_F(SupervisorTest, ConcurrentFiresNeverExceedCeiling) {
  constexpr int kLimit = 3;
  constexpr int kThreads = 4;
  constexpr int kPerThread = 5;
  const auto id = job_id("crowded");
  h_.add_job(make_job("crowded", single_action("gate"), kLimit));

  std::vector<std::vector<TaskId>> per_thread(kThreads);
  {
    std::vector<std::jthread> firers;
    for (int i = 0; i < kThreads; ++i) {
      firers.emplace_back([&, i] {
        for (int n = 0; n < kPerThread; ++n) {
          auto t = h_.fire(id, "thread-" + std::to_string(i));
          if (t) {
            per_thread[i].push_back(t->id);
          }
        }
      });
    }
  }

  std::vector<TaskId> fired;
  for (const auto &ids : per_thread) {
    fired.insert(fired.end(), ids.begin(), ids.end());
  }
  ASSERT_EQ(fired.size(), static_cast<std::size_t>(kThreads * kPerThread));
  ASSERT_TRUE(wait_entered(kLimit));
  EXPECT_EQ(h_.running_count(id), kLimit);
  EXPECT_EQ(h_.queued_count(id),
            static_cast<std::size_t>(kThreads * kPerThread - kLimit));

  h_.gate().open();
  for (const auto &task_id : fired) {
    ASSERT_TRUE(h_.wait_for_status(task_id, TaskStatus::Finished));
    EXPECT_LE(h_.running_count(id), kLimit);
  }
  EXPECT_LE(h_.gate().max_inside(), kLimit);
  EXPECT_EQ(h_.gate().entered(), kThreads * kPerThread);
  EXPECT_EQ(h_.running_count(id), 0);
}

TEST_F(SupervisorTest, StopRunningTaskReleasesSlot) {
  const auto id = job_id("stoppable");
  h_.add_job(make_job("stoppable", single_action("gate"), 1));
  auto running = h_.fire(id);
  auto waiting = h_.fire(id);
  ASSERT_TRUE(running.has_value());
  ASSERT_TRUE(waiting.has_value());
  ASSERT_TRUE(wait_entered(1));

  ASSERT_TRUE(command(Command::Stop, id, running->id).has_value());
  auto stopped = h_.stored_task(running->id);
  ASSERT_TRUE(stopped.has_value());
  EXPECT_EQ(stopped->status, TaskStatus::Interrupted);
  EXPECT_EQ(stopped->status_message, "stopped by request");

  // The freed slot went to the queued task.
  ASSERT_TRUE(h_.wait_for_status(waiting->id, TaskStatus::Running));
  EXPECT_EQ(h_.running_count(id), 1);
  EXPECT_EQ(h_.queued_count(id), 0U);

  // The stopped chain winds down later; its completion must not resurrect it.
  ASSERT_TRUE(poll_until([&] { return h_.gate().inside() <= 1; }, 2s));
  std::this_thread::sleep_for(50ms);
  EXPECT_EQ(h_.status_of(running->id), TaskStatus::Interrupted);
}

TEST_F(SupervisorTest, StopQueuedTaskNeverStartsIt) {
  const auto id = job_id("queued");
  h_.add_job(make_job("queued", single_action("gate"), 1));
  auto first = h_.fire(id);
  auto second = h_.fire(id);
  ASSERT_TRUE(second.has_value());
  ASSERT_EQ(second->status, TaskStatus::Queued);

  ASSERT_TRUE(command(Command::Stop, id, second->id).has_value());
  auto stored = h_.stored_task(second->id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->status, TaskStatus::Interrupted);
  EXPECT_EQ(stored->status_message, "stopped before start");
  EXPECT_EQ(h_.queued_count(id), 0U);

  h_.gate().open();
  ASSERT_TRUE(h_.wait_for_status(first->id, TaskStatus::Finished));
  EXPECT_EQ(h_.gate().entered(), 1);
}

TEST_F(SupervisorTest, StopWithoutTaskIdTargetsAllLiveTasks) {
  const auto id = job_id("many");
  h_.add_job(make_job("many", single_action("gate")));
  ASSERT_TRUE(h_.fire(id).has_value());
  ASSERT_TRUE(h_.fire(id).has_value());
  ASSERT_TRUE(wait_entered(2));

  auto r = command(Command::Stop, id);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->msg, "stop applied to 2 task(s)");
  EXPECT_EQ(h_.running_count(id), 0);

  EXPECT_EQ(command(Command::Stop, id).error(),
            make_error_code(Error::InvalidState));
}

TEST_F(SupervisorTest, DeleteRemovesRecord) {
  const auto id = job_id("deletable");
  h_.add_job(make_job("deletable", single_action("gate")));
  auto live = h_.fire(id);
  ASSERT_TRUE(live.has_value());
  ASSERT_TRUE(wait_entered(1));

  // Deleting a live task stops it first.
  ASSERT_TRUE(command(Command::Delete, id, live->id).has_value());
  EXPECT_EQ(h_.stored_task(live->id).error(),
            make_error_code(Error::NotFound));
  EXPECT_EQ(h_.running_count(id), 0);

  EXPECT_EQ(command(Command::Delete, id, live->id).error(),
            make_error_code(Error::NotFound));
}

TEST_F(SupervisorTest, CommandLocatesJobFromTaskId) {
  const auto id = job_id("lookup");
  h_.add_job(make_job("lookup", single_action("gate")));
  auto t = h_.fire(id);
  ASSERT_TRUE(t.has_value());
  ASSERT_TRUE(wait_entered(1));

  ASSERT_TRUE(command(Command::Stop, JobId{}, t->id).has_value());
  EXPECT_EQ(h_.status_of(t->id), TaskStatus::Interrupted);
}

TEST_F(SupervisorTest, TaskOfAnotherJobIsNotFound) {
  h_.add_job(make_job("a", single_action("gate")));
  h_.add_job(make_job("b", single_action("gate")));
  auto t = h_.fire(job_id("a"));
  ASSERT_TRUE(t.has_value());
  EXPECT_EQ(command(Command::Stop, job_id("b"), t->id).error(),
            make_error_code(Error::NotFound));
}

TEST_F(SupervisorTest, InactiveAndActiveToggleJob) {
  const auto id = job_id("toggle");
  h_.add_job(make_job("toggle", single_action("noop")));

  auto off = command(Command::Inactive, id);
  ASSERT_TRUE(off.has_value());
  EXPECT_EQ(off->msg, "job toggle inactive");
  EXPECT_TRUE(h_.on_control([&] { return h_.store().get_job(id); })->inactive);

  auto again = command(Command::Inactive, id);
  ASSERT_TRUE(again.has_value());
  EXPECT_EQ(again->msg, "job toggle already inactive");

  auto on = command(Command::Active, id);
  ASSERT_TRUE(on.has_value());
  EXPECT_EQ(on->msg, "job toggle active");
  EXPECT_FALSE(h_.on_control([&] { return h_.store().get_job(id); })->inactive);
}

TEST_F(SupervisorTest, RunOnceFiresTask) {
  const auto id = job_id("once");
  h_.add_job(make_job("once", single_action("gate")));
  auto r = command(Command::RunOnce, id);
  ASSERT_TRUE(r.has_value());
  EXPECT_TRUE(r->msg.starts_with("task "));
  EXPECT_TRUE(r->msg.ends_with(" running"));
  EXPECT_EQ(h_.running_count(id), 1);
}

TEST_F(SupervisorTest, NoneCommandIsRejected) {
  h_.add_job(make_job("j", single_action("noop")));
  EXPECT_EQ(command(Command::None, job_id("j")).error(),
            make_error_code(Error::NotFound));
  EXPECT_EQ(command(Command::Stop, job_id("missing")).error(),
            make_error_code(Error::NotFound));
}

TEST(SupervisorAuthTest, AuthorizerDeniesCommands) {
  Harness h(SupervisorOptions{
      .authorizer = [](const CtrlCommand &cmd, const Job &job) {
        return cmd.owner_id == job.owner;
      }});
  h.start();
  JobBuilder builder(job_id("owned"));
  builder.owner("alice").actions(single_action("noop"));
  h.add_job(std::move(builder).build().value());

  auto denied = h.block_on(h.supervisor().control(CtrlCommand{
      .cmd = Command::Inactive, .job_id = job_id("owned"),
      .owner_id = "mallory"}));
  EXPECT_EQ(denied.error(), make_error_code(Error::PermissionDenied));

  auto allowed = h.block_on(h.supervisor().control(CtrlCommand{
      .cmd = Command::Inactive, .job_id = job_id("owned"),
      .owner_id = "alice"}));
  EXPECT_TRUE(allowed.has_value());
}

TEST_F(SupervisorTest, AutoCleanRemovesJobAfterSuccess) {
  const auto id = job_id("ephemeral");
  JobBuilder builder(id);
  builder.auto_clean().actions(single_action("noop"));
  h_.add_job(std::move(builder).build().value());

  std::vector<JobId> removed;
  h_.on_control([&] {
    h_.supervisor().set_on_job_removed(
        [&removed](const JobId &job) { removed.push_back(job); });
  });

  ASSERT_TRUE(h_.fire(id).has_value());
  ASSERT_TRUE(poll_until(
      [&] {
        return !h_.on_control([&] { return h_.store().get_job(id); })
                    .has_value();
      },
      5s));
  EXPECT_EQ(h_.on_control([&] { return removed; }),
            std::vector<JobId>{id});
}

TEST_F(SupervisorTest, FailedRunKeepsAutoCleanJob) {
  const auto id = job_id("sticky");
  h_.registry().register_function(
      "fail", [](const ActionContext &,
                 ActionMessage input) -> task<Result<ActionMessage>> {
        input.append_output(ActionOutput::failure("nope"));
        co_return ok(std::move(input));
      });
  JobBuilder builder(id);
  builder.auto_clean().actions(single_action("fail"));
  h_.add_job(std::move(builder).build().value());

  auto t = h_.fire(id);
  ASSERT_TRUE(t.has_value());
  ASSERT_TRUE(h_.wait_for_status(t->id, TaskStatus::Error));
  EXPECT_TRUE(h_.on_control([&] { return h_.store().get_job(id); })
                  .has_value());
}

TEST_F(SupervisorTest, PublishesTaskChanges) {
  std::vector<TaskStatus> seen;
  h_.on_control([&] {
    h_.publisher().subscribe_tasks(
        [&seen](const TaskChangeEvent &e) { seen.push_back(e.task.status); });
  });
  h_.add_job(make_job("observed", single_action("noop")));
  auto t = h_.fire(job_id("observed"));
  ASSERT_TRUE(t.has_value());
  ASSERT_TRUE(h_.wait_for_status(t->id, TaskStatus::Finished));

  auto statuses = h_.on_control([&] { return seen; });
  ASSERT_FALSE(statuses.empty());
  EXPECT_EQ(statuses.front(), TaskStatus::Running);
  EXPECT_EQ(statuses.back(), TaskStatus::Finished);
}

TEST_F(SupervisorTest, SilentJobsPersistWithoutPublishing) {
  int published = 0;
  h_.on_control([&] {
    h_.publisher().subscribe_tasks(
        [&published](const TaskChangeEvent &) { ++published; });
  });
  JobBuilder builder(job_id("quiet"));
  builder.silent_tasks().actions(single_action("noop"));
  h_.add_job(std::move(builder).build().value());

  auto t = h_.fire(job_id("quiet"));
  ASSERT_TRUE(t.has_value());
  ASSERT_TRUE(h_.wait_for_status(t->id, TaskStatus::Finished));
  EXPECT_TRUE(h_.stored_task(t->id).has_value());
  EXPECT_EQ(h_.on_control([&] { return published; }), 0);
}
