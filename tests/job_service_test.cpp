#include "jobforge/app/services/job_service.hpp"

#include "test_utils.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

using namespace jobforge;
using namespace jobforge::test;
using namespace std::chrono_literals;

namespace {

class JobServiceTest : public ::testing::Test {
protected:
  void SetUp() override { h_.start(); }

  auto jobs() -> JobService & { return h_.jobs(); }

  auto put(Job job) -> Result<void> {
    return h_.block_on(jobs().put_job(std::move(job)));
  }

  static auto finished_task(const JobId &job, int n,
                            std::chrono::system_clock::time_point base)
      -> Task {
    return Task{.id = TaskId{std::format("{}-t{}", job.value(), n)},
                .job_id = job,
                .status = TaskStatus::Finished,
                .status_message = "finished",
                .start_time = base + std::chrono::seconds(n),
                .end_time = base + std::chrono::seconds(n) + 500ms,
                .progress = 1.0F};
  }

  Harness h_;
};

} // namespace

TEST_F(JobServiceTest, PutJobValidates) {
  Job bad;
  EXPECT_EQ(put(bad).error(), make_error_code(Error::InvalidArgument));

  Job orphan_delta{.id = JobId{"delta"}};
  orphan_delta.schedule = Schedule{.iso8601_min_delta = "PT1M"};
  EXPECT_EQ(put(orphan_delta).error(),
            make_error_code(Error::ConfigurationError));
}

TEST_F(JobServiceTest, PutJobDropsTransientTasks) {
  auto job = make_job("j", single_action("noop"));
  job.tasks.push_back(Task{.id = TaskId{"x"}, .job_id = job.id});
  ASSERT_TRUE(put(job).has_value());

  auto stored = h_.block_on(jobs().get_job(job_id("j")));
  ASSERT_TRUE(stored.has_value());
  EXPECT_TRUE(stored->tasks.empty());
  EXPECT_EQ(h_.block_on(jobs().get_task(TaskId{"x"})).error(),
            make_error_code(Error::NotFound));
}

TEST_F(JobServiceTest, GetJobCanAttachTasks) {
  ASSERT_TRUE(put(make_job("j", single_action("noop"))).has_value());
  const auto base = std::chrono::system_clock::now() - 1h;
  ASSERT_TRUE(h_.block_on(jobs().put_task(finished_task(job_id("j"), 1, base)))
                  .has_value());

  auto bare = h_.block_on(jobs().get_job(job_id("j")));
  ASSERT_TRUE(bare.has_value());
  EXPECT_TRUE(bare->tasks.empty());

  auto loaded = h_.block_on(jobs().get_job(job_id("j"), TaskStatus::Any));
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->tasks.size(), 1U);

  EXPECT_EQ(h_.block_on(jobs().get_job(job_id("missing"))).error(),
            make_error_code(Error::NotFound));
}

TEST_F(JobServiceTest, ListJobsFilters) {
  JobBuilder evented(job_id("a-events"));
  evented.owner("alice").on_event("node.created").actions(
      single_action("noop"));
  JobBuilder timed(job_id("b-timer"));
  timed.owner("bob").schedule("R/PT1H").actions(single_action("noop"));
  JobBuilder plain(job_id("c-plain"));
  plain.owner("alice").actions(single_action("noop"));
  ASSERT_TRUE(put(std::move(evented).build().value()).has_value());
  ASSERT_TRUE(put(std::move(timed).build().value()).has_value());
  ASSERT_TRUE(put(std::move(plain).build().value()).has_value());

  auto ids = [](const std::vector<Job> &list) {
    std::vector<std::string> out;
    for (const auto &j : list) {
      out.emplace_back(j.id.value());
    }
    return out;
  };

  auto all = h_.block_on(jobs().list_jobs({}));
  ASSERT_TRUE(all.has_value());
  EXPECT_EQ(ids(*all),
            (std::vector<std::string>{"a-events", "b-timer", "c-plain"}));

  auto by_owner = h_.block_on(jobs().list_jobs({.owner = "alice"}));
  EXPECT_EQ(ids(*by_owner),
            (std::vector<std::string>{"a-events", "c-plain"}));

  auto events = h_.block_on(jobs().list_jobs({.events_only = true}));
  EXPECT_EQ(ids(*events), (std::vector<std::string>{"a-events"}));

  auto timers = h_.block_on(jobs().list_jobs({.timers_only = true}));
  EXPECT_EQ(ids(*timers), (std::vector<std::string>{"b-timer"}));

  auto picked = h_.block_on(
      jobs().list_jobs({.job_ids = {job_id("c-plain"), job_id("zzz")}}));
  EXPECT_EQ(ids(*picked), (std::vector<std::string>{"c-plain"}));
}

TEST_F(JobServiceTest, ListJobsPagesAttachedTasks) {
  const auto id = job_id("paged");
  ASSERT_TRUE(put(make_job("paged", single_action("noop"))).has_value());
  const auto base = std::chrono::system_clock::now() - 1h;
  std::vector<Task> batch;
  for (int i = 0; i < 4; ++i) {
    batch.push_back(finished_task(id, i, base));
  }
  auto stored = h_.block_on(jobs().put_tasks(batch));
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(*stored, 4U);

  auto page = h_.block_on(jobs().list_jobs({.load_tasks = TaskStatus::Finished,
                                            .tasks_offset = 1,
                                            .tasks_limit = 2}));
  ASSERT_TRUE(page.has_value());
  ASSERT_EQ(page->size(), 1U);
  ASSERT_EQ(page->front().tasks.size(), 2U);
  EXPECT_EQ(page->front().tasks[0].id, batch[1].id);
  EXPECT_EQ(page->front().tasks[1].id, batch[2].id);
}

TEST_F(JobServiceTest, PutTaskRequiresKnownJob) {
  const auto base = std::chrono::system_clock::now();
  EXPECT_EQ(
      h_.block_on(jobs().put_task(finished_task(job_id("ghost"), 1, base)))
          .error(),
      make_error_code(Error::NotFound));
}

TEST_F(JobServiceTest, PutTaskRefusesLiveTask) {
  ASSERT_TRUE(put(make_job("live", single_action("gate"))).has_value());
  auto t = h_.fire(job_id("live"));
  ASSERT_TRUE(t.has_value());

  auto overwrite = *t;
  overwrite.status = TaskStatus::Finished;
  EXPECT_EQ(h_.block_on(jobs().put_task(overwrite)).error(),
            make_error_code(Error::InvalidState));
  EXPECT_EQ(h_.status_of(t->id), TaskStatus::Running);
}

TEST_F(JobServiceTest, PruneKeepsMostRecentTasks) {
  const auto id = job_id("prune");
  ASSERT_TRUE(put(make_job("prune", single_action("noop"))).has_value());
  const auto base = std::chrono::system_clock::now() - 1h;
  std::vector<Task> batch;
  for (int i = 0; i < 8; ++i) {
    batch.push_back(finished_task(id, i, base));
  }
  // An errored task is outside the status selection.
  auto errored = finished_task(id, 100, base);
  errored.id = TaskId{"prune-error"};
  errored.status = TaskStatus::Error;
  batch.push_back(errored);
  ASSERT_TRUE(h_.block_on(jobs().put_tasks(batch)).has_value());

  auto deleted = h_.block_on(
      jobs().delete_tasks({.statuses = {TaskStatus::Finished},
                           .job_id = id,
                           .prune_limit = 5}));
  ASSERT_TRUE(deleted.has_value());
  std::vector<TaskId> expected{batch[0].id, batch[1].id, batch[2].id};
  auto got = *deleted;
  std::ranges::sort(got);
  EXPECT_EQ(got, expected);

  auto left = h_.block_on(jobs().list_tasks(id, TaskStatus::Finished));
  ASSERT_TRUE(left.has_value());
  ASSERT_EQ(left->size(), 5U);
  for (const auto &t : *left) {
    EXPECT_GE(t.end_time, batch[3].end_time);
  }
  EXPECT_TRUE(h_.block_on(jobs().get_task(errored.id)).has_value());
}

TEST_F(JobServiceTest, DeleteTasksByIdSkipsLiveTasks) {
  const auto id = job_id("mixed");
  ASSERT_TRUE(put(make_job("mixed", single_action("gate"))).has_value());
  const auto base = std::chrono::system_clock::now() - 1h;
  auto old = finished_task(id, 1, base);
  ASSERT_TRUE(h_.block_on(jobs().put_task(old)).has_value());
  auto live = h_.fire(id);
  ASSERT_TRUE(live.has_value());

  auto deleted =
      h_.block_on(jobs().delete_tasks({.task_ids = {old.id, live->id}}));
  ASSERT_TRUE(deleted.has_value());
  EXPECT_EQ(*deleted, std::vector<TaskId>{old.id});
  EXPECT_EQ(h_.status_of(live->id), TaskStatus::Running);

  EXPECT_EQ(h_.block_on(jobs().delete_tasks({})).error(),
            make_error_code(Error::InvalidArgument));
}

TEST_F(JobServiceTest, TriggerSkipsInactiveJobUnlessForced) {
  JobBuilder builder(job_id("sleeping"));
  builder.inactive().actions(single_action("noop"));
  ASSERT_TRUE(put(std::move(builder).build().value()).has_value());

  auto skipped =
      h_.block_on(jobs().trigger({.job_id = job_id("sleeping")}));
  ASSERT_TRUE(skipped.has_value());
  EXPECT_FALSE(skipped->has_value());

  auto forced = h_.block_on(
      jobs().trigger({.job_id = job_id("sleeping"), .run_now = true}));
  ASSERT_TRUE(forced.has_value());
  ASSERT_TRUE(forced->has_value());
  EXPECT_EQ((*forced)->trigger_owner, "run_now");

  EXPECT_EQ(h_.block_on(jobs().trigger({.job_id = job_id("none")})).error(),
            make_error_code(Error::NotFound));
}

TEST_F(JobServiceTest, DispatchEventFiresListeningActiveJobs) {
  std::vector<std::string> seen_paths;
  h_.registry().register_function(
      "collect", [&seen_paths](const ActionContext &,
                               ActionMessage input)
                     -> task<Result<ActionMessage>> {
        for (const auto &n : input.nodes) {
          seen_paths.push_back(n.path);
        }
        co_return ok(std::move(input));
      });

  JobBuilder listener(job_id("listener"));
  listener.on_event("node.created").actions(single_action("collect"));
  JobBuilder deaf(job_id("deaf"));
  deaf.on_event("node.deleted").actions(single_action("noop"));
  JobBuilder asleep(job_id("asleep"));
  asleep.on_event("node.created").inactive().actions(single_action("noop"));
  ASSERT_TRUE(put(std::move(listener).build().value()).has_value());
  ASSERT_TRUE(put(std::move(deaf).build().value()).has_value());
  ASSERT_TRUE(put(std::move(asleep).build().value()).has_value());

  ActionMessage message;
  message.nodes = {node("/incoming/file")};
  auto fired =
      h_.block_on(jobs().dispatch_event("node.created", std::move(message)));
  ASSERT_TRUE(fired.has_value());
  ASSERT_EQ(fired->size(), 1U);

  ASSERT_TRUE(h_.wait_for_status(fired->front(), TaskStatus::Finished));
  auto task = h_.stored_task(fired->front());
  EXPECT_EQ(task->job_id, job_id("listener"));
  EXPECT_EQ(task->trigger_owner, "node.created");
  EXPECT_EQ(seen_paths, std::vector<std::string>{"/incoming/file"});
}

TEST_F(JobServiceTest, ConcurrentTriggersAndEventsShareTheCeiling) {
  constexpr int kLimit = 2;
  constexpr int kRounds = 6;
  JobBuilder builder(job_id("busy"));
  builder.on_event("node.created").max_concurrency(kLimit).actions(
      single_action("gate"));
  ASSERT_TRUE(put(std::move(builder).build().value()).has_value());

  std::mutex mu;
  std::vector<TaskId> fired;
  auto record = [&](TaskId id) {
    std::lock_guard lock(mu);
    fired.push_back(std::move(id));
  };
  {
    std::vector<std::jthread> sources;
    for (int i = 0; i < 2; ++i) {
      sources.emplace_back([&] {
        for (int n = 0; n < kRounds; ++n) {
          auto t = h_.block_on(jobs().trigger({.job_id = job_id("busy")}));
          if (t && *t) {
            record((*t)->id);
          }
        }
      });
      sources.emplace_back([&] {
        for (int n = 0; n < kRounds; ++n) {
          auto ids = h_.block_on(
              jobs().dispatch_event("node.created", ActionMessage{}));
          if (ids) {
            for (auto &id : *ids) {
              record(std::move(id));
            }
          }
        }
      });
    }
  }

  ASSERT_EQ(fired.size(), static_cast<std::size_t>(4 * kRounds));
  ASSERT_TRUE(
      poll_until([&] { return h_.gate().entered() >= kLimit; }, 5s));
  EXPECT_EQ(h_.running_count(job_id("busy")), kLimit);

  h_.gate().open();
  for (const auto &id : fired) {
    ASSERT_TRUE(h_.wait_for_status(id, TaskStatus::Finished));
  }
  EXPECT_LE(h_.gate().max_inside(), kLimit);
  EXPECT_EQ(h_.gate().entered(), 4 * kRounds);
  EXPECT_EQ(h_.running_count(job_id("busy")), 0);
}

TEST_F(JobServiceTest, AutoStartFiresOnFirstStoreOnly) {
  const auto id = job_id("starter");
  JobBuilder builder(id);
  builder.auto_start().actions(single_action("gate"));
  auto job = std::move(builder).build().value();
  ASSERT_TRUE(put(job).has_value());
  ASSERT_TRUE(put(job).has_value());

  auto tasks = h_.block_on(jobs().list_tasks(id));
  ASSERT_TRUE(tasks.has_value());
  ASSERT_EQ(tasks->size(), 1U);
  EXPECT_EQ(tasks->front().trigger_owner, "auto_start");
}

TEST_F(JobServiceTest, DeleteJobStopsLiveTasks) {
  const auto id = job_id("doomed");
  ASSERT_TRUE(put(make_job("doomed", single_action("gate"))).has_value());
  auto t = h_.fire(id);
  ASSERT_TRUE(t.has_value());

  std::vector<JobId> removed;
  h_.on_control([&] {
    h_.publisher().subscribe_jobs([&removed](const JobChangeEvent &e) {
      if (!e.removed.empty()) {
        removed.push_back(e.removed);
      }
    });
  });

  ASSERT_TRUE(h_.block_on(jobs().delete_job(id)).has_value());
  EXPECT_EQ(h_.running_count(id), 0);
  EXPECT_FALSE(h_.on_control([&] { return h_.supervisor().is_live(t->id); }));
  EXPECT_EQ(h_.block_on(jobs().get_job(id)).error(),
            make_error_code(Error::NotFound));
  EXPECT_EQ(h_.block_on(jobs().get_task(t->id)).error(),
            make_error_code(Error::NotFound));
  EXPECT_EQ(h_.on_control([&] { return removed; }), std::vector<JobId>{id});

  EXPECT_EQ(h_.block_on(jobs().delete_job(id)).error(),
            make_error_code(Error::NotFound));
}

TEST_F(JobServiceTest, DeleteCleanableJobs) {
  const auto base = std::chrono::system_clock::now() - 1h;

  JobBuilder cleanable(job_id("cleanable"));
  cleanable.auto_clean().actions(single_action("noop"));
  JobBuilder never_ran(job_id("never-ran"));
  never_ran.auto_clean().actions(single_action("noop"));
  ASSERT_TRUE(put(std::move(cleanable).build().value()).has_value());
  ASSERT_TRUE(put(std::move(never_ran).build().value()).has_value());
  ASSERT_TRUE(put(make_job("keeper", single_action("noop"))).has_value());

  ASSERT_TRUE(h_.block_on(jobs().put_task(
                              finished_task(job_id("cleanable"), 1, base)))
                  .has_value());
  ASSERT_TRUE(
      h_.block_on(jobs().put_task(finished_task(job_id("keeper"), 1, base)))
          .has_value());

  auto removed = h_.block_on(jobs().delete_cleanable_jobs());
  ASSERT_TRUE(removed.has_value());
  EXPECT_EQ(*removed, 1U);
  EXPECT_FALSE(h_.block_on(jobs().get_job(job_id("cleanable"))).has_value());
  EXPECT_TRUE(h_.block_on(jobs().get_job(job_id("never-ran"))).has_value());
  EXPECT_TRUE(h_.block_on(jobs().get_job(job_id("keeper"))).has_value());
}

TEST_F(JobServiceTest, ControlForwardsToSupervisor) {
  ASSERT_TRUE(put(make_job("ctl", single_action("noop"))).has_value());
  auto r = h_.block_on(jobs().control(
      {.cmd = Command::Inactive, .job_id = job_id("ctl")}));
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->msg, "job ctl inactive");
}

TEST_F(JobServiceTest, ScheduledJobIsRegisteredWithEngine) {
  JobBuilder builder(job_id("timed"));
  builder.schedule("R/PT1H").actions(single_action("noop"));
  ASSERT_TRUE(put(std::move(builder).build().value()).has_value());
  ASSERT_TRUE(poll_until(
      [&] {
        return h_.on_control([&] {
          return h_.engine().next_fire_time(job_id("timed")).has_value();
        });
      },
      2s));

  // Replacing the job without a schedule drops its timer.
  ASSERT_TRUE(put(make_job("timed", single_action("noop"))).has_value());
  ASSERT_TRUE(poll_until(
      [&] {
        return h_.on_control(
            [&] { return h_.engine().scheduled_count() == 0; });
      },
      2s));
}

TEST_F(JobServiceTest, MalformedScheduleStillStoresJob) {
  JobBuilder builder(job_id("broken"));
  builder.schedule("every tuesday").actions(single_action("noop"));
  ASSERT_TRUE(put(std::move(builder).build().value()).has_value());
  EXPECT_TRUE(h_.block_on(jobs().get_job(job_id("broken"))).has_value());
  EXPECT_EQ(h_.on_control([&] { return h_.engine().scheduled_count(); }), 0U);
}
