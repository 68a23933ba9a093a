#include "jobforge/store/memory_job_store.hpp"

#include "test_utils.hpp"

#include <chrono>

#include "gtest/gtest.h"

using namespace jobforge;
using namespace jobforge::test;
using namespace std::chrono_literals;

namespace {

auto task_at(std::string id, std::string_view job, TaskStatus status,
             std::chrono::system_clock::time_point start) -> Task {
  return Task{.id = TaskId{std::move(id)},
              .job_id = job_id(job),
              .status = status,
              .start_time = start};
}

} // namespace

TEST(MemoryJobStoreTest, JobsAreListedById) {
  InMemoryJobStore store;
  ASSERT_TRUE(store.put_job(make_job("zeta", single_action("log"))).has_value());
  ASSERT_TRUE(store.put_job(make_job("alpha", single_action("log"))).has_value());

  auto jobs = store.list_jobs();
  ASSERT_TRUE(jobs.has_value());
  ASSERT_EQ(jobs->size(), 2U);
  EXPECT_EQ((*jobs)[0].id, job_id("alpha"));
  EXPECT_EQ((*jobs)[1].id, job_id("zeta"));
}

TEST(MemoryJobStoreTest, PutJobReplacesAndDropsTasks) {
  InMemoryJobStore store;
  auto job = make_job("j", single_action("log"));
  job.tasks.push_back(Task{.id = TaskId{"t"}, .job_id = job.id});
  ASSERT_TRUE(store.put_job(job).has_value());
  EXPECT_TRUE(store.get_job(job.id)->tasks.empty());

  job.label = "renamed";
  ASSERT_TRUE(store.put_job(job).has_value());
  EXPECT_EQ(store.get_job(job.id)->label, "renamed");
  EXPECT_EQ(store.put_job(Job{}).error(),
            make_error_code(Error::InvalidArgument));
}

TEST(MemoryJobStoreTest, TasksNeedTheirJob) {
  InMemoryJobStore store;
  EXPECT_EQ(store.put_task(task_at("t", "ghost", TaskStatus::Idle, {}))
                .error(),
            make_error_code(Error::NotFound));
}

TEST(MemoryJobStoreTest, TasksListedByStartTimeThenId) {
  InMemoryJobStore store;
  ASSERT_TRUE(store.put_job(make_job("a", single_action("log"))).has_value());
  ASSERT_TRUE(store.put_job(make_job("b", single_action("log"))).has_value());
  const auto t0 = std::chrono::system_clock::now();
  ASSERT_TRUE(store.put_task(task_at("late", "a", TaskStatus::Finished, t0 + 2s))
                  .has_value());
  ASSERT_TRUE(store.put_task(task_at("y", "a", TaskStatus::Error, t0))
                  .has_value());
  ASSERT_TRUE(store.put_task(task_at("x", "a", TaskStatus::Finished, t0))
                  .has_value());
  ASSERT_TRUE(store.put_task(task_at("other", "b", TaskStatus::Finished, t0 + 1s))
                  .has_value());

  auto of_a = store.list_tasks(job_id("a"), TaskStatus::Any);
  ASSERT_TRUE(of_a.has_value());
  ASSERT_EQ(of_a->size(), 3U);
  EXPECT_EQ((*of_a)[0].id, TaskId{"x"});
  EXPECT_EQ((*of_a)[1].id, TaskId{"y"});
  EXPECT_EQ((*of_a)[2].id, TaskId{"late"});

  auto finished = store.list_tasks(JobId{}, TaskStatus::Finished);
  ASSERT_TRUE(finished.has_value());
  ASSERT_EQ(finished->size(), 3U);
  EXPECT_EQ((*finished)[1].id, TaskId{"other"});
}

TEST(MemoryJobStoreTest, DeleteJobCascadesToTasks) {
  InMemoryJobStore store;
  ASSERT_TRUE(store.put_job(make_job("a", single_action("log"))).has_value());
  ASSERT_TRUE(
      store.put_task(task_at("t", "a", TaskStatus::Finished, {})).has_value());

  ASSERT_TRUE(store.delete_job(job_id("a")).has_value());
  EXPECT_EQ(store.get_task(TaskId{"t"}).error(),
            make_error_code(Error::NotFound));
  EXPECT_EQ(store.delete_job(job_id("a")).error(),
            make_error_code(Error::NotFound));
  EXPECT_EQ(store.delete_task(TaskId{"t"}).error(),
            make_error_code(Error::NotFound));
}
