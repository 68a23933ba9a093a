#pragma once

#include "jobforge/core/coroutine.hpp"
#include "jobforge/core/error.hpp"
#include "jobforge/job/command.hpp"
#include "jobforge/job/events.hpp"
#include "jobforge/job/job.hpp"
#include "jobforge/job/task.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace jobforge {

class JobStore;
class Runtime;
class ScheduleEngine;
class StuckTaskDetector;
class TaskSupervisor;

struct ListJobsRequest {
  /// Empty = every owner.
  std::string owner;
  bool events_only{false};
  bool timers_only{false};
  /// Empty = every job.
  std::vector<JobId> job_ids;
  /// Attach the tasks matching this status to each returned job.
  std::optional<TaskStatus> load_tasks;
  std::size_t tasks_offset{0};
  /// 0 = no limit.
  std::size_t tasks_limit{0};
};

struct DeleteTasksRequest {
  /// Explicit ids win over the status selection.
  std::vector<TaskId> task_ids;
  std::vector<TaskStatus> statuses;
  /// Restricts the status selection to one job. Empty = every job.
  JobId job_id;
  /// Keep this many of the most recent matching tasks per job. 0 = keep none.
  std::size_t prune_limit{0};
};

// Entry point for job and task management. Every operation runs on the
// control shard; the awaitable forms hop there first.
class JobService {
public:
  JobService(Runtime &runtime, JobStore &store, TaskSupervisor &supervisor,
             ScheduleEngine &engine, StuckTaskDetector &detector,
             ChangePublisher &publisher);

  JobService(const JobService &) = delete;
  auto operator=(const JobService &) -> JobService & = delete;

  [[nodiscard]] auto put_job(Job job) -> task<Result<void>>;
  [[nodiscard]] auto get_job(JobId id,
                             std::optional<TaskStatus> load_tasks = std::nullopt)
      -> task<Result<Job>>;
  [[nodiscard]] auto delete_job(JobId id) -> task<Result<void>>;
  /// Removes auto_clean jobs that finished at least once and have nothing
  /// live. Returns how many were removed.
  [[nodiscard]] auto delete_cleanable_jobs() -> task<Result<std::size_t>>;
  [[nodiscard]] auto list_jobs(ListJobsRequest request)
      -> task<Result<std::vector<Job>>>;

  [[nodiscard]] auto put_task(Task task) -> task<Result<void>>;
  [[nodiscard]] auto get_task(TaskId id) -> task<Result<Task>>;
  [[nodiscard]] auto put_tasks(std::vector<Task> batch)
      -> task<Result<std::size_t>>;
  [[nodiscard]] auto list_tasks(JobId job_id,
                                TaskStatus status = TaskStatus::Any)
      -> task<Result<std::vector<Task>>>;
  [[nodiscard]] auto delete_tasks(DeleteTasksRequest request)
      -> task<Result<std::vector<TaskId>>>;

  [[nodiscard]] auto detect_stuck_tasks(std::chrono::system_clock::time_point
                                            since)
      -> task<Result<std::vector<TaskId>>>;
  [[nodiscard]] auto control(CtrlCommand cmd)
      -> task<Result<CtrlCommandResponse>>;

  /// Empty optional when the job is inactive and the trigger is not forced.
  [[nodiscard]] auto trigger(JobTriggerEvent event)
      -> task<Result<std::optional<Task>>>;
  /// Fires every active job listening to `event_name`.
  [[nodiscard]] auto dispatch_event(std::string event_name,
                                    ActionMessage message)
      -> task<Result<std::vector<TaskId>>>;

  // Control shard only.
  [[nodiscard]] auto put_job_local(Job job) -> Result<void>;
  [[nodiscard]] auto delete_job_local(const JobId &id) -> Result<void>;
  [[nodiscard]] auto trigger_local(const JobTriggerEvent &event)
      -> Result<std::optional<Task>>;

private:
  [[nodiscard]] auto get_job_local(const JobId &id,
                                   std::optional<TaskStatus> load_tasks)
      -> Result<Job>;
  [[nodiscard]] auto delete_cleanable_jobs_local() -> Result<std::size_t>;
  [[nodiscard]] auto list_jobs_local(const ListJobsRequest &request)
      -> Result<std::vector<Job>>;
  [[nodiscard]] auto put_task_local(Task task) -> Result<void>;
  [[nodiscard]] auto delete_tasks_local(const DeleteTasksRequest &request)
      -> Result<std::vector<TaskId>>;
  [[nodiscard]] auto dispatch_event_local(const std::string &event_name,
                                          const ActionMessage &message)
      -> Result<std::vector<TaskId>>;
  [[nodiscard]] auto has_live_tasks(const JobId &id) const -> bool;

  Runtime &runtime_;
  JobStore &store_;
  TaskSupervisor &supervisor_;
  ScheduleEngine &engine_;
  StuckTaskDetector &detector_;
  ChangePublisher &publisher_;
};

} // namespace jobforge
