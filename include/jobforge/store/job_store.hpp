#pragma once

#include "jobforge/core/error.hpp"
#include "jobforge/job/job.hpp"
#include "jobforge/job/task.hpp"
#include "jobforge/util/id.hpp"

#include <vector>

namespace jobforge {

// Persistence of job and task records. Implementations are used from the
// control shard only.
class JobStore {
public:
  virtual ~JobStore() = default;

  /// Insert or replace. The transient task list is not stored.
  [[nodiscard]] virtual auto put_job(Job job) -> Result<void> = 0;
  [[nodiscard]] virtual auto get_job(const JobId &id) const -> Result<Job> = 0;
  /// Removes the job and every task recorded for it.
  [[nodiscard]] virtual auto delete_job(const JobId &id) -> Result<void> = 0;
  /// Ordered by job id.
  [[nodiscard]] virtual auto list_jobs() const -> Result<std::vector<Job>> = 0;

  /// Insert or replace. NotFound when the parent job is unknown.
  [[nodiscard]] virtual auto put_task(Task task) -> Result<void> = 0;
  [[nodiscard]] virtual auto get_task(const TaskId &id) const
      -> Result<Task> = 0;
  /// An empty job id lists tasks of every job. Ordered by start time.
  [[nodiscard]] virtual auto list_tasks(const JobId &job_id,
                                        TaskStatus status) const
      -> Result<std::vector<Task>> = 0;
  [[nodiscard]] virtual auto delete_task(const TaskId &id) -> Result<void> = 0;
};

} // namespace jobforge
