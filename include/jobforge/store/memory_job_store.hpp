#pragma once

#include "jobforge/store/job_store.hpp"

#include <ankerl/unordered_dense.h>

namespace jobforge {

class InMemoryJobStore final : public JobStore {
public:
  [[nodiscard]] auto put_job(Job job) -> Result<void> override;
  [[nodiscard]] auto get_job(const JobId &id) const -> Result<Job> override;
  [[nodiscard]] auto delete_job(const JobId &id) -> Result<void> override;
  [[nodiscard]] auto list_jobs() const -> Result<std::vector<Job>> override;

  [[nodiscard]] auto put_task(Task task) -> Result<void> override;
  [[nodiscard]] auto get_task(const TaskId &id) const -> Result<Task> override;
  [[nodiscard]] auto list_tasks(const JobId &job_id, TaskStatus status) const
      -> Result<std::vector<Task>> override;
  [[nodiscard]] auto delete_task(const TaskId &id) -> Result<void> override;

  [[nodiscard]] auto job_count() const noexcept -> std::size_t {
    return jobs_.size();
  }
  [[nodiscard]] auto task_count() const noexcept -> std::size_t {
    return tasks_.size();
  }

private:
  ankerl::unordered_dense::map<JobId, Job> jobs_;
  ankerl::unordered_dense::map<TaskId, Task> tasks_;
  ankerl::unordered_dense::map<JobId, ankerl::unordered_dense::set<TaskId>>
      tasks_by_job_;
};

} // namespace jobforge
