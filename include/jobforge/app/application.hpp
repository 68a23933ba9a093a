#pragma once

#include "jobforge/action/chain_executor.hpp"
#include "jobforge/action/handler.hpp"
#include "jobforge/app/services/job_service.hpp"
#include "jobforge/app/services/scheduler_service.hpp"
#include "jobforge/config/system_config.hpp"
#include "jobforge/core/coroutine.hpp"
#include "jobforge/core/error.hpp"
#include "jobforge/core/runtime.hpp"
#include "jobforge/job/events.hpp"
#include "jobforge/selector/glob_evaluator.hpp"
#include "jobforge/selector/memory_catalog.hpp"
#include "jobforge/selector/resolver.hpp"
#include "jobforge/store/memory_job_store.hpp"
#include "jobforge/supervisor/stuck_detector.hpp"
#include "jobforge/supervisor/task_supervisor.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <string_view>

namespace jobforge {

// Application facade - wires the runtime, catalogue, executor, supervisor,
// scheduler and job service together.
class Application {
public:
  explicit Application(SystemConfig config = {});
  ~Application();

  Application(const Application &) = delete;
  auto operator=(const Application &) -> Application & = delete;

  [[nodiscard]] auto config() const noexcept -> const SystemConfig & {
    return config_;
  }

  /// Loads the catalogue file, if configured. Call before start().
  [[nodiscard]] auto init() -> Result<void>;
  /// Starts the runtime and services, then loads the job directory.
  [[nodiscard]] auto start() -> Result<void>;
  auto stop() noexcept -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load(std::memory_order_acquire);
  }

  /// Stores every job definition found in `directory`. Returns how many
  /// were accepted.
  [[nodiscard]] auto load_jobs_from_directory(std::string_view directory)
      -> Result<std::size_t>;

  /// Fires the job once and blocks until its task settles or `timeout`
  /// passes (Timeout).
  [[nodiscard]] auto run_job_blocking(const JobId &job_id,
                                      std::chrono::milliseconds timeout)
      -> Result<Task>;

  /// Runs `op` on the control shard and blocks the caller until it is done.
  template <typename T> auto block_on(task<T> op) -> T {
    return runtime_.sync_wait(std::move(op), kControlShard);
  }

  [[nodiscard]] auto jobs() noexcept -> JobService & { return jobs_; }
  [[nodiscard]] auto actions() noexcept -> ActionRegistry & {
    return registry_;
  }
  [[nodiscard]] auto catalog() noexcept -> InMemoryCatalog & {
    return catalog_;
  }
  [[nodiscard]] auto publisher() noexcept -> ChangePublisher & {
    return publisher_;
  }
  [[nodiscard]] auto supervisor() noexcept -> TaskSupervisor & {
    return supervisor_;
  }
  [[nodiscard]] auto scheduler() noexcept -> SchedulerService & {
    return scheduler_;
  }
  [[nodiscard]] auto runtime() noexcept -> Runtime & { return runtime_; }

private:
  auto setup_callbacks() -> void;

  std::atomic<bool> running_{false};
  SystemConfig config_;

  // Core runtime
  Runtime runtime_;

  InMemoryCatalog catalog_;
  GlobQueryEvaluator evaluator_;
  SelectorResolver resolver_;
  ActionRegistry registry_;
  ActionChainExecutor executor_;

  InMemoryJobStore store_;
  ChangePublisher publisher_;
  TaskSupervisor supervisor_;
  SchedulerService scheduler_;
  StuckTaskDetector detector_;
  JobService jobs_;
};

} // namespace jobforge
