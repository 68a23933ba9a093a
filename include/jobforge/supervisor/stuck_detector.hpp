#pragma once

#include "jobforge/core/coroutine.hpp"
#include "jobforge/core/error.hpp"
#include "jobforge/util/id.hpp"

#include <chrono>
#include <vector>

namespace jobforge {

class JobStore;
class Runtime;
class TaskSupervisor;

// Interrupts Running tasks whose last update is older than a cutoff. Live
// tasks are interrupted through the supervisor so their slot is released;
// stored Running records with no live task behind them are repaired in place.
class StuckTaskDetector {
public:
  using TimePoint = std::chrono::system_clock::time_point;

  StuckTaskDetector(Runtime &runtime, TaskSupervisor &supervisor,
                    JobStore &store);

  [[nodiscard]] auto sweep(TimePoint since) -> task<Result<std::vector<TaskId>>>;
  /// Control shard only.
  [[nodiscard]] auto sweep_local(TimePoint since)
      -> Result<std::vector<TaskId>>;

private:
  Runtime &runtime_;
  TaskSupervisor &supervisor_;
  JobStore &store_;
};

} // namespace jobforge
