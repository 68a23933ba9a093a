#pragma once

#include "jobforge/job/job.hpp"
#include "jobforge/scheduler/schedule.hpp"
#include "jobforge/util/id.hpp"

#include <variant>

namespace jobforge {

struct AddJobEvent {
  JobId job_id;
  Schedule schedule;
  ParsedSchedule parsed;
};

struct RemoveJobEvent {
  JobId job_id;
};

struct ShutdownEvent {};

using SchedulerEvent = std::variant<AddJobEvent, RemoveJobEvent, ShutdownEvent>;

} // namespace jobforge
