#pragma once

#include "jobforge/util/enum.hpp"
#include "jobforge/util/id.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <string>

namespace jobforge {

enum class Command : std::uint8_t {
  None,
  Pause,
  Resume,
  Stop,
  Delete,
  RunOnce,
  Inactive,
  Active,
};
BOOST_DESCRIBE_ENUM(Command, None, Pause, Resume, Stop, Delete, RunOnce,
                    Inactive, Active)
JOBFORGE_DEFINE_ENUM_SERDE(Command)

/// Commands addressed to tasks rather than to the job itself.
[[nodiscard]] constexpr bool is_task_command(Command c) noexcept {
  return c == Command::Pause || c == Command::Resume || c == Command::Stop ||
         c == Command::Delete;
}

struct CtrlCommand {
  Command cmd{Command::None};
  JobId job_id;
  TaskId task_id;
  std::string owner_id;
};

struct CtrlCommandResponse {
  std::string msg;
};

} // namespace jobforge
