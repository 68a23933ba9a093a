#include "common.hpp"

#include "jobforge/app/application.hpp"
#include "jobforge/cli/commands.hpp"
#include "jobforge/cli/formatting.hpp"
#include "jobforge/util/json.hpp"
#include "jobforge/util/log.hpp"
#include "jobforge/util/time.hpp"

#include <chrono>
#include <format>
#include <print>

namespace jobforge::cli {

namespace {

auto task_to_json(const Task &task) -> JsonValue {
  JsonValue logs = std::vector<JsonValue>{};
  for (const auto &entry : task.action_logs) {
    const auto *out = entry.output.last_output();
    JsonValue item{
        {"action", entry.action_id.str()},
        {"branch", entry.branch},
        {"success", out == nullptr || out->success},
    };
    if (out != nullptr) {
      item.get_object().emplace("ignored", out->ignored);
      item.get_object().emplace("elapsed_ms",
                                static_cast<std::int64_t>(out->elapsed.count()));
      if (!out->error_string.empty()) {
        item.get_object().emplace("error", out->error_string);
      }
      if (!out->string_body.empty()) {
        item.get_object().emplace("body", out->string_body);
      }
    }
    logs.get_array().emplace_back(std::move(item));
  }
  return JsonValue{
      {"task_id", task.id.str()},
      {"job_id", task.job_id.str()},
      {"status", std::string(to_string_view(task.status))},
      {"message", task.status_message},
      {"progress", static_cast<double>(task.progress)},
      {"start_time", util::format_iso8601(task.start_time)},
      {"end_time", util::format_iso8601(task.end_time)},
      {"logs", std::move(logs)},
  };
}

} // namespace

auto cmd_run(const RunOptions &opts) -> int {
  log::set_output_stderr();

  auto config_res = load_config_or_print(opts.config_file);
  if (!config_res) {
    return 1;
  }
  auto config = std::move(*config_res);
  resolve_paths(config, opts.config_file);
  // A one-shot run never sweeps or fires timers of other jobs.
  config.scheduler.stuck_sweep_interval_sec = 0;

  Application app(std::move(config));
  if (auto r = app.init(); !r) {
    std::println(stderr, "Error: Initialization failed: {}",
                 r.error().message());
    return 1;
  }
  if (auto r = app.start(); !r) {
    std::println(stderr, "Error: Failed to start: {}", r.error().message());
    return 1;
  }
  app.scheduler().engine().stop();

  auto task = app.run_job_blocking(JobId{opts.job_id},
                                   std::chrono::seconds(opts.timeout_sec));
  app.stop();

  if (!task) {
    if (task.error() == make_error_code(Error::NotFound)) {
      std::println(stderr,
                   "Error: Job '{}' not found, or removed by auto_clean",
                   opts.job_id);
    } else {
      std::println(stderr, "Error: Run of '{}' failed: {}", opts.job_id,
                   task.error().message());
    }
    return 1;
  }

  if (opts.json) {
    std::println("{}", dump_json(task_to_json(*task)));
  } else {
    std::println("Task {} of job {}: {}", task->id, task->job_id,
                 fmt::status(task->status));
    if (!task->status_message.empty()) {
      std::println("  {}", task->status_message);
    }
    for (const auto &entry : task->action_logs) {
      const auto *out = entry.output.last_output();
      if (out == nullptr) {
        continue;
      }
      std::println("  [{}] {} {} ({}ms){}", entry.branch, entry.action_id,
                   out->success ? fmt::ansi::green("ok")
                                : fmt::ansi::red("failed"),
                   out->elapsed.count(),
                   out->error_string.empty()
                       ? std::string{}
                       : std::format(": {}", out->error_string));
    }
  }
  return task->status == TaskStatus::Finished ? 0 : 1;
}

} // namespace jobforge::cli
