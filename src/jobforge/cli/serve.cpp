#include "common.hpp"

#include "jobforge/app/application.hpp"
#include "jobforge/cli/commands.hpp"
#include "jobforge/util/log.hpp"
#include "jobforge/util/signal.hpp"

#include <print>
#include <string>

namespace jobforge::cli {

auto cmd_serve(const ServeOptions &opts) -> int {
  auto config_res = load_config_or_print(opts.config_file);
  if (!config_res) {
    return 1;
  }
  auto config = std::move(*config_res);
  resolve_paths(config, opts.config_file);

  if (opts.log_level.has_value()) {
    if (!log::parse_level(*opts.log_level)) {
      std::println(stderr, "Error: Unknown log level: {}", *opts.log_level);
      return 1;
    }
    config.scheduler.log_level = *opts.log_level;
  }
  if (opts.shards.has_value()) {
    if (*opts.shards < 0) {
      std::println(stderr, "Error: --shards must not be negative");
      return 1;
    }
    config.scheduler.shards = *opts.shards;
  }

  const auto log_file = opts.log_file.value_or(config.scheduler.log_file);
  if (!log_file.empty() && !log::set_output_file(log_file)) {
    std::println(stderr, "Error: Failed to open log file: {}", log_file);
    return 1;
  }
  log::set_level(config.scheduler.log_level);
  log::start();

  Application app(std::move(config));
  if (auto r = app.init(); !r) {
    log::error("Initialization failed: {}", r.error().message());
    log::stop();
    return 1;
  }
  if (auto r = app.start(); !r) {
    log::error("Failed to start: {}", r.error().message());
    log::stop();
    return 1;
  }

  setup_signal_handlers();
  log::info("jobforge serving jobs from {}", app.config().job_source.directory);

  wait_for_shutdown();
  app.stop();
  log::info("jobforge shut down");
  log::stop();
  return 0;
}

} // namespace jobforge::cli
