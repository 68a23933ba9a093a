#include "jobforge/cli/commands.hpp"
#include "jobforge/util/log.hpp"

#include <CLI/CLI.hpp>

#include <cstdlib> // getenv
#include <string>

namespace {
auto default_config() -> std::string {
  if (const char *env = std::getenv("JOBFORGE_CONFIG"); env && *env) {
    return env;
  }
  return {};
}
} // namespace

int main(int argc, char *argv[]) {
  // Keep non-serve CLI output clean by default.
  jobforge::log::set_output_stderr();
  jobforge::log::set_level(jobforge::log::Level::Warn);

  CLI::App app{"jobforge", "Event and schedule driven job runner"};
  app.require_subcommand(1);
  app.footer("\nExamples:\n"
             "  jobforge serve -c jobforge.toml\n"
             "  jobforge run -c jobforge.toml nightly_scan\n"
             "  jobforge schedule R5/2024-01-01T00:00:00Z/PT1H\n"
             "\nTip: Set JOBFORGE_CONFIG=jobforge.toml to skip -c on every "
             "command.");

  const std::string env_config = default_config();

  jobforge::cli::ServeOptions serve_opts;
  auto *serve = app.add_subcommand("serve", "Run the scheduler until SIGTERM");
  serve_opts.config_file = env_config;
  auto *serve_cfg = serve
                        ->add_option("-c,--config", serve_opts.config_file,
                                     "System config file")
                        ->check(CLI::ExistingFile);
  if (env_config.empty())
    serve_cfg->required();
  serve->add_option("--log-file", serve_opts.log_file, "Log file path");
  serve->add_option("--log-level", serve_opts.log_level,
                    "Log level override: trace|debug|info|warn|error");
  serve->add_option("--shards", serve_opts.shards,
                    "Number of shards (default: auto-detect CPU cores)");
  serve->callback(
      [&serve_opts]() { std::exit(jobforge::cli::cmd_serve(serve_opts)); });

  jobforge::cli::ValidateOptions validate_opts;
  auto *validate = app.add_subcommand(
      "validate", "Validate job definitions and the catalogue");
  validate->footer("\nExamples:\n"
                   "  jobforge validate -c jobforge.toml\n"
                   "  jobforge validate -f jobs/nightly_scan.toml --json");
  validate_opts.config_file = env_config;
  auto *validate_cfg =
      validate->add_option("-c,--config", validate_opts.config_file,
                           "System config file");
  auto *validate_file = validate->add_option("-f,--file", validate_opts.file,
                                             "Validate a single job file");
  validate_cfg->excludes(validate_file);
  validate->add_flag("--json", validate_opts.json, "Output JSON");
  validate->callback([&validate_opts]() {
    if (!validate_opts.file && validate_opts.config_file.empty()) {
      throw CLI::ValidationError("validate", "either -c or -f is required");
    }
    std::exit(jobforge::cli::cmd_validate(validate_opts));
  });

  jobforge::cli::ScheduleOptions schedule_opts;
  auto *schedule = app.add_subcommand(
      "schedule", "Print the upcoming firings of an ISO-8601 schedule");
  schedule->footer("\nExamples:\n"
                   "  jobforge schedule R/PT15M --count 4\n"
                   "  jobforge schedule R3/2024-01-01T00:00:00Z/PT1S "
                   "--min-delta PT2S --after 2023-12-31T00:00:00Z");
  schedule->add_option("schedule", schedule_opts.schedule,
                       "Repeating interval, e.g. R5/2024-01-01T00:00:00Z/PT1H")
      ->required();
  schedule->add_option("--min-delta", schedule_opts.min_delta,
                       "Minimum spacing between firings, e.g. PT10M");
  schedule->add_option("--after", schedule_opts.after,
                       "List firings after this instant (default: now)");
  schedule->add_option("--count", schedule_opts.count,
                       "How many firings to list (default: 10)")
      ->check(CLI::PositiveNumber);
  schedule->add_flag("--json", schedule_opts.json, "Output JSON");
  schedule->callback([&schedule_opts]() {
    std::exit(jobforge::cli::cmd_schedule(schedule_opts));
  });

  jobforge::cli::RunOptions run_opts;
  auto *run = app.add_subcommand("run", "Run a job once and wait for it");
  run->footer("\nExamples:\n"
              "  jobforge run -c jobforge.toml nightly_scan\n"
              "  jobforge run -c jobforge.toml nightly_scan --json");
  run_opts.config_file = env_config;
  auto *run_cfg = run->add_option("-c,--config", run_opts.config_file,
                                  "System config file")
                      ->check(CLI::ExistingFile);
  if (env_config.empty())
    run_cfg->required();
  run->add_option("job_id", run_opts.job_id, "Job ID")->required();
  run->add_option("--timeout", run_opts.timeout_sec,
                  "Seconds to wait for the task (default: 3600)")
      ->check(CLI::PositiveNumber);
  run->add_flag("--json", run_opts.json, "Output JSON");
  run->callback([&run_opts]() { std::exit(jobforge::cli::cmd_run(run_opts)); });

  CLI11_PARSE(app, argc, argv);
  return 0;
}
