#include "common.hpp"

#include "jobforge/cli/commands.hpp"
#include "jobforge/cli/formatting.hpp"
#include "jobforge/config/catalog_definition.hpp"
#include "jobforge/config/job_definition.hpp"
#include "jobforge/scheduler/schedule.hpp"
#include "jobforge/util/json.hpp"
#include "jobforge/util/log.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <format>
#include <print>
#include <vector>

namespace jobforge::cli {

namespace {

struct ValidationResult {
  std::string job_id;
  std::string file_path;
  std::size_t actions{0};
  bool valid{false};
  std::string error;
};

auto validate_single_file(const std::filesystem::path &path)
    -> ValidationResult {
  ValidationResult vr{.job_id = path.stem().string(),
                      .file_path = path.string()};

  std::string diagnostic;
  auto res =
      JobDefinitionLoader::load_from_file(path.string(), &diagnostic)
          .and_then([&](const Job &job) -> Result<void> {
            vr.job_id = job.id.str();
            vr.actions = job.actions.size();
            if (!job.has_schedule()) {
              return ok();
            }
            // Malformed schedules are accepted at runtime but worth flagging.
            return parse_schedule(*job.schedule,
                                  std::chrono::system_clock::now())
                .transform([](const ParsedSchedule &) {})
                .or_else([&](std::error_code ec) -> Result<void> {
                  diagnostic = std::format("invalid schedule '{}'",
                                           job.schedule->iso8601_schedule);
                  return fail(ec);
                });
          });

  vr.valid = res.has_value();
  if (!vr.valid) {
    vr.error = diagnostic.empty() ? res.error().message() : diagnostic;
  }
  return vr;
}

} // namespace

auto cmd_validate(const ValidateOptions &opts) -> int {
  log::set_output_stderr();
  std::vector<ValidationResult> results;

  if (opts.file.has_value()) {
    if (!std::filesystem::exists(*opts.file)) {
      std::println(stderr, "Error: File does not exist: {}", *opts.file);
      return 1;
    }
    results.emplace_back(validate_single_file(*opts.file));
  } else {
    auto config_res = load_config_or_print(opts.config_file);
    if (!config_res) {
      return 1;
    }
    auto config = std::move(*config_res);
    resolve_paths(config, opts.config_file);

    if (!config.job_source.catalog_file.empty()) {
      std::string diagnostic;
      auto catalog = CatalogDefinitionLoader::load_from_file(
          config.job_source.catalog_file, &diagnostic);
      if (!catalog) {
        std::println(stderr, "Error: Catalogue {}: {}",
                     config.job_source.catalog_file,
                     diagnostic.empty() ? catalog.error().message()
                                        : diagnostic);
        return 1;
      }
    }

    const auto &dir = config.job_source.directory;
    if (dir.empty() || !std::filesystem::exists(dir)) {
      std::println(stderr, "Error: Job directory does not exist: {}", dir);
      return 1;
    }
    std::vector<std::filesystem::path> paths;
    for (const auto &entry : std::filesystem::directory_iterator(dir)) {
      if (entry.is_regular_file() && entry.path().extension() == ".toml") {
        paths.push_back(entry.path());
      }
    }
    std::ranges::sort(paths);
    for (const auto &path : paths) {
      results.emplace_back(validate_single_file(path));
    }
  }

  const auto valid_count = std::ranges::count_if(
      results, [](const ValidationResult &vr) { return vr.valid; });
  const auto invalid_count =
      static_cast<std::int64_t>(results.size()) - valid_count;

  if (opts.json) {
    JsonValue arr = std::vector<JsonValue>{};
    for (const auto &vr : results) {
      JsonValue obj{
          {"job_id", vr.job_id},
          {"file", vr.file_path},
          {"actions", static_cast<std::int64_t>(vr.actions)},
          {"valid", vr.valid},
      };
      if (!vr.valid) {
        obj.get_object().emplace("error", vr.error);
      }
      arr.get_array().emplace_back(std::move(obj));
    }
    JsonValue output{
        {"results", std::move(arr)},
        {"summary",
         JsonValue{
             {"valid", static_cast<std::int64_t>(valid_count)},
             {"invalid", invalid_count},
             {"total", static_cast<std::int64_t>(results.size())},
         }},
    };
    std::println("{}", dump_json(output));
  } else {
    for (const auto &vr : results) {
      if (vr.valid) {
        std::println("{} {} ({} action(s))", fmt::ansi::green("ok"),
                     vr.job_id, vr.actions);
      } else {
        std::println("{} {}: {}", fmt::ansi::red("invalid"), vr.file_path,
                     vr.error);
      }
    }
    std::println("\n{} valid, {} invalid", valid_count, invalid_count);
  }
  return invalid_count == 0 ? 0 : 1;
}

} // namespace jobforge::cli
