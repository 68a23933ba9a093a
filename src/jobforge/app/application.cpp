#include "jobforge/app/application.hpp"

#include "jobforge/config/catalog_definition.hpp"
#include "jobforge/config/job_definition.hpp"
#include "jobforge/util/log.hpp"

#include <chrono>
#include <csignal>
#include <thread>

namespace jobforge {

Application::Application(SystemConfig config)
    : config_(std::move(config)),
      runtime_(static_cast<unsigned>(config_.scheduler.shards)),
      evaluator_(catalog_, catalog_,
                 static_cast<std::size_t>(config_.scheduler.catalog_page_size)),
      resolver_(catalog_, catalog_, evaluator_,
                static_cast<std::size_t>(config_.scheduler.catalog_page_size)),
      executor_(resolver_, registry_),
      supervisor_(runtime_, store_, executor_, publisher_,
                  SupervisorOptions{.default_max_concurrency =
                                        config_.scheduler
                                            .default_max_concurrency}),
      scheduler_(runtime_), detector_(runtime_, supervisor_, store_),
      jobs_(runtime_, store_, supervisor_, scheduler_.engine(), detector_,
            publisher_) {
  std::signal(SIGPIPE, SIG_IGN);
  register_builtin_actions(registry_);
  setup_callbacks();
}

Application::~Application() { stop(); }

auto Application::setup_callbacks() -> void {
  scheduler_.set_on_trigger([this](JobTriggerEvent event) {
    if (auto r = jobs_.trigger_local(event); !r) {
      log::warn("Scheduled firing of job '{}' failed: {}", event.job_id,
                r.error().message());
    }
  });
  scheduler_.set_stuck_sweep_callback(
      [this](std::chrono::system_clock::time_point since)
          -> task<Result<std::size_t>> {
        auto swept = co_await detector_.sweep(since);
        if (!swept) {
          co_return fail(swept.error());
        }
        co_return ok(swept->size());
      });
  scheduler_.set_stuck_sweep_config(config_.scheduler.stuck_sweep_interval_sec,
                                    config_.scheduler.stuck_task_timeout_sec);
  supervisor_.set_on_job_removed(
      [this](const JobId &job_id) { scheduler_.engine().remove_job(job_id); });
}

auto Application::init() -> Result<void> {
  const auto &path = config_.job_source.catalog_file;
  if (path.empty()) {
    return ok();
  }
  std::string diagnostic;
  auto catalog = CatalogDefinitionLoader::load_from_file(path, &diagnostic);
  if (!catalog) {
    log::error("Failed to load catalogue {}: {}", path,
               diagnostic.empty() ? catalog.error().message() : diagnostic);
    return fail(catalog.error());
  }
  for (auto &node : catalog->nodes) {
    catalog_.add_node(std::move(node));
  }
  for (auto &user : catalog->users) {
    catalog_.add_user(std::move(user));
  }
  log::info("Catalogue loaded: {} node(s), {} user(s)", catalog_.node_count(),
            catalog_.user_count());
  return ok();
}

auto Application::start() -> Result<void> {
  if (running_.exchange(true)) {
    return ok();
  }
  if (auto r = runtime_.start(); !r) {
    running_ = false;
    return fail(r.error());
  }
  supervisor_.start();
  scheduler_.start();

  if (!config_.job_source.directory.empty()) {
    if (auto r = load_jobs_from_directory(config_.job_source.directory); !r) {
      stop();
      return fail(r.error());
    }
  }
  log::info("jobforge started with {} shard(s)", runtime_.shard_count());
  return ok();
}

auto Application::stop() noexcept -> void {
  if (!running_.exchange(false)) {
    return;
  }
  scheduler_.stop();
  supervisor_.stop();
  runtime_.stop();
  log::info("jobforge stopped");
}

auto Application::load_jobs_from_directory(std::string_view directory)
    -> Result<std::size_t> {
  JobFileLoader loader(directory);
  auto files = loader.load_all();
  if (!files) {
    return fail(files.error());
  }
  std::size_t accepted = 0;
  for (auto &file : *files) {
    if (auto r = block_on(jobs_.put_job(std::move(file.job))); !r) {
      log::warn("Job from {} rejected: {}", file.path.string(),
                r.error().message());
      continue;
    }
    ++accepted;
  }
  return ok(accepted);
}

auto Application::run_job_blocking(const JobId &job_id,
                                   std::chrono::milliseconds timeout)
    -> Result<Task> {
  auto fired =
      block_on(supervisor_.fire(job_id, FireRequest{.trigger_owner = "cli"}));
  if (!fired) {
    return fired;
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    auto current = block_on(jobs_.get_task(fired->id));
    if (!current) {
      return current;
    }
    if (is_terminal(current->status)) {
      return current;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      log::warn("Task {} still {} after {}ms", current->id,
                to_string_view(current->status), timeout.count());
      return fail(Error::Timeout);
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
}

} // namespace jobforge
