#include "jobforge/config/config.hpp"
#include "jobforge/config/toml_util.hpp"

#include "jobforge/util/log.hpp"

#include <boost/lexical_cast.hpp>

#include <cstdlib>
#include <string>
#include <string_view>

namespace jobforge {
namespace detail {

struct SchedulerToml {
  std::string log_level{"info"};
  std::string log_file;
  int shards{0};
  int default_max_concurrency{0};
  int stuck_sweep_interval_sec{60};
  int stuck_task_timeout_sec{600};
  int catalog_page_size{256};
};

struct JobSourceToml {
  std::string directory{"./jobs"};
  std::string catalog_file;
};

struct SystemToml {
  SchedulerToml scheduler{};
  JobSourceToml job_source{};
};

} // namespace detail
} // namespace jobforge

namespace glz {
template <> struct meta<jobforge::detail::SchedulerToml> {
  using T = jobforge::detail::SchedulerToml;
  static constexpr auto value = object(
      "log_level", &T::log_level, "log_file", &T::log_file, "shards",
      &T::shards, "default_max_concurrency", &T::default_max_concurrency,
      "stuck_sweep_interval_sec", &T::stuck_sweep_interval_sec,
      "stuck_task_timeout_sec", &T::stuck_task_timeout_sec,
      "catalog_page_size", &T::catalog_page_size);
};

template <> struct meta<jobforge::detail::JobSourceToml> {
  using T = jobforge::detail::JobSourceToml;
  static constexpr auto value = object("directory", &T::directory,
                                       "catalog_file", &T::catalog_file);
};

template <> struct meta<jobforge::detail::SystemToml> {
  using T = jobforge::detail::SystemToml;
  static constexpr auto value =
      object("scheduler", &T::scheduler, "job_source", &T::job_source);
};
} // namespace glz

namespace jobforge {
namespace {

[[nodiscard]] auto validate(const SystemConfig &cfg) -> Result<void> {
  const auto &s = cfg.scheduler;
  if (!log::parse_level(s.log_level)) {
    log::warn("Unknown log level '{}'", s.log_level);
    return fail(Error::ConfigurationError);
  }
  if (s.shards < 0 || s.default_max_concurrency < 0 ||
      s.stuck_sweep_interval_sec < 0 || s.stuck_task_timeout_sec < 0 ||
      s.catalog_page_size <= 0) {
    return fail(Error::ConfigurationError);
  }
  if (s.stuck_sweep_interval_sec > 0 && s.stuck_task_timeout_sec == 0) {
    log::warn("stuck_sweep_interval_sec set without stuck_task_timeout_sec");
    return fail(Error::ConfigurationError);
  }
  return ok();
}

[[nodiscard]] auto convert_toml(std::string_view toml_text)
    -> Result<SystemConfig> {
  auto raw_result = toml_util::parse_toml<detail::SystemToml>(toml_text);
  if (!raw_result) {
    return fail(raw_result.error());
  }
  auto &raw = *raw_result;

  SystemConfig cfg{};
  cfg.scheduler.log_level = std::move(raw.scheduler.log_level);
  cfg.scheduler.log_file = std::move(raw.scheduler.log_file);
  cfg.scheduler.shards = raw.scheduler.shards;
  cfg.scheduler.default_max_concurrency =
      raw.scheduler.default_max_concurrency;
  cfg.scheduler.stuck_sweep_interval_sec =
      raw.scheduler.stuck_sweep_interval_sec;
  cfg.scheduler.stuck_task_timeout_sec = raw.scheduler.stuck_task_timeout_sec;
  cfg.scheduler.catalog_page_size = raw.scheduler.catalog_page_size;

  cfg.job_source.directory = std::move(raw.job_source.directory);
  cfg.job_source.catalog_file = std::move(raw.job_source.catalog_file);

  return ConfigLoader::apply_env_overrides(std::move(cfg));
}

} // namespace

auto ConfigLoader::apply_env_overrides(SystemConfig cfg)
    -> Result<SystemConfig> {
  try {
    if (const char *v = std::getenv("JOBFORGE_LOG_LEVEL"); v != nullptr) {
      cfg.scheduler.log_level = v;
    }
    if (const char *v = std::getenv("JOBFORGE_SCHEDULER_SHARDS");
        v != nullptr) {
      cfg.scheduler.shards = boost::lexical_cast<int>(v);
    }
    if (const char *v = std::getenv("JOBFORGE_DEFAULT_MAX_CONCURRENCY");
        v != nullptr) {
      cfg.scheduler.default_max_concurrency = boost::lexical_cast<int>(v);
    }
    if (const char *v = std::getenv("JOBFORGE_STUCK_SWEEP_INTERVAL_SEC");
        v != nullptr) {
      cfg.scheduler.stuck_sweep_interval_sec = boost::lexical_cast<int>(v);
    }
    if (const char *v = std::getenv("JOBFORGE_STUCK_TASK_TIMEOUT_SEC");
        v != nullptr) {
      cfg.scheduler.stuck_task_timeout_sec = boost::lexical_cast<int>(v);
    }
    if (const char *v = std::getenv("JOBFORGE_CATALOG_PAGE_SIZE");
        v != nullptr) {
      cfg.scheduler.catalog_page_size = boost::lexical_cast<int>(v);
    }
    if (const char *v = std::getenv("JOBFORGE_JOB_DIRECTORY"); v != nullptr) {
      cfg.job_source.directory = v;
    }
    if (const char *v = std::getenv("JOBFORGE_CATALOG_FILE"); v != nullptr) {
      cfg.job_source.catalog_file = v;
    }
  } catch (const boost::bad_lexical_cast &e) {
    log::error("Invalid JOBFORGE_* environment override: {}", e.what());
    return fail(Error::ConfigurationError);
  }

  if (auto r = validate(cfg); !r) {
    return fail(r.error());
  }
  return ok(std::move(cfg));
}

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  auto text = toml_util::read_file(path, "config file");
  if (!text) {
    return fail(text.error());
  }
  return load_from_string(*text);
}

auto ConfigLoader::load_from_string(std::string_view toml_str)
    -> Result<SystemConfig> {
  try {
    return convert_toml(toml_str);
  } catch (const std::exception &e) {
    log::error("Failed to parse TOML system configuration: {}", e.what());
    return fail(Error::ParseError);
  }
}

} // namespace jobforge
