#include "jobforge/config/job_definition.hpp"
#include "jobforge/config/toml_util.hpp"

#include "jobforge/util/log.hpp"

#include <glaze/toml.hpp>

#include <algorithm>
#include <format>
#include <map>
#include <ranges>
#include <string>
#include <vector>

namespace jobforge {
namespace detail {

struct QueryToml {
  std::vector<std::string> query;
  std::string op{"or"};
};

struct EntitySelectorToml {
  bool all{false};
  std::vector<std::string> paths;
  std::vector<std::string> logins;
  std::vector<std::string> query;
  std::string op{"or"};
  bool collect{false};
  /// Select the entities carried by the inbound message.
  bool context{false};
};

struct ActionToml {
  std::string key;
  std::string action;
  std::string after;
  bool tolerant{false};
  std::map<std::string, std::string> parameters;
  EntitySelectorToml nodes;
  EntitySelectorToml users;
  EntitySelectorToml nodes_filter;
  EntitySelectorToml users_filter;
  QueryToml source_filter;
};

struct ScheduleToml {
  std::string iso8601;
  std::string min_delta;
};

struct JobToml {
  std::string id;
  std::string label;
  std::string owner;
  bool inactive{false};
  std::vector<std::string> languages;
  std::vector<std::string> events;
  ScheduleToml schedule;
  bool auto_start{false};
  bool auto_clean{false};
  bool silent_tasks{false};
  int max_concurrency{0};
  std::vector<ActionToml> actions;
};

} // namespace detail
} // namespace jobforge

namespace glz {
template <> struct meta<jobforge::detail::QueryToml> {
  using T = jobforge::detail::QueryToml;
  static constexpr auto value =
      object("query", &T::query, "operator", &T::op);
};

template <> struct meta<jobforge::detail::EntitySelectorToml> {
  using T = jobforge::detail::EntitySelectorToml;
  static constexpr auto value =
      object("all", &T::all, "paths", &T::paths, "logins", &T::logins,
             "query", &T::query, "operator", &T::op, "collect", &T::collect,
             "context", &T::context);
};

template <> struct meta<jobforge::detail::ActionToml> {
  using T = jobforge::detail::ActionToml;
  static constexpr auto value = object(
      "key", &T::key, "action", &T::action, "after", &T::after, "tolerant",
      &T::tolerant, "parameters", &T::parameters, "nodes", &T::nodes, "users",
      &T::users, "nodes_filter", &T::nodes_filter, "users_filter",
      &T::users_filter, "source_filter", &T::source_filter);
};

template <> struct meta<jobforge::detail::ScheduleToml> {
  using T = jobforge::detail::ScheduleToml;
  static constexpr auto value =
      object("iso8601", &T::iso8601, "min_delta", &T::min_delta);
};

template <> struct meta<jobforge::detail::JobToml> {
  using T = jobforge::detail::JobToml;
  static constexpr auto value = object(
      "id", &T::id, "label", &T::label, "owner", &T::owner, "inactive",
      &T::inactive, "languages", &T::languages, "events", &T::events,
      "schedule", &T::schedule, "auto_start", &T::auto_start, "auto_clean",
      &T::auto_clean, "silent_tasks", &T::silent_tasks, "max_concurrency",
      &T::max_concurrency, "actions", &T::actions);
};
} // namespace glz

namespace jobforge {
namespace {

[[nodiscard]] auto is_set(const detail::EntitySelectorToml &raw) -> bool {
  return raw.all || raw.context || raw.collect || !raw.paths.empty() ||
         !raw.logins.empty() || !raw.query.empty();
}

[[nodiscard]] auto parse_query(std::vector<std::string> terms,
                               std::string_view op, std::string_view key)
    -> Result<Query> {
  auto parsed = parse<QueryOperator>(op);
  if (!parsed) {
    log::warn("Action '{}': unknown query operator '{}'", key, op);
    return fail(Error::ConfigurationError);
  }
  return ok(Query{.sub_queries = std::move(terms), .op = *parsed});
}

[[nodiscard]] auto parse_nodes(const detail::EntitySelectorToml &raw,
                               std::string_view key) -> Result<NodesSelector> {
  NodesSelector sel{.all = raw.all, .paths = raw.paths, .collect = raw.collect};
  if (!raw.query.empty()) {
    auto query = parse_query(raw.query, raw.op, key);
    if (!query) {
      return fail(query.error());
    }
    sel.query = std::move(*query);
  }
  return ok(std::move(sel));
}

[[nodiscard]] auto parse_users(const detail::EntitySelectorToml &raw,
                               std::string_view key) -> Result<UsersSelector> {
  UsersSelector sel{.all = raw.all, .collect = raw.collect};
  sel.users.reserve(raw.logins.size());
  for (const auto &login : raw.logins) {
    sel.users.push_back(User{.login = login});
  }
  if (!raw.query.empty()) {
    auto query = parse_query(raw.query, raw.op, key);
    if (!query) {
      return fail(query.error());
    }
    sel.query = std::move(*query);
  }
  return ok(std::move(sel));
}

[[nodiscard]] auto parse_selector(const detail::EntitySelectorToml &nodes,
                                  const detail::EntitySelectorToml &users,
                                  std::string_view what, std::string_view key)
    -> Result<std::optional<EntitySelector>> {
  const bool has_nodes = is_set(nodes);
  const bool has_users = is_set(users);
  if (has_nodes && has_users) {
    log::warn("Action '{}': {} selects both nodes and users", key, what);
    return fail(Error::ConfigurationError);
  }
  if (has_nodes) {
    if (!nodes.logins.empty()) {
      log::warn("Action '{}': logins are not valid on a node {}", key, what);
      return fail(Error::ConfigurationError);
    }
    auto sel = parse_nodes(nodes, key);
    if (!sel) {
      return fail(sel.error());
    }
    return ok(std::optional<EntitySelector>{std::move(*sel)});
  }
  if (has_users) {
    if (!users.paths.empty()) {
      log::warn("Action '{}': paths are not valid on a user {}", key, what);
      return fail(Error::ConfigurationError);
    }
    auto sel = parse_users(users, key);
    if (!sel) {
      return fail(sel.error());
    }
    return ok(std::optional<EntitySelector>{std::move(*sel)});
  }
  return ok(std::optional<EntitySelector>{});
}

[[nodiscard]] auto parse_action(const detail::ActionToml &raw)
    -> Result<Action> {
  Action action{.id = ActionId{raw.action},
                .key = raw.key,
                .parameters = toml_util::to_flat_map(raw.parameters),
                .tolerant = raw.tolerant};

  auto selector = parse_selector(raw.nodes, raw.users, "selector", raw.key);
  if (!selector) {
    return fail(selector.error());
  }
  action.selector = std::move(*selector);

  auto filter =
      parse_selector(raw.nodes_filter, raw.users_filter, "filter", raw.key);
  if (!filter) {
    return fail(filter.error());
  }
  action.filter = std::move(*filter);

  if (!raw.source_filter.query.empty()) {
    auto query =
        parse_query(raw.source_filter.query, raw.source_filter.op, raw.key);
    if (!query) {
      return fail(query.error());
    }
    action.source_filter = SourceFilter{.query = std::move(*query)};
  }
  return ok(std::move(action));
}

[[nodiscard]] auto build_tree(const std::vector<detail::ActionToml> &raw)
    -> Result<ActionTree> {
  ActionTree tree;
  for (const auto &[i, item] : std::views::enumerate(raw)) {
    auto action = parse_action(item);
    if (!action) {
      return fail(action.error());
    }
    Result<ActionIndex> idx = fail(Error::Unknown);
    if (item.after.empty()) {
      idx = tree.add_root(std::move(*action));
    } else {
      const auto parent = tree.find(item.after);
      if (parent == kInvalidAction) {
        log::warn("Action #{} chains after unknown or later action '{}'", i,
                  item.after);
        return fail(Error::ConfigurationError);
      }
      idx = tree.add_chained(parent, std::move(*action));
    }
    if (!idx) {
      if (idx.error() == make_error_code(Error::AlreadyExists)) {
        log::warn("Duplicate action key '{}'", item.key);
        return fail(Error::ConfigurationError);
      }
      return fail(idx.error());
    }
  }
  return ok(std::move(tree));
}

} // namespace

auto JobDefinitionLoader::load_from_file(std::string_view path,
                                         std::string *diagnostic)
    -> Result<Job> {
  auto text = toml_util::read_file(path, "job file");
  if (!text) {
    return fail(text.error());
  }
  return load_from_string(*text, diagnostic);
}

auto JobDefinitionLoader::load_from_string(std::string_view toml_str,
                                           std::string *diagnostic)
    -> Result<Job> {
  auto raw = toml_util::parse_toml<detail::JobToml>(toml_str, diagnostic);
  if (!raw) {
    return fail(raw.error());
  }

  auto tree = build_tree(raw->actions);
  if (!tree) {
    if (diagnostic) {
      *diagnostic = "invalid [[actions]] chain";
    }
    return fail(tree.error());
  }

  JobBuilder builder{JobId{raw->id}};
  builder.label(raw->label)
      .owner(raw->owner)
      .inactive(raw->inactive)
      .auto_start(raw->auto_start)
      .auto_clean(raw->auto_clean)
      .silent_tasks(raw->silent_tasks)
      .max_concurrency(raw->max_concurrency)
      .actions(std::move(*tree));
  for (auto &event : raw->events) {
    builder.on_event(std::move(event));
  }
  if (!raw->schedule.iso8601.empty() || !raw->schedule.min_delta.empty()) {
    builder.schedule(raw->schedule.iso8601, raw->schedule.min_delta);
  }

  auto job = std::move(builder).build();
  if (!job) {
    if (diagnostic) {
      *diagnostic = std::format("job '{}' failed validation: {}", raw->id,
                                job.error().message());
    }
    return job;
  }
  job->languages = std::move(raw->languages);
  return job;
}

JobFileLoader::JobFileLoader(std::string_view directory)
    : directory_(directory) {}

auto JobFileLoader::load_all() -> Result<std::vector<JobFile>> {
  std::error_code ec;
  if (!std::filesystem::exists(directory_, ec)) {
    log::warn("Job directory does not exist: {}", directory_.string());
    return ok(std::vector<JobFile>{});
  }

  std::vector<std::filesystem::path> paths;
  for (const auto &entry : std::filesystem::directory_iterator(directory_, ec)) {
    if (entry.is_regular_file() && entry.path().extension() == ".toml") {
      paths.push_back(entry.path());
    }
  }
  if (ec) {
    log::error("Cannot list job directory {}: {}", directory_.string(),
               ec.message());
    return fail(Error::FileNotFound);
  }
  std::ranges::sort(paths);

  std::vector<JobFile> jobs;
  for (const auto &path : paths) {
    auto result = load_file(path);
    if (!result) {
      log::warn("Failed to load job from {}: {}", path.string(),
                result.error().message());
      continue;
    }
    log::info("Loaded job '{}' from {}", result->job.id, path.string());
    jobs.push_back(std::move(*result));
  }
  log::info("Loaded {} job(s) from {}", jobs.size(), directory_.string());
  return ok(std::move(jobs));
}

auto JobFileLoader::load_file(const std::filesystem::path &path)
    -> Result<JobFile> {
  return JobDefinitionLoader::load_from_file(path.string())
      .transform([&](Job &&job) {
        return JobFile{.path = path, .job = std::move(job)};
      });
}

} // namespace jobforge
