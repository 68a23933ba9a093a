#include "jobforge/selector/glob_evaluator.hpp"

#include "jobforge/util/json.hpp"

#include <fnmatch.h>

#include <algorithm>
#include <string>
#include <utility>

namespace jobforge {

namespace {

struct Term {
  std::string_view field;
  std::string_view pattern;
};

[[nodiscard]] auto split_term(std::string_view sub_query,
                              std::string_view default_field) -> Term {
  auto colon = sub_query.find(':');
  if (colon == std::string_view::npos) {
    return {.field = default_field, .pattern = sub_query};
  }
  return {.field = sub_query.substr(0, colon),
          .pattern = sub_query.substr(colon + 1)};
}

[[nodiscard]] auto lookup(const MetaMap &map, std::string_view key)
    -> std::string_view {
  auto it = map.find(key);
  return it != map.end() ? std::string_view{it->second} : std::string_view{};
}

[[nodiscard]] auto basename(std::string_view path) -> std::string_view {
  while (path.size() > 1 && path.back() == '/') {
    path.remove_suffix(1);
  }
  auto slash = path.rfind('/');
  return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

template <typename Pred>
[[nodiscard]] auto combine(const Query &query, Pred &&pred) -> bool {
  if (query.empty()) {
    return true;
  }
  if (query.op == QueryOperator::And) {
    return std::ranges::all_of(query.sub_queries, pred);
  }
  return std::ranges::any_of(query.sub_queries, pred);
}

[[nodiscard]] auto node_field(const Node &node, std::string_view field)
    -> std::string {
  if (field == "path") {
    return node.path;
  }
  if (field == "name") {
    return std::string(basename(node.path));
  }
  if (field == "uuid") {
    return node.uuid;
  }
  if (field == "type") {
    return std::string(to_string_view(node.type));
  }
  if (field.starts_with("meta.")) {
    return std::string(lookup(node.meta, field.substr(5)));
  }
  return {};
}

[[nodiscard]] auto user_field(const User &user, std::string_view field)
    -> std::string {
  if (field == "login") {
    return user.login;
  }
  if (field == "uuid") {
    return user.uuid;
  }
  if (field == "group") {
    return user.group_path;
  }
  if (field.starts_with("attr.")) {
    return std::string(lookup(user.attributes, field.substr(5)));
  }
  return {};
}

[[nodiscard]] auto message_field(const ActionMessage &message,
                                 std::string_view field) -> std::string {
  if (field == "event") {
    return dump_json(message.event);
  }
  const auto *last = message.last_output();
  if (last == nullptr) {
    return {};
  }
  if (field == "body") {
    return last->string_body;
  }
  if (field == "error") {
    return last->error_string;
  }
  if (field == "success") {
    return last->success ? "true" : "false";
  }
  return {};
}

} // namespace

auto glob_match(std::string_view pattern, std::string_view text) -> bool {
  const std::string p(pattern);
  const std::string t(text);
  return ::fnmatch(p.c_str(), t.c_str(), 0) == 0;
}

auto GlobQueryEvaluator::matches(const Query &query, const Node &node)
    -> bool {
  return combine(query, [&](const std::string &sub) {
    auto term = split_term(sub, "path");
    return glob_match(term.pattern, node_field(node, term.field));
  });
}

auto GlobQueryEvaluator::matches(const Query &query, const User &user)
    -> bool {
  return combine(query, [&](const std::string &sub) {
    auto term = split_term(sub, "login");
    return glob_match(term.pattern, user_field(user, term.field));
  });
}

auto GlobQueryEvaluator::matches(const Query &query,
                                 const ActionMessage &message) -> bool {
  return combine(query, [&](const std::string &sub) {
    auto term = split_term(sub, "body");
    return glob_match(term.pattern, message_field(message, term.field));
  });
}

auto GlobQueryEvaluator::search_nodes(const Query &query)
    -> task<Result<std::vector<Node>>> {
  std::vector<Node> out;
  for (std::size_t offset = 0;; offset += page_size_) {
    auto page = co_await nodes_.list_nodes(offset, page_size_);
    if (!page) {
      co_return fail(page.error());
    }
    for (auto &node : *page) {
      if (matches(query, node)) {
        out.push_back(std::move(node));
      }
    }
    if (page->size() < page_size_) {
      break;
    }
  }
  co_return ok(std::move(out));
}

auto GlobQueryEvaluator::search_users(const Query &query)
    -> task<Result<std::vector<User>>> {
  std::vector<User> out;
  for (std::size_t offset = 0;; offset += page_size_) {
    auto page = co_await users_.list_users(offset, page_size_);
    if (!page) {
      co_return fail(page.error());
    }
    for (auto &user : *page) {
      if (matches(query, user)) {
        out.push_back(std::move(user));
      }
    }
    if (page->size() < page_size_) {
      break;
    }
  }
  co_return ok(std::move(out));
}

} // namespace jobforge
