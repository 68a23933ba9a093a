#include "jobforge/selector/resolver.hpp"

#include "jobforge/util/log.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace jobforge {

namespace {

[[nodiscard]] auto node_from_path(const std::string &path) -> Node {
  return Node{.path = path};
}

template <typename T, typename Pred>
auto erase_unless(std::vector<T> &items, Pred &&pred) -> void {
  std::erase_if(items, [&](const T &item) { return !pred(item); });
}

} // namespace

SelectorResolver::SelectorResolver(NodeCatalog &nodes, UserCatalog &users,
                                   QueryEvaluator &evaluator,
                                   std::size_t page_size)
    : nodes_(nodes), users_(users), evaluator_(evaluator),
      page_size_(std::max<std::size_t>(page_size, 1)) {}

auto SelectorResolver::list_all_nodes() -> task<Result<std::vector<Node>>> {
  std::vector<Node> out;
  for (std::size_t offset = 0;; offset += page_size_) {
    auto page = co_await nodes_.list_nodes(offset, page_size_);
    if (!page) {
      log::warn("Node catalogue listing failed at offset {}: {}", offset,
                page.error().message());
      co_return fail(page.error());
    }
    const auto count = page->size();
    std::ranges::move(*page, std::back_inserter(out));
    if (count < page_size_) {
      break;
    }
  }
  co_return ok(std::move(out));
}

auto SelectorResolver::list_all_users() -> task<Result<std::vector<User>>> {
  std::vector<User> out;
  for (std::size_t offset = 0;; offset += page_size_) {
    auto page = co_await users_.list_users(offset, page_size_);
    if (!page) {
      log::warn("User catalogue listing failed at offset {}: {}", offset,
                page.error().message());
      co_return fail(page.error());
    }
    const auto count = page->size();
    std::ranges::move(*page, std::back_inserter(out));
    if (count < page_size_) {
      break;
    }
  }
  co_return ok(std::move(out));
}

auto SelectorResolver::select_nodes(const NodesSelector &selector,
                                    bool has_filter,
                                    const ActionMessage &context)
    -> task<Result<std::vector<Node>>> {
  if (selector.all) {
    co_return co_await list_all_nodes();
  }
  if (!selector.nodes.empty() || !selector.paths.empty()) {
    std::vector<Node> out = selector.nodes;
    std::ranges::transform(selector.paths, std::back_inserter(out),
                           node_from_path);
    co_return ok(std::move(out));
  }
  if (selector.query && !selector.query->empty()) {
    if (!has_filter) {
      co_return co_await evaluator_.search_nodes(*selector.query);
    }
    std::vector<Node> out = context.nodes;
    erase_unless(out, [&](const Node &n) {
      return evaluator_.matches(*selector.query, n);
    });
    co_return ok(std::move(out));
  }
  co_return ok(context.nodes);
}

auto SelectorResolver::select_users(const UsersSelector &selector,
                                    bool has_filter,
                                    const ActionMessage &context)
    -> task<Result<std::vector<User>>> {
  if (selector.all) {
    co_return co_await list_all_users();
  }
  if (!selector.users.empty()) {
    co_return ok(selector.users);
  }
  if (selector.query && !selector.query->empty()) {
    if (!has_filter) {
      co_return co_await evaluator_.search_users(*selector.query);
    }
    std::vector<User> out = context.users;
    erase_unless(out, [&](const User &u) {
      return evaluator_.matches(*selector.query, u);
    });
    co_return ok(std::move(out));
  }
  co_return ok(context.users);
}

auto SelectorResolver::keep(const NodesSelector &filter, const Node &node)
    -> bool {
  if (filter.all) {
    return true;
  }
  if (!filter.nodes.empty() || !filter.paths.empty()) {
    const bool by_node = std::ranges::any_of(filter.nodes, [&](const Node &n) {
      return (!n.uuid.empty() && n.uuid == node.uuid) || n.path == node.path;
    });
    return by_node || std::ranges::find(filter.paths, node.path) !=
                          filter.paths.end();
  }
  if (filter.query) {
    return evaluator_.matches(*filter.query, node);
  }
  return true;
}

auto SelectorResolver::keep(const UsersSelector &filter, const User &user)
    -> bool {
  if (filter.all) {
    return true;
  }
  if (!filter.users.empty()) {
    return std::ranges::any_of(filter.users, [&](const User &u) {
      return (!u.uuid.empty() && u.uuid == user.uuid) || u.login == user.login;
    });
  }
  if (filter.query) {
    return evaluator_.matches(*filter.query, user);
  }
  return true;
}

auto SelectorResolver::resolve(const std::optional<EntitySelector> &selector,
                               const std::optional<EntitySelector> &filter,
                               const ActionMessage &context)
    -> task<Result<Selection>> {
  if (!selector && !filter) {
    co_return ok(Selection{});
  }
  if (selector && filter && target_kind(*selector) != target_kind(*filter)) {
    co_return fail(Error::ConfigurationError);
  }

  const auto &primary = selector ? *selector : *filter;
  Selection out{.collect = collects(primary)};

  if (target_kind(primary) == TargetKind::Nodes) {
    out.kind = SelectionKind::Nodes;
    Result<std::vector<Node>> candidates{context.nodes};
    if (selector) {
      candidates = co_await select_nodes(std::get<NodesSelector>(*selector),
                                         filter.has_value(), context);
    }
    if (!candidates) {
      co_return fail(candidates.error());
    }
    out.nodes = std::move(*candidates);
    if (filter) {
      const auto &f = std::get<NodesSelector>(*filter);
      erase_unless(out.nodes, [&](const Node &n) { return keep(f, n); });
    }
  } else {
    out.kind = SelectionKind::Users;
    Result<std::vector<User>> candidates{context.users};
    if (selector) {
      candidates = co_await select_users(std::get<UsersSelector>(*selector),
                                         filter.has_value(), context);
    }
    if (!candidates) {
      co_return fail(candidates.error());
    }
    out.users = std::move(*candidates);
    if (filter) {
      const auto &f = std::get<UsersSelector>(*filter);
      erase_unless(out.users, [&](const User &u) { return keep(f, u); });
    }
  }

  log::trace("Resolved {} {} target(s)", out.size(),
             out.kind == SelectionKind::Nodes ? "node" : "user");
  co_return ok(std::move(out));
}

auto SelectorResolver::accepts(const std::optional<SourceFilter> &filter,
                               const ActionMessage &message) -> bool {
  if (!filter || filter->query.empty()) {
    return true;
  }
  return evaluator_.matches(filter->query, message);
}

} // namespace jobforge
