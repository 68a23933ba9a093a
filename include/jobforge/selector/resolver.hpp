#pragma once

#include "jobforge/core/coroutine.hpp"
#include "jobforge/core/error.hpp"
#include "jobforge/job/task.hpp"
#include "jobforge/selector/catalog.hpp"
#include "jobforge/selector/selector.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace jobforge {

enum class SelectionKind : std::uint8_t { Passthrough, Nodes, Users };

/// Concrete targets of one action invocation round.
struct Selection {
  SelectionKind kind{SelectionKind::Passthrough};
  std::vector<Node> nodes;
  std::vector<User> users;
  bool collect{false};

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return kind == SelectionKind::Nodes ? nodes.size() : users.size();
  }
  /// A pass-through selection is never empty.
  [[nodiscard]] auto empty() const noexcept -> bool {
    return kind != SelectionKind::Passthrough && size() == 0;
  }
  /// Number of handler invocations this selection leads to.
  [[nodiscard]] auto invocations() const noexcept -> std::size_t {
    if (kind == SelectionKind::Passthrough || collect) {
      return empty() ? 0 : 1;
    }
    return size();
  }
};

class SelectorResolver {
public:
  SelectorResolver(NodeCatalog &nodes, UserCatalog &users,
                   QueryEvaluator &evaluator, std::size_t page_size = 256);

  [[nodiscard]] auto resolve(const std::optional<EntitySelector> &selector,
                             const std::optional<EntitySelector> &filter,
                             const ActionMessage &context)
      -> task<Result<Selection>>;

  /// True when no source filter is set or the evaluator accepts `message`.
  [[nodiscard]] auto accepts(const std::optional<SourceFilter> &filter,
                             const ActionMessage &message) -> bool;

  /// Walks the catalogue page by page and returns the whole listing. The
  /// result is held in memory because one invocation is planned per entity
  /// before the first runs. A failed page fails the listing; no partial list
  /// is returned.
  [[nodiscard]] auto list_all_nodes() -> task<Result<std::vector<Node>>>;
  [[nodiscard]] auto list_all_users() -> task<Result<std::vector<User>>>;

private:
  [[nodiscard]] auto select_nodes(const NodesSelector &selector,
                                  bool has_filter,
                                  const ActionMessage &context)
      -> task<Result<std::vector<Node>>>;
  [[nodiscard]] auto select_users(const UsersSelector &selector,
                                  bool has_filter,
                                  const ActionMessage &context)
      -> task<Result<std::vector<User>>>;

  [[nodiscard]] auto keep(const NodesSelector &filter, const Node &node)
      -> bool;
  [[nodiscard]] auto keep(const UsersSelector &filter, const User &user)
      -> bool;

  NodeCatalog &nodes_;
  UserCatalog &users_;
  QueryEvaluator &evaluator_;
  std::size_t page_size_;
};

} // namespace jobforge
