#pragma once

#include "jobforge/selector/entity.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace jobforge {

struct NodesSelector {
  bool all{false};
  std::vector<std::string> paths;
  std::vector<Node> nodes;
  std::optional<Query> query;
  bool collect{false};
};

struct UsersSelector {
  bool all{false};
  std::vector<User> users;
  std::optional<Query> query;
  bool collect{false};
};

/// Accepts or rejects the inbound message of an action as a whole.
struct SourceFilter {
  Query query;
};

using EntitySelector = std::variant<NodesSelector, UsersSelector>;

enum class TargetKind : std::uint8_t { Nodes, Users };

[[nodiscard]] inline auto target_kind(const EntitySelector &selector) noexcept
    -> TargetKind {
  return std::holds_alternative<NodesSelector>(selector) ? TargetKind::Nodes
                                                         : TargetKind::Users;
}

[[nodiscard]] inline auto collects(const EntitySelector &selector) noexcept
    -> bool {
  return std::visit([](const auto &s) { return s.collect; }, selector);
}

[[nodiscard]] inline auto selector_query(const EntitySelector &selector)
    -> const std::optional<Query> & {
  return std::visit(
      [](const auto &s) -> const std::optional<Query> & { return s.query; },
      selector);
}

[[nodiscard]] inline auto selects_all(const EntitySelector &selector) noexcept
    -> bool {
  return std::visit([](const auto &s) { return s.all; }, selector);
}

[[nodiscard]] inline auto has_preset(const EntitySelector &selector) noexcept
    -> bool {
  if (const auto *nodes = std::get_if<NodesSelector>(&selector)) {
    return !nodes->paths.empty() || !nodes->nodes.empty();
  }
  const auto *users = std::get_if<UsersSelector>(&selector);
  return users != nullptr && !users->users.empty();
}

} // namespace jobforge
