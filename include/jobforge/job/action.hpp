#pragma once

#include "jobforge/core/error.hpp"
#include "jobforge/selector/selector.hpp"
#include "jobforge/util/id.hpp"

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <flat_map>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace jobforge {

using ActionIndex = std::uint32_t;
constexpr ActionIndex kInvalidAction = UINT32_MAX;

using ParameterMap = std::flat_map<std::string, std::string, std::less<>>;

struct Action {
  ActionId id;
  /// Definition-local name used to chain actions; may be empty.
  std::string key;
  std::optional<EntitySelector> selector;
  std::optional<EntitySelector> filter;
  std::optional<SourceFilter> source_filter;
  ParameterMap parameters;
  /// A failed output does not halt the branch.
  bool tolerant{false};

  [[nodiscard]] auto parameter(std::string_view name) const
      -> std::optional<std::string_view> {
    auto it = parameters.find(name);
    if (it == parameters.end()) {
      return std::nullopt;
    }
    return std::string_view{it->second};
  }
};

[[nodiscard]] auto validate_action(const Action &action) -> Result<void>;

// Forward-only tree of chained actions stored in one arena. A child is always
// appended after its parent, so indices increase along every branch and the
// structure cannot contain cycles.
class ActionTree {
public:
  [[nodiscard]] auto add_root(Action action) -> Result<ActionIndex>;
  [[nodiscard]] auto add_chained(ActionIndex parent, Action action)
      -> Result<ActionIndex>;

  [[nodiscard]] auto roots() const noexcept -> std::span<const ActionIndex> {
    return roots_;
  }
  [[nodiscard]] auto children(ActionIndex idx) const noexcept
      -> std::span<const ActionIndex>;
  [[nodiscard]] auto parent(ActionIndex idx) const noexcept -> ActionIndex;
  [[nodiscard]] auto action(ActionIndex idx) const -> const Action &;

  /// Number of actions in the subtree rooted at `idx`, itself included.
  [[nodiscard]] auto subtree_size(ActionIndex idx) const noexcept
      -> std::size_t;

  [[nodiscard]] auto find(std::string_view key) const -> ActionIndex;

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return nodes_.size();
  }
  [[nodiscard]] auto empty() const noexcept -> bool { return nodes_.empty(); }

  [[nodiscard]] auto validate() const -> Result<void>;

private:
  [[nodiscard]] auto append(Action action, ActionIndex parent)
      -> Result<ActionIndex>;

  struct Slot {
    Action action;
    ActionIndex parent{kInvalidAction};
    std::vector<ActionIndex> children;
    std::size_t subtree{1};
  };

  std::vector<Slot> nodes_;
  std::vector<ActionIndex> roots_;
  ankerl::unordered_dense::map<std::string, ActionIndex> key_to_idx_;
};

} // namespace jobforge
