#include "jobforge/job/action.hpp"

#include "jobforge/util/log.hpp"

#include <utility>

namespace jobforge {

namespace {

constexpr std::size_t kMaxActions = 100'000;

[[nodiscard]] auto validate_selector(const EntitySelector &selector)
    -> Result<void> {
  const auto &query = selector_query(selector);
  if (query.has_value() && query->empty() && !selects_all(selector) &&
      !has_preset(selector)) {
    return fail(Error::ConfigurationError);
  }
  return ok();
}

} // namespace

auto validate_action(const Action &action) -> Result<void> {
  if (!is_valid_id_text(action.id.value())) {
    log::warn("Action '{}' has no valid handler id", action.key);
    return fail(Error::ConfigurationError);
  }
  if (action.selector && action.filter &&
      target_kind(*action.selector) != target_kind(*action.filter)) {
    log::warn("Action '{}' mixes node and user targets", action.id);
    return fail(Error::ConfigurationError);
  }
  if (action.selector) {
    if (auto r = validate_selector(*action.selector); !r) {
      return r;
    }
  }
  if (action.filter) {
    if (auto r = validate_selector(*action.filter); !r) {
      return r;
    }
  }
  if (action.source_filter && action.source_filter->query.empty()) {
    return fail(Error::ConfigurationError);
  }
  return ok();
}

auto ActionTree::add_root(Action action) -> Result<ActionIndex> {
  return append(std::move(action), kInvalidAction)
      .transform([this](ActionIndex idx) {
        roots_.push_back(idx);
        return idx;
      });
}

auto ActionTree::add_chained(ActionIndex parent, Action action)
    -> Result<ActionIndex> {
  if (parent >= nodes_.size()) [[unlikely]] {
    return fail(Error::NotFound);
  }
  auto idx = append(std::move(action), parent);
  if (!idx) {
    return idx;
  }
  nodes_[parent].children.push_back(*idx);
  for (auto up = parent; up != kInvalidAction; up = nodes_[up].parent) {
    ++nodes_[up].subtree;
  }
  return idx;
}

auto ActionTree::append(Action action, ActionIndex parent)
    -> Result<ActionIndex> {
  if (nodes_.size() >= kMaxActions) {
    return fail(Error::ResourceExhausted);
  }
  if (!action.key.empty() && key_to_idx_.contains(action.key)) {
    return fail(Error::AlreadyExists);
  }

  auto idx = static_cast<ActionIndex>(nodes_.size());
  if (!action.key.empty()) {
    key_to_idx_.emplace(action.key, idx);
  }
  nodes_.push_back(Slot{.action = std::move(action), .parent = parent});
  return ok(idx);
}

auto ActionTree::children(ActionIndex idx) const noexcept
    -> std::span<const ActionIndex> {
  if (idx >= nodes_.size()) [[unlikely]] {
    return {};
  }
  return nodes_[idx].children;
}

auto ActionTree::parent(ActionIndex idx) const noexcept -> ActionIndex {
  return idx < nodes_.size() ? nodes_[idx].parent : kInvalidAction;
}

auto ActionTree::action(ActionIndex idx) const -> const Action & {
  return nodes_.at(idx).action;
}

auto ActionTree::subtree_size(ActionIndex idx) const noexcept -> std::size_t {
  return idx < nodes_.size() ? nodes_[idx].subtree : 0;
}

auto ActionTree::find(std::string_view key) const -> ActionIndex {
  auto it = key_to_idx_.find(std::string(key));
  return it != key_to_idx_.end() ? it->second : kInvalidAction;
}

auto ActionTree::validate() const -> Result<void> {
  for (const auto &slot : nodes_) {
    if (auto r = validate_action(slot.action); !r) {
      return r;
    }
  }
  return ok();
}

} // namespace jobforge
