#pragma once

#include "jobforge/selector/catalog.hpp"

#include <vector>

namespace jobforge {

// Catalogue held in memory. Populate it before the runtime starts; listings
// may then run concurrently from any shard.
class InMemoryCatalog final : public NodeCatalog, public UserCatalog {
public:
  InMemoryCatalog() = default;
  InMemoryCatalog(std::vector<Node> nodes, std::vector<User> users)
      : nodes_(std::move(nodes)), users_(std::move(users)) {}

  auto add_node(Node node) -> void { nodes_.push_back(std::move(node)); }
  auto add_user(User user) -> void { users_.push_back(std::move(user)); }

  [[nodiscard]] auto node_count() const noexcept -> std::size_t {
    return nodes_.size();
  }
  [[nodiscard]] auto user_count() const noexcept -> std::size_t {
    return users_.size();
  }

  [[nodiscard]] auto list_nodes(std::size_t offset, std::size_t limit)
      -> task<Result<std::vector<Node>>> override;
  [[nodiscard]] auto list_users(std::size_t offset, std::size_t limit)
      -> task<Result<std::vector<User>>> override;

private:
  std::vector<Node> nodes_;
  std::vector<User> users_;
};

} // namespace jobforge
