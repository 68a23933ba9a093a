#pragma once

#include "jobforge/selector/catalog.hpp"

#include <cstddef>
#include <string_view>

namespace jobforge {

// Default evaluator. Each sub-query is `field:pattern` (or a bare pattern
// against the default field) matched with shell-style globbing.
//   nodes:    path (default), name, uuid, type, meta.<key>
//   users:    login (default), uuid, group, attr.<key>
//   messages: body (default, last output), error, success, event
class GlobQueryEvaluator final : public QueryEvaluator {
public:
  GlobQueryEvaluator(NodeCatalog &nodes, UserCatalog &users,
                     std::size_t page_size = 256)
      : nodes_(nodes), users_(users), page_size_(page_size) {}

  [[nodiscard]] auto search_nodes(const Query &query)
      -> task<Result<std::vector<Node>>> override;
  [[nodiscard]] auto search_users(const Query &query)
      -> task<Result<std::vector<User>>> override;

  [[nodiscard]] auto matches(const Query &query, const Node &node)
      -> bool override;
  [[nodiscard]] auto matches(const Query &query, const User &user)
      -> bool override;
  [[nodiscard]] auto matches(const Query &query, const ActionMessage &message)
      -> bool override;

private:
  NodeCatalog &nodes_;
  UserCatalog &users_;
  std::size_t page_size_;
};

[[nodiscard]] auto glob_match(std::string_view pattern, std::string_view text)
    -> bool;

} // namespace jobforge
