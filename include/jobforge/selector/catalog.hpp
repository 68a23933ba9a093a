#pragma once

#include "jobforge/core/coroutine.hpp"
#include "jobforge/core/error.hpp"
#include "jobforge/job/task.hpp"
#include "jobforge/selector/entity.hpp"

#include <cstddef>
#include <vector>

namespace jobforge {

class NodeCatalog {
public:
  virtual ~NodeCatalog() = default;

  /// Stable order: two calls against an unchanged catalogue return the same
  /// page. An empty page ends the listing.
  [[nodiscard]] virtual auto list_nodes(std::size_t offset, std::size_t limit)
      -> task<Result<std::vector<Node>>> = 0;
};

class UserCatalog {
public:
  virtual ~UserCatalog() = default;

  [[nodiscard]] virtual auto list_users(std::size_t offset, std::size_t limit)
      -> task<Result<std::vector<User>>> = 0;
};

// Interprets the opaque sub-queries of a Query.
class QueryEvaluator {
public:
  virtual ~QueryEvaluator() = default;

  [[nodiscard]] virtual auto search_nodes(const Query &query)
      -> task<Result<std::vector<Node>>> = 0;
  [[nodiscard]] virtual auto search_users(const Query &query)
      -> task<Result<std::vector<User>>> = 0;

  [[nodiscard]] virtual auto matches(const Query &query, const Node &node)
      -> bool = 0;
  [[nodiscard]] virtual auto matches(const Query &query, const User &user)
      -> bool = 0;
  [[nodiscard]] virtual auto matches(const Query &query,
                                     const ActionMessage &message) -> bool = 0;
};

} // namespace jobforge
