#pragma once

#include "jobforge/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <chrono>
#include <cstdint>
#include <flat_map>
#include <functional>
#include <string>
#include <vector>

namespace jobforge {

enum class NodeType : std::uint8_t { Unknown, Leaf, Collection };
BOOST_DESCRIBE_ENUM(NodeType, Unknown, Leaf, Collection)
JOBFORGE_DEFINE_ENUM_SERDE(NodeType)

using MetaMap = std::flat_map<std::string, std::string, std::less<>>;

/// A filesystem-like entry of the node catalogue.
struct Node {
  std::string uuid;
  std::string path;
  NodeType type{NodeType::Unknown};
  std::int64_t size{0};
  std::chrono::system_clock::time_point mtime{};
  MetaMap meta;

  auto operator==(const Node &) const -> bool = default;
};

struct User {
  std::string uuid;
  std::string login;
  std::string group_path{"/"};
  bool is_group{false};
  MetaMap attributes;

  auto operator==(const User &) const -> bool = default;
};

struct ActivityObject {
  std::string id;
  std::string type;
  std::string name;

  auto operator==(const ActivityObject &) const -> bool = default;
};

enum class QueryOperator : std::uint8_t { Or, And };
BOOST_DESCRIBE_ENUM(QueryOperator, Or, And)
JOBFORGE_DEFINE_ENUM_SERDE(QueryOperator)

/// Opaque to the core: sub-queries are interpreted by the QueryEvaluator.
struct Query {
  std::vector<std::string> sub_queries;
  QueryOperator op{QueryOperator::Or};

  [[nodiscard]] auto empty() const noexcept -> bool {
    return sub_queries.empty();
  }
  auto operator==(const Query &) const -> bool = default;
};

} // namespace jobforge
