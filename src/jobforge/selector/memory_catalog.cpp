#include "jobforge/selector/memory_catalog.hpp"

#include <algorithm>

namespace jobforge {

namespace {

template <typename T>
[[nodiscard]] auto page_of(const std::vector<T> &items, std::size_t offset,
                           std::size_t limit) -> std::vector<T> {
  if (offset >= items.size()) {
    return {};
  }
  const auto end = std::min(items.size(), offset + limit);
  return {items.begin() + static_cast<std::ptrdiff_t>(offset),
          items.begin() + static_cast<std::ptrdiff_t>(end)};
}

} // namespace

auto InMemoryCatalog::list_nodes(std::size_t offset, std::size_t limit)
    -> task<Result<std::vector<Node>>> {
  co_return ok(page_of(nodes_, offset, limit));
}

auto InMemoryCatalog::list_users(std::size_t offset, std::size_t limit)
    -> task<Result<std::vector<User>>> {
  co_return ok(page_of(users_, offset, limit));
}

} // namespace jobforge
