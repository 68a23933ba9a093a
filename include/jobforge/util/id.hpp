#pragma once

#include <algorithm>
#include <cctype>
#include <concepts>
#include <format>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace jobforge {

[[nodiscard]] inline auto is_valid_id_text(std::string_view value) noexcept
    -> bool {
  return !value.empty() &&
         std::none_of(value.begin(), value.end(), [](unsigned char ch) {
           return std::iscntrl(ch) != 0;
         });
}

// Phantom type tags for type-safe ID disambiguation
struct JobTag {};
struct TaskTag {};
struct ActionTag {};

template <typename Tag> class TypedId {
public:
  explicit TypedId(std::string value) : value_(std::move(value)) {}
  explicit TypedId(std::string_view value) : value_(value) {}
  explicit TypedId(const char *value) : value_(value ? value : "") {}

  TypedId() = default;

  [[nodiscard]] auto value() const noexcept -> std::string_view {
    return value_;
  }
  [[nodiscard]] auto str() const noexcept -> const std::string & {
    return value_;
  }

  [[nodiscard]] friend auto operator<=>(const TypedId &lhs,
                                        const TypedId &rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId &lhs, const TypedId &rhs)
      -> bool = default;

  [[nodiscard]] friend auto operator==(const TypedId &lhs,
                                       std::string_view rhs) noexcept -> bool {
    return lhs.value_ == rhs;
  }

  [[nodiscard]] auto empty() const noexcept -> bool { return value_.empty(); }

private:
  std::string value_;
};

using JobId = TypedId<JobTag>;
using TaskId = TypedId<TaskTag>;
/// Names the handler an action is dispatched to.
using ActionId = TypedId<ActionTag>;

template <typename Tag>
inline auto operator<<(std::ostream &os, const TypedId<Tag> &id)
    -> std::ostream & {
  return os << id.value();
}

} // namespace jobforge

// `is_avalanching` makes ankerl::unordered_dense::hash delegate here instead
// of hashing the std::string object representation.
template <typename Tag> struct std::hash<jobforge::TypedId<Tag>> {
  using is_avalanching = void;
  auto operator()(const jobforge::TypedId<Tag> &id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<jobforge::TypedId<Tag>>
    : std::formatter<std::string_view> {
  auto format(const jobforge::TypedId<Tag> &id, auto &ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};

namespace jobforge {

namespace detail {
[[nodiscard]] auto generate_uuid_v7_like() -> std::string;
} // namespace detail

[[nodiscard]] inline auto generate_task_id() -> TaskId {
  return TaskId{detail::generate_uuid_v7_like()};
}

} // namespace jobforge
