#include "jobforge/config/catalog_definition.hpp"
#include "jobforge/config/toml_util.hpp"

#include "jobforge/util/log.hpp"
#include "jobforge/util/time.hpp"

#include <glaze/toml.hpp>

#include <cstdint>
#include <format>
#include <map>
#include <string>
#include <vector>

namespace jobforge {
namespace detail {

struct NodeToml {
  std::string uuid;
  std::string path;
  std::string type{"leaf"};
  std::int64_t size{0};
  std::string mtime;
  std::map<std::string, std::string> meta;
};

struct UserToml {
  std::string uuid;
  std::string login;
  std::string group{"/"};
  bool is_group{false};
  std::map<std::string, std::string> attributes;
};

struct CatalogToml {
  std::vector<NodeToml> nodes;
  std::vector<UserToml> users;
};

} // namespace detail
} // namespace jobforge

namespace glz {
template <> struct meta<jobforge::detail::NodeToml> {
  using T = jobforge::detail::NodeToml;
  static constexpr auto value =
      object("uuid", &T::uuid, "path", &T::path, "type", &T::type, "size",
             &T::size, "mtime", &T::mtime, "meta", &T::meta);
};

template <> struct meta<jobforge::detail::UserToml> {
  using T = jobforge::detail::UserToml;
  static constexpr auto value =
      object("uuid", &T::uuid, "login", &T::login, "group", &T::group,
             "is_group", &T::is_group, "attributes", &T::attributes);
};

template <> struct meta<jobforge::detail::CatalogToml> {
  using T = jobforge::detail::CatalogToml;
  static constexpr auto value = object("nodes", &T::nodes, "users", &T::users);
};
} // namespace glz

namespace jobforge {
namespace {

[[nodiscard]] auto parse_node(const detail::NodeToml &raw) -> Result<Node> {
  if (raw.path.empty()) {
    log::warn("Catalogue node '{}' has no path", raw.uuid);
    return fail(Error::ConfigurationError);
  }
  const auto type = parse<NodeType>(raw.type);
  if (!type || *type == NodeType::Unknown) {
    log::warn("Catalogue node {} has an unknown type '{}'", raw.path,
              raw.type);
    return fail(Error::ConfigurationError);
  }
  Node node{.uuid = raw.uuid.empty() ? raw.path : raw.uuid,
            .path = raw.path,
            .type = *type,
            .size = raw.size,
            .meta = toml_util::to_flat_map(raw.meta)};
  if (!raw.mtime.empty()) {
    auto mtime = util::parse_iso8601_instant(raw.mtime);
    if (!mtime) {
      log::warn("Catalogue node {} has a malformed mtime '{}'", raw.path,
                raw.mtime);
      return fail(Error::ConfigurationError);
    }
    node.mtime = *mtime;
  }
  return ok(std::move(node));
}

[[nodiscard]] auto parse_user(const detail::UserToml &raw) -> Result<User> {
  if (raw.login.empty()) {
    log::warn("Catalogue user '{}' has no login", raw.uuid);
    return fail(Error::ConfigurationError);
  }
  return ok(User{.uuid = raw.uuid.empty() ? raw.login : raw.uuid,
                 .login = raw.login,
                 .group_path = raw.group,
                 .is_group = raw.is_group,
                 .attributes = toml_util::to_flat_map(raw.attributes)});
}

} // namespace

auto CatalogDefinitionLoader::load_from_file(std::string_view path,
                                             std::string *diagnostic)
    -> Result<CatalogDefinition> {
  auto text = toml_util::read_file(path, "catalogue file");
  if (!text) {
    return fail(text.error());
  }
  return load_from_string(*text, diagnostic);
}

auto CatalogDefinitionLoader::load_from_string(std::string_view toml_str,
                                               std::string *diagnostic)
    -> Result<CatalogDefinition> {
  auto raw = toml_util::parse_toml<detail::CatalogToml>(toml_str, diagnostic);
  if (!raw) {
    return fail(raw.error());
  }

  CatalogDefinition out;
  out.nodes.reserve(raw->nodes.size());
  for (const auto &item : raw->nodes) {
    auto node = parse_node(item);
    if (!node) {
      if (diagnostic) {
        *diagnostic = std::format("invalid node '{}'", item.path);
      }
      return fail(node.error());
    }
    out.nodes.push_back(std::move(*node));
  }
  out.users.reserve(raw->users.size());
  for (const auto &item : raw->users) {
    auto user = parse_user(item);
    if (!user) {
      if (diagnostic) {
        *diagnostic = std::format("invalid user '{}'", item.uuid);
      }
      return fail(user.error());
    }
    out.users.push_back(std::move(*user));
  }
  return ok(std::move(out));
}

} // namespace jobforge
