#pragma once

#include "jobforge/core/error.hpp"
#include "jobforge/selector/entity.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace jobforge {

struct CatalogDefinition {
  std::vector<Node> nodes;
  std::vector<User> users;
};

// `[[nodes]]` (uuid, path, type, size, mtime, meta) and `[[users]]` (uuid,
// login, group, is_group, attributes) tables.
class CatalogDefinitionLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path,
                                           std::string *diagnostic = nullptr)
      -> Result<CatalogDefinition>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str,
                                             std::string *diagnostic = nullptr)
      -> Result<CatalogDefinition>;
};

} // namespace jobforge
