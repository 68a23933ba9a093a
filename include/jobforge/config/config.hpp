#pragma once

#include "jobforge/config/system_config.hpp"
#include "jobforge/core/error.hpp"

#include <string_view>

namespace jobforge {

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str)
      -> Result<SystemConfig>;
  /// Apply JOBFORGE_* environment overrides and re-check the ranges.
  [[nodiscard]] static auto apply_env_overrides(SystemConfig cfg)
      -> Result<SystemConfig>;
};

} // namespace jobforge
