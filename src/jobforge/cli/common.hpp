#pragma once

#include "jobforge/config/config.hpp"

#include <filesystem>
#include <print>
#include <string_view>

namespace jobforge::cli {

inline auto load_config_or_print(std::string_view path) -> Result<SystemConfig> {
  return ConfigLoader::load_from_file(path).or_else(
      [&](std::error_code ec) -> Result<SystemConfig> {
        std::println(stderr, "Error: {}", ec.message());
        return fail(ec);
      });
}

/// Relative job and catalogue paths are taken relative to the config file.
inline auto resolve_paths(SystemConfig &config, std::string_view config_file)
    -> void {
  std::filesystem::path base = std::filesystem::current_path();
  std::filesystem::path cfg_path{config_file};
  if (!cfg_path.empty()) {
    base = std::filesystem::absolute(cfg_path).parent_path();
  }
  auto resolve = [&](std::string &value) {
    if (value.empty()) {
      return;
    }
    std::filesystem::path p{value};
    if (p.is_relative()) {
      value = std::filesystem::weakly_canonical(base / p).string();
    }
  };
  resolve(config.job_source.directory);
  resolve(config.job_source.catalog_file);
}

} // namespace jobforge::cli
