#pragma once

#include "jobforge/core/error.hpp"
#include "jobforge/job/job.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace jobforge {

// Reads a job from TOML:
//
//   id = "thumbnails"
//   events = ["node.created"]
//   max_concurrency = 2
//
//   [schedule]
//   iso8601 = "R/2024-01-01T00:00:00Z/PT1H"
//   min_delta = "PT10M"
//
//   [[actions]]
//   key = "scan"
//   action = "shell"
//   parameters = { command = "ls" }
//   nodes = { query = ["path:/photos/*"], collect = true }
//
//   [[actions]]
//   after = "scan"
//   action = "log"
//
// Actions form a tree through `after`, which must name an earlier action.
class JobDefinitionLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path,
                                           std::string *diagnostic = nullptr)
      -> Result<Job>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str,
                                             std::string *diagnostic = nullptr)
      -> Result<Job>;
};

struct JobFile {
  std::filesystem::path path;
  Job job;
};

class JobFileLoader {
public:
  explicit JobFileLoader(std::string_view directory);

  /// Loads every `*.toml` in the directory. Files that fail to parse are
  /// logged and skipped; a missing directory yields an empty list.
  [[nodiscard]] auto load_all() -> Result<std::vector<JobFile>>;
  [[nodiscard]] auto load_file(const std::filesystem::path &path)
      -> Result<JobFile>;

  [[nodiscard]] auto directory() const -> const std::filesystem::path & {
    return directory_;
  }

private:
  std::filesystem::path directory_;
};

} // namespace jobforge
