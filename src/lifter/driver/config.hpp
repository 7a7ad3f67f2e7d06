#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "lifter/common/diagnostic/diagnostic.hpp"

namespace lifter::driver {

inline constexpr const char* kConfigFileName = "lifter.toml";

struct ProjectConfig {
  std::string name;
  std::vector<std::string> files;

  // Site names where a destructible value may appear; empty keeps the
  // default policy.
  std::vector<std::string> destructible_contexts;

  // spdlog level name; empty leaves the level to the command line.
  std::string log_level;

  // Directory where lifter.toml was found
  std::filesystem::path root_dir;
};

// Search for lifter.toml starting from dir, going up to parent dirs.
// Returns nullopt if not found.
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse lifter.toml file.
// Returns error Diagnostic on parse errors or missing required fields.
auto LoadConfig(const std::filesystem::path& config_path)
    -> lifter::Result<ProjectConfig>;

}  // namespace lifter::driver
