#include "config.hpp"

#include <algorithm>
#include <array>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/core.h>
#include <toml++/toml.hpp>

#include "lifter/common/diagnostic/diagnostic.hpp"
#include "lifter/lifecycle/context.hpp"

namespace lifter::driver {

namespace fs = std::filesystem;

namespace {

constexpr std::array<std::string_view, 6> kLogLevels = {
    "trace", "debug", "info", "warn", "error", "off"};

auto ConfigError(const fs::path& config_path, std::string_view message)
    -> std::unexpected<Diagnostic> {
  return std::unexpected(
      Diagnostic::HostError(
          fmt::format("{}: {}", config_path.string(), message)));
}

}  // namespace

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / kConfigFileName;
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto LoadConfig(const fs::path& config_path) -> lifter::Result<ProjectConfig> {
  ProjectConfig config;
  config.root_dir = config_path.parent_path();

  toml::table tbl;
  try {
    tbl = toml::parse_file(config_path.string());
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "failed to parse {}: {}", config_path.string(),
                e.description())));
  }

  // [package] section
  auto package = tbl["package"];
  if (!package) {
    return ConfigError(config_path, "missing [package] section");
  }

  auto name = package["name"].value<std::string>();
  if (!name) {
    return ConfigError(config_path, "missing required field 'package.name'");
  }
  config.name = *name;

  // [sources] section
  auto sources = tbl["sources"];
  if (!sources) {
    return ConfigError(config_path, "missing [sources] section");
  }

  auto* files_arr = sources["files"].as_array();
  if (files_arr == nullptr || files_arr->empty()) {
    return ConfigError(config_path, "missing or empty 'sources.files'");
  }
  for (const auto& elem : *files_arr) {
    if (auto str = elem.value<std::string>()) {
      // Resolve relative paths against config directory
      fs::path file_path = *str;
      if (file_path.is_relative()) {
        file_path = config.root_dir / file_path;
      }
      if (!fs::exists(file_path)) {
        return std::unexpected(
            Diagnostic::HostError(
                fmt::format(
                    "source file not found: {} (listed in {})", *str,
                    kConfigFileName)));
      }
      config.files.push_back(file_path.string());
    }
  }

  // [policy] section (optional)
  if (auto policy = tbl["policy"]) {
    if (auto* arr = policy["destructible_contexts"].as_array()) {
      for (const auto& elem : *arr) {
        auto str = elem.value<std::string>();
        if (!str || !lifecycle::ParseSiteKind(*str)) {
          return ConfigError(
              config_path,
              fmt::format(
                  "unknown site '{}' in 'policy.destructible_contexts'",
                  str.value_or("")));
        }
        config.destructible_contexts.push_back(*str);
      }
    }
  }

  // [log] section (optional)
  if (auto log = tbl["log"]) {
    if (auto level = log["level"].value<std::string>()) {
      if (std::ranges::find(kLogLevels, *level) == kLogLevels.end()) {
        return ConfigError(
            config_path, fmt::format("unknown log level '{}'", *level));
      }
      config.log_level = *level;
    }
  }

  return config;
}

}  // namespace lifter::driver
