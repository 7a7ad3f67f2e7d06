#pragma once

#include <filesystem>
#include <gtest/gtest.h>
#include <initializer_list>
#include <string>
#include <vector>

namespace lifter::test {

// Result of running a CLI command
struct CliResult {
  int exit_code;
  std::string combined_output;  // stdout + stderr interleaved

  [[nodiscard]] auto Success() const -> bool {
    return exit_code == 0;
  }

  [[nodiscard]] auto Contains(const std::string& text) const -> bool {
    return combined_output.find(text) != std::string::npos;
  }
};

// Runs the lifter binary inside a scratch directory named after the current
// test, removed again on teardown.
class CliTestFixture : public ::testing::Test {
 protected:
  void SetUp() override;
  void TearDown() override;

  auto Run(std::initializer_list<std::string> args) -> CliResult {
    return RunIn(test_dir_, args);
  }

  // Run lifter from a specific directory
  auto RunIn(
      const std::filesystem::path& dir, std::initializer_list<std::string> args)
      -> CliResult;

  // Create a file in the test directory
  void WriteFile(
      const std::filesystem::path& relative_path, const std::string& content);

  // Create a minimal lifter.toml
  void WriteLifterToml(
      const std::string& name, const std::vector<std::string>& files);

  // Unit with one destructible type and a procedure that owns one value
  void WriteCleanUnit(const std::string& filename);

  // Unit whose procedure discards a destructible call result
  void WriteLeakingUnit(const std::string& filename);

  // Get path to test directory
  [[nodiscard]] auto TestDir() const -> const std::filesystem::path& {
    return test_dir_;
  }

  // Check if a file exists in test directory
  [[nodiscard]] auto FileExists(
      const std::filesystem::path& relative_path) const -> bool;

  // Read file contents from test directory
  [[nodiscard]] auto ReadFile(const std::filesystem::path& relative_path) const
      -> std::string;

 private:
  std::filesystem::path test_dir_;
  std::filesystem::path lifter_bin_;
};

}  // namespace lifter::test
