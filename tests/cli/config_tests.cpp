#include <gtest/gtest.h>

#include "tests/cli/cli_test_fixture.hpp"

namespace lifter::test {
namespace {

class ConfigTest : public CliTestFixture {};

// Test: lifter check fails without config or files
TEST_F(ConfigTest, CheckFailsWithoutConfigOrFiles) {
  auto result = Run({"check"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("no input files")) << result.combined_output;
}

// Test: lifter dump fails without config or files
TEST_F(ConfigTest, DumpFailsWithoutConfigOrFiles) {
  auto result = Run({"dump", "table"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("no input files")) << result.combined_output;
}

// Test: files listed in lifter.toml are analyzed
TEST_F(ConfigTest, CheckUsesConfiguredFiles) {
  WriteLeakingUnit("leak.yaml");
  WriteLifterToml("proj", {"leak.yaml"});

  auto result = Run({"check"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("[IllegalDestructibleUsage]"))
      << result.combined_output;
}

// Test: files on the command line replace the configured ones
TEST_F(ConfigTest, CommandLineFilesOverrideConfig) {
  WriteLeakingUnit("leak.yaml");
  WriteCleanUnit("clean.yaml");
  WriteLifterToml("proj", {"leak.yaml"});

  auto result = Run({"check", "clean.yaml"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
}

// Test: lifter.toml is found from a subdirectory
TEST_F(ConfigTest, ConfigFoundFromSubdirectory) {
  WriteCleanUnit("units/clean.yaml");
  WriteLifterToml("proj", {"units/clean.yaml"});
  WriteFile("sub/dir/.keep", "");

  auto result = RunIn(TestDir() / "sub" / "dir", {"check"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
}

// Test: -C changes the working directory first
TEST_F(ConfigTest, ChangeDirectoryOption) {
  WriteCleanUnit("proj/clean.yaml");
  WriteFile(
      "proj/lifter.toml",
      "[package]\nname = \"proj\"\n\n[sources]\nfiles = [\"clean.yaml\"]\n");

  auto result = Run({"-C", "proj", "check"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
}

TEST_F(ConfigTest, MissingSourceFileIsReported) {
  WriteLifterToml("proj", {"gone.yaml"});

  auto result = Run({"check"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(
      result.Contains("source file not found: gone.yaml (listed in "
                      "lifter.toml)"))
      << result.combined_output;
}

TEST_F(ConfigTest, MissingPackageSection) {
  WriteFile("lifter.toml", "[sources]\nfiles = [\"a.yaml\"]\n");

  auto result = Run({"check"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("missing [package] section"))
      << result.combined_output;
}

TEST_F(ConfigTest, EmptySourceList) {
  WriteLifterToml("proj", {});

  auto result = Run({"check"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("missing or empty 'sources.files'"))
      << result.combined_output;
}

TEST_F(ConfigTest, UnparsableToml) {
  WriteFile("lifter.toml", "[package\nname = \n");

  auto result = Run({"check"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("failed to parse")) << result.combined_output;
}

// Test: [policy] narrows where destructible values may be created
TEST_F(ConfigTest, PolicyNarrowsDestructibleContexts) {
  WriteCleanUnit("clean.yaml");
  WriteFile(
      "lifter.toml",
      "[package]\nname = \"proj\"\n\n[sources]\nfiles = [\"clean.yaml\"]\n"
      "\n[policy]\ndestructible_contexts = [\"return-value\"]\n");

  auto result = Run({"check"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("cannot be used as a var-init in 'main'"))
      << result.combined_output;
  EXPECT_TRUE(result.Contains("allowed contexts: return-value"))
      << result.combined_output;
}

TEST_F(ConfigTest, PolicyRejectsUnknownSite) {
  WriteCleanUnit("clean.yaml");
  WriteFile(
      "lifter.toml",
      "[package]\nname = \"proj\"\n\n[sources]\nfiles = [\"clean.yaml\"]\n"
      "\n[policy]\ndestructible_contexts = [\"field-init\"]\n");

  auto result = Run({"check"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains(
      "unknown site 'field-init' in 'policy.destructible_contexts'"))
      << result.combined_output;
}

TEST_F(ConfigTest, LogLevelIsValidated) {
  WriteCleanUnit("clean.yaml");
  WriteFile(
      "lifter.toml",
      "[package]\nname = \"proj\"\n\n[sources]\nfiles = [\"clean.yaml\"]\n"
      "\n[log]\nlevel = \"loud\"\n");

  auto result = Run({"check"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("unknown log level 'loud'"))
      << result.combined_output;
}

TEST_F(ConfigTest, DebugLogLevelTracesPhases) {
  WriteCleanUnit("clean.yaml");
  WriteFile(
      "lifter.toml",
      "[package]\nname = \"proj\"\n\n[sources]\nfiles = [\"clean.yaml\"]\n"
      "\n[log]\nlevel = \"debug\"\n");

  auto result = Run({"check"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_TRUE(result.Contains("[lifter][debug]")) << result.combined_output;
}

}  // namespace
}  // namespace lifter::test
