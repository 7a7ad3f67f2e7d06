#include <filesystem>
#include <gtest/gtest.h>

#include "tests/cli/cli_test_fixture.hpp"

namespace lifter::test {
namespace {

class InitTest : public CliTestFixture {};

// Test: lifter init <name> creates a new project directory
TEST_F(InitTest, CreatesProjectDirectory) {
  auto result = Run({"init", "myproj"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_TRUE(FileExists("myproj/lifter.toml"));
  EXPECT_TRUE(FileExists("myproj/myproj.yaml"));
}

// Test: lifter init <name> creates correct lifter.toml content
TEST_F(InitTest, CreatesCorrectTomlContent) {
  auto result = Run({"init", "hello"});

  EXPECT_TRUE(result.Success()) << result.combined_output;

  auto toml = ReadFile("hello/lifter.toml");
  EXPECT_NE(toml.find("name = \"hello\""), std::string::npos);
  EXPECT_NE(toml.find("files = [\"hello.yaml\"]"), std::string::npos);
}

// Test: the starter unit names itself after the project
TEST_F(InitTest, CreatesStarterUnit) {
  auto result = Run({"init", "pool"});

  EXPECT_TRUE(result.Success()) << result.combined_output;

  auto unit = ReadFile("pool/pool.yaml");
  EXPECT_NE(unit.find("unit: pool"), std::string::npos);
  EXPECT_NE(unit.find("\"=destroy\""), std::string::npos);
}

// Test: a fresh project checks cleanly
TEST_F(InitTest, NewProjectChecksCleanly) {
  ASSERT_TRUE(Run({"init", "fresh"}).Success());

  auto result = RunIn(TestDir() / "fresh", {"check"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
}

// Test: a fresh project schedules the starter destroy
TEST_F(InitTest, NewProjectDumpsSchedule) {
  ASSERT_TRUE(Run({"init", "fresh"}).Success());

  auto result = RunIn(TestDir() / "fresh", {"dump", "schedule"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_TRUE(result.Contains("=destroy[Handle](h)")) << result.combined_output;
}

// Test: lifter init fails if directory already exists
TEST_F(InitTest, FailsIfDirectoryExists) {
  std::filesystem::create_directories(TestDir() / "existing");

  auto result = Run({"init", "existing"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("already exists")) << result.combined_output;
}

// Test: lifter init (no args) initializes in current directory
TEST_F(InitTest, InitializesCurrentDirectory) {
  WriteFile("proj/.keep", "");

  auto result = RunIn(TestDir() / "proj", {"init"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_TRUE(FileExists("proj/lifter.toml"));
  // No unit file when initializing an existing directory
  EXPECT_FALSE(FileExists("proj/proj.yaml"));
  EXPECT_TRUE(result.Contains("Created project 'proj'"))
      << result.combined_output;
}

// Test: lifter init (no args) fails if lifter.toml already exists
TEST_F(InitTest, FailsIfTomlExistsWithoutForce) {
  WriteFile("lifter.toml", "[package]\nname = \"old\"\n");

  auto result = Run({"init"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(
      result.Contains("lifter.toml already exists (use --force to overwrite)"))
      << result.combined_output;
}

// Test: lifter init --force overwrites existing lifter.toml
TEST_F(InitTest, ForceOverwritesToml) {
  WriteFile("lifter.toml", "[package]\nname = \"old\"\n");

  auto result = Run({"init", "--force"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  auto toml = ReadFile("lifter.toml");
  EXPECT_EQ(toml.find("name = \"old\""), std::string::npos);
}

// Test: lifter init -f (short flag) works
TEST_F(InitTest, ShortForceFlagWorks) {
  WriteFile("lifter.toml", "[package]\nname = \"old\"\n");

  auto result = Run({"init", "-f"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
}

// Test: Output message for new project
TEST_F(InitTest, OutputMessageForNewProject) {
  auto result = Run({"init", "newproj"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_TRUE(result.Contains("Created project 'newproj'"))
      << result.combined_output;
}

}  // namespace
}  // namespace lifter::test
