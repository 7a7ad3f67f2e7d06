#include "tests/cli/cli_test_fixture.hpp"

#include <array>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <initializer_list>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <sys/wait.h>

namespace lifter::test {

void CliTestFixture::SetUp() {
  const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
  test_dir_ = std::filesystem::temp_directory_path() /
              (std::string("lifter_cli_") + info->test_suite_name() + "_" +
               info->name());
  std::filesystem::remove_all(test_dir_);
  std::filesystem::create_directories(test_dir_);

  // Binary path is baked in by the build; LIFTER_BIN overrides it
  if (const char* bin = std::getenv("LIFTER_BIN")) {
    lifter_bin_ = bin;
  } else {
    lifter_bin_ = LIFTER_BINARY;
  }
}

void CliTestFixture::TearDown() {
  if (!test_dir_.empty()) {
    std::filesystem::remove_all(test_dir_);
  }
}

// Stdout and stderr are captured together through the shell.
auto CliTestFixture::RunIn(
    const std::filesystem::path& dir, std::initializer_list<std::string> args)
    -> CliResult {
  std::ostringstream cmd;
  cmd << "cd '" << dir.string() << "' && '" << lifter_bin_.string() << "'";
  for (const auto& arg : args) {
    cmd << " '" << arg << "'";
  }
  cmd << " 2>&1";

  FILE* pipe = popen(cmd.str().c_str(), "r");
  if (pipe == nullptr) {
    throw std::runtime_error("Failed to run: " + cmd.str());
  }
  std::string output;
  std::array<char, 4096> buffer{};
  while (fgets(buffer.data(), buffer.size(), pipe) != nullptr) {
    output += buffer.data();
  }
  int status = pclose(pipe);

  return CliResult{
      .exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1,
      .combined_output = std::move(output),
  };
}

void CliTestFixture::WriteFile(
    const std::filesystem::path& relative_path, const std::string& content) {
  auto full_path = test_dir_ / relative_path;
  std::filesystem::create_directories(full_path.parent_path());
  std::ofstream out(full_path);
  if (!out) {
    throw std::runtime_error("Failed to create file: " + full_path.string());
  }
  out << content;
}

void CliTestFixture::WriteLifterToml(
    const std::string& name, const std::vector<std::string>& files) {
  std::ostringstream toml;
  toml << "[package]\n";
  toml << "name = \"" << name << "\"\n";
  toml << "\n[sources]\n";
  toml << "files = [";
  for (size_t i = 0; i < files.size(); ++i) {
    if (i > 0) {
      toml << ", ";
    }
    toml << "\"" << files[i] << "\"";
  }
  toml << "]\n";
  WriteFile("lifter.toml", toml.str());
}

void CliTestFixture::WriteCleanUnit(const std::string& filename) {
  WriteFile(
      filename,
      "types:\n"
      "  - object: Handle\n"
      "    fields: [{name: fd, type: int}]\n"
      "operators:\n"
      "  - name: \"=destroy\"\n"
      "    params: [{name: h, type: Handle}]\n"
      "procs:\n"
      "  - name: main\n"
      "    body:\n"
      "      - var: h\n"
      "        init: {construct: Handle}\n");
}

void CliTestFixture::WriteLeakingUnit(const std::string& filename) {
  WriteFile(
      filename,
      "types:\n"
      "  - object: Handle\n"
      "operators:\n"
      "  - name: \"=destroy\"\n"
      "    params: [{name: h, type: Handle}]\n"
      "procs:\n"
      "  - name: leak\n"
      "    body:\n"
      "      - expr: {call: open, type: Handle}\n");
}

auto CliTestFixture::FileExists(
    const std::filesystem::path& relative_path) const -> bool {
  return std::filesystem::exists(test_dir_ / relative_path);
}

auto CliTestFixture::ReadFile(const std::filesystem::path& relative_path) const
    -> std::string {
  auto full_path = test_dir_ / relative_path;
  std::ifstream in(full_path);
  if (!in) {
    throw std::runtime_error("Failed to read file: " + full_path.string());
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

}  // namespace lifter::test
