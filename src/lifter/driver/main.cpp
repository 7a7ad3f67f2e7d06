#include <argparse/argparse.hpp>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "check.hpp"
#include "config.hpp"
#include "dump.hpp"
#include "pipeline.hpp"
#include "print.hpp"

namespace {

namespace fs = std::filesystem;

void AddAnalysisFlags(argparse::ArgumentParser& cmd, int& verbosity) {
  cmd.add_argument("-v", "--verbose")
      .action([&verbosity](const auto&) { ++verbosity; })
      .append()
      .default_value(false)
      .implicit_value(true)
      .nargs(0)
      .help("Verbose output (repeatable: -v phases, -vv debug, -vvv trace)");
  cmd.add_argument("--stats")
      .default_value(false)
      .implicit_value(true)
      .help("Print phase timing summary");
}

// Command line beats lifter.toml; lifter.toml beats the warn default.
void ConfigureLogging(
    int verbosity, const std::optional<lifter::driver::ProjectConfig>& config) {
  spdlog::set_pattern("[lifter][%l] %v");
  if (verbosity >= 3) {
    spdlog::set_level(spdlog::level::trace);
  } else if (verbosity == 2) {
    spdlog::set_level(spdlog::level::debug);
  } else if (config && !config->log_level.empty()) {
    spdlog::set_level(spdlog::level::from_str(config->log_level));
  } else {
    spdlog::set_level(spdlog::level::warn);
  }
}

auto LoadOptionalConfig() -> std::optional<lifter::driver::ProjectConfig> {
  auto config_path = lifter::driver::FindConfig();
  if (!config_path) {
    return std::nullopt;
  }
  auto config = lifter::driver::LoadConfig(*config_path);
  if (!config) {
    throw lifter::DiagnosticException(config.error());
  }
  return *config;
}

auto BuildInput(
    const argparse::ArgumentParser& cmd, int verbosity,
    const std::optional<lifter::driver::ProjectConfig>& config)
    -> std::optional<lifter::driver::CompilationInput> {
  lifter::driver::CompilationInput input;

  // Files: CLI replaces config entirely
  if (auto files = cmd.present<std::vector<std::string>>("files")) {
    input.files = *files;
  } else if (config) {
    input.files = config->files;
  }

  if (input.files.empty()) {
    lifter::driver::PrintError("no input files");
    return std::nullopt;
  }

  if (config) {
    input.destructible_contexts = config->destructible_contexts;
  }
  input.verbose = verbosity;
  input.stats = cmd.get<bool>("--stats");
  return input;
}

// Shared setup of check and dump: config, logging, input.
auto PrepareInput(const argparse::ArgumentParser& cmd, int verbosity)
    -> std::optional<lifter::driver::CompilationInput> {
  std::optional<lifter::driver::ProjectConfig> config;
  try {
    config = LoadOptionalConfig();
  } catch (const std::exception& e) {
    lifter::driver::PrintError(e.what());
    return std::nullopt;
  }
  ConfigureLogging(verbosity, config);
  return BuildInput(cmd, verbosity, config);
}

auto CheckCommand(const argparse::ArgumentParser& cmd, int verbosity) -> int {
  auto input = PrepareInput(cmd, verbosity);
  if (!input) {
    return 1;
  }
  return lifter::driver::Check(*input);
}

auto DumpCommand(const argparse::ArgumentParser& cmd, int verbosity) -> int {
  auto format = cmd.get<std::string>("format");

  if (format != "table" && format != "schedule" && format != "sites" &&
      format != "all") {
    lifter::driver::PrintError(
        "unknown format '" + format +
        "', use 'table', 'schedule', 'sites', or 'all'");
    return 1;
  }

  auto input = PrepareInput(cmd, verbosity);
  if (!input) {
    return 1;
  }
  return lifter::driver::Dump(*input, format);
}

auto InitCommand(const argparse::ArgumentParser& cmd) -> int {
  std::optional<std::string> name;
  if (auto n = cmd.present<std::string>("name")) {
    name = *n;
  }
  bool force = cmd.get<bool>("--force");

  fs::path project_dir;
  std::string project_name;
  bool create_directory = false;

  if (name) {
    project_dir = fs::path(*name);
    if (project_dir.is_relative()) {
      project_dir = fs::current_path() / project_dir;
    }
    project_name = project_dir.filename().string();
    create_directory = true;

    if (fs::exists(project_dir)) {
      lifter::driver::PrintError(
          fmt::format("directory '{}' already exists", project_dir.string()));
      return 1;
    }
  } else {
    project_dir = fs::current_path();
    project_name = project_dir.filename().string();

    if (fs::exists(project_dir / lifter::driver::kConfigFileName) && !force) {
      lifter::driver::PrintError(
          "lifter.toml already exists (use --force to overwrite)");
      return 1;
    }
  }

  try {
    if (create_directory) {
      fs::create_directories(project_dir);

      std::ofstream unit_file(project_dir / (project_name + ".yaml"));
      unit_file << fmt::format(
          "unit: {}\n"
          "types:\n"
          "  - object: Handle\n"
          "    fields:\n"
          "      - {{name: fd, type: int}}\n"
          "operators:\n"
          "  - name: \"=destroy\"\n"
          "    params:\n"
          "      - {{name: h, type: Handle}}\n"
          "    impl: close_handle\n"
          "procs:\n"
          "  - name: main\n"
          "    body:\n"
          "      - var: h\n"
          "        init: {{construct: Handle}}\n",
          project_name);
    }

    std::ofstream toml_file(project_dir / lifter::driver::kConfigFileName);
    toml_file << fmt::format(
        "[package]\n"
        "name = \"{}\"\n"
        "\n"
        "[sources]\n"
        "files = [\"{}.yaml\"]\n",
        project_name, project_name);

    std::cout << fmt::format("Created project '{}'\n", project_name);
    return 0;
  } catch (const std::exception& e) {
    lifter::driver::PrintError(e.what());
    return 1;
  }
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
  int verbosity = 0;

  argparse::ArgumentParser program("lifter", "0.1.0");
  program.add_description(
      "Lifecycle operation binding, lifting and scope-exit analysis");
  program.add_argument("-C").help("Run as if started in <dir>").metavar("dir");

  // Subcommand: check
  argparse::ArgumentParser check_cmd("check");
  check_cmd.add_description("Analyze compilation units and report errors");
  AddAnalysisFlags(check_cmd, verbosity);
  check_cmd.add_argument("files").remaining().help(
      "Unit files (uses lifter.toml if not specified)");

  // Subcommand: dump
  argparse::ArgumentParser dump_cmd("dump");
  dump_cmd.add_description("Dump analysis results (for debugging)");
  dump_cmd.add_argument("format").help(
      "Output format: table, schedule, sites, or all");
  AddAnalysisFlags(dump_cmd, verbosity);
  dump_cmd.add_argument("files").remaining().help(
      "Unit files (uses lifter.toml if not specified)");

  // Subcommand: init
  argparse::ArgumentParser init_cmd("init");
  init_cmd.add_description("Create a new lifter project");
  init_cmd.add_argument("name").nargs(0, 1).help("Project name");
  init_cmd.add_argument("--force", "-f")
      .default_value(false)
      .implicit_value(true)
      .help("Overwrite existing lifter.toml");

  program.add_subparser(check_cmd);
  program.add_subparser(dump_cmd);
  program.add_subparser(init_cmd);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    lifter::driver::PrintError(err.what());
    std::cerr << program;
    return 1;
  }

  // Handle -C before dispatching subcommands
  if (auto dir = program.present("-C")) {
    std::error_code ec;
    fs::current_path(*dir, ec);
    if (ec) {
      lifter::driver::PrintError(
          fmt::format("cannot change to '{}': {}", *dir, ec.message()));
      return 1;
    }
  }

  if (program.is_subcommand_used("check")) {
    return CheckCommand(check_cmd, verbosity);
  }

  if (program.is_subcommand_used("dump")) {
    return DumpCommand(dump_cmd, verbosity);
  }

  if (program.is_subcommand_used("init")) {
    return InitCommand(init_cmd);
  }

  // No subcommand provided
  std::cout << program;
  return 0;
}
