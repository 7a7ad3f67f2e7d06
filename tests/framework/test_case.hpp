#pragma once

#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace lifter::test {

struct ExpectedOutput {
  std::optional<std::string> exact;
  std::vector<std::string> contains;
  std::vector<std::string> not_contains;

  [[nodiscard]] auto IsExact() const -> bool {
    return exact.has_value();
  }
};

struct TestCase {
  std::string name;
  std::string feature;
  std::string source_yaml;  // Path to YAML file for error reporting
  std::string unit;         // Unit description, in the loader's format

  // Sites where destructible values may be created; default policy if unset.
  std::optional<std::vector<std::string>> contexts;

  // Diagnostic code names in report order. Empty means a clean unit.
  std::vector<std::string> expected_diagnostics;
  bool expect_aborted = false;

  std::optional<ExpectedOutput> expected_table;
  std::map<std::string, ExpectedOutput> expected_schedules;  // by proc name
  std::optional<ExpectedOutput> expected_sites;
};

// GTest printer for readable test names
inline void PrintTo(const TestCase& test_case, std::ostream* os) {
  *os << test_case.feature << "/" << test_case.name;
}

}  // namespace lifter::test
