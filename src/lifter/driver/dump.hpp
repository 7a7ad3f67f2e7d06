#pragma once

#include <string>

namespace lifter::driver {

struct CompilationInput;

// Print the requested view of the analysis to stdout: "table", "schedule",
// "sites" or "all". Diagnostics still go to stderr.
auto Dump(const CompilationInput& input, const std::string& format) -> int;

}  // namespace lifter::driver
