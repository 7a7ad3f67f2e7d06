#pragma once

namespace lifter::driver {

struct CompilationInput;

// Analyze every input file and print the diagnostics. Returns the process
// exit code.
auto Check(const CompilationInput& input) -> int;

}  // namespace lifter::driver
