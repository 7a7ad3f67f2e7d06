#include "check.hpp"

#include <fmt/core.h>

#include "pipeline.hpp"
#include "print.hpp"
#include "verbose_logger.hpp"

namespace lifter::driver {

auto Check(const CompilationInput& input) -> int {
  VerboseLogger vlog(input.verbose);

  auto result = RunPipeline(input, vlog);
  if (!result) {
    PrintError(result.error().primary.message);
    return 1;
  }

  PrintDiagnostics(result->diagnostics, &result->sources);
  if (input.stats) {
    vlog.PrintPhaseSummary();
  }
  if (result->diagnostics.HasErrors()) {
    return 1;
  }
  if (vlog.Enabled(1)) {
    fmt::print(
        stderr, "[lifter] {} unit{} checked\n", result->units.size(),
        result->units.size() == 1 ? "" : "s");
  }
  return 0;
}

}  // namespace lifter::driver
