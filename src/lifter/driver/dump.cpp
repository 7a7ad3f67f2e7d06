#include "dump.hpp"

#include <iostream>
#include <string>

#include "lifter/lifecycle/dumper.hpp"
#include "pipeline.hpp"
#include "print.hpp"
#include "verbose_logger.hpp"

namespace lifter::driver {

auto Dump(const CompilationInput& input, const std::string& format) -> int {
  VerboseLogger vlog(input.verbose);

  auto result = RunPipeline(input, vlog);
  if (!result) {
    PrintError(result.error().primary.message);
    return 1;
  }
  PrintDiagnostics(result->diagnostics, &result->sources);

  bool many = result->units.size() > 1;
  for (const auto& entry : result->units) {
    if (many) {
      std::cout << "unit " << entry.unit->name << "\n";
    }
    lifecycle::Dumper dumper(entry.analysis.get(), &result->sources, &std::cout);
    if (format == "table") {
      dumper.DumpTable();
    } else if (format == "schedule") {
      dumper.DumpSchedules();
    } else if (format == "sites") {
      dumper.DumpSites();
    } else {
      dumper.DumpAll();
    }
  }

  if (input.stats) {
    vlog.PrintPhaseSummary();
  }
  return result->diagnostics.HasErrors() ? 1 : 0;
}

}  // namespace lifter::driver
