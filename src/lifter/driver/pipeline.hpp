#pragma once

#include <memory>
#include <string>
#include <vector>

#include "lifter/common/diagnostic/diagnostic.hpp"
#include "lifter/common/diagnostic/diagnostic_sink.hpp"
#include "lifter/common/source_manager.hpp"
#include "lifter/ir/unit.hpp"
#include "lifter/lifecycle/analysis.hpp"
#include "verbose_logger.hpp"

namespace lifter::driver {

struct CompilationInput {
  std::vector<std::string> files;
  std::vector<std::string> destructible_contexts;  // empty: default policy
  int verbose = 0;                                 // Verbosity level (0-3)
  bool stats = false;                              // Phase timing summary
};

// One analyzed file. The analysis refers into the unit, so both are kept
// at stable addresses.
struct AnalyzedUnit {
  std::unique_ptr<ir::CompilationUnit> unit;
  std::unique_ptr<lifecycle::UnitAnalysis> analysis;
};

struct PipelineResult {
  SourceManager sources;
  DiagnosticSink diagnostics;
  std::vector<AnalyzedUnit> units;
};

// Loads and analyzes every input file independently. A file that fails to
// load contributes its host error and is skipped. Fails only when the
// input options themselves are invalid.
auto RunPipeline(const CompilationInput& input, VerboseLogger& vlog)
    -> Result<PipelineResult>;

}  // namespace lifter::driver
