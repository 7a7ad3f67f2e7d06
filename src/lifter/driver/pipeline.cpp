#include "pipeline.hpp"

#include <expected>
#include <memory>
#include <utility>

#include <spdlog/spdlog.h>

#include "lifter/frontend/unit_loader.hpp"
#include "lifter/lifecycle/context.hpp"

namespace lifter::driver {

auto RunPipeline(const CompilationInput& input, VerboseLogger& vlog)
    -> Result<PipelineResult> {
  lifecycle::AnalysisOptions options;
  if (!input.destructible_contexts.empty()) {
    auto policy =
        lifecycle::ContextPolicy::FromNames(input.destructible_contexts);
    if (!policy) {
      return std::unexpected(policy.error());
    }
    options.policy = *policy;
  }

  PipelineResult result;
  for (const auto& file : input.files) {
    Result<ir::CompilationUnit> loaded;
    {
      PhaseTimer timer(vlog, "load");
      loaded = frontend::LoadUnitFile(file, result.sources);
    }
    if (!loaded) {
      result.diagnostics.Report(loaded.error());
      continue;
    }

    AnalyzedUnit entry;
    entry.unit = std::make_unique<ir::CompilationUnit>(std::move(*loaded));
    entry.analysis =
        std::make_unique<lifecycle::UnitAnalysis>(*entry.unit, options);
    {
      PhaseTimer timer(vlog, "bind");
      entry.analysis->BindOperations(result.diagnostics);
    }
    {
      PhaseTimer timer(vlog, "resolve");
      entry.analysis->ResolveTable(result.diagnostics);
    }
    {
      PhaseTimer timer(vlog, "analyze");
      entry.analysis->AnalyzeProcedures(result.diagnostics);
    }
    if (entry.analysis->Aborted()) {
      spdlog::warn("analysis of '{}' was aborted", entry.unit->name);
    }
    result.units.push_back(std::move(entry));
  }
  return result;
}

}  // namespace lifter::driver
