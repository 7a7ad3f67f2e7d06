#include "lifter/lifecycle/analysis.hpp"

#include <cstddef>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "lifter/common/diagnostic/diagnostic.hpp"
#include "lifter/lifecycle/binder.hpp"
#include "lifter/lifecycle/scope.hpp"
#include "lifter/lifecycle/validator.hpp"

namespace lifter::lifecycle {

UnitAnalysis::UnitAnalysis(
    const ir::CompilationUnit& unit, AnalysisOptions options)
    : unit_(unit),
      options_(options),
      resolver_(unit.types, registry_, &resolver_sink_) {
}

void UnitAnalysis::BindOperations(DiagnosticSink& sink) {
  OperationBinder binder(unit_.types, registry_);
  size_t bound = binder.BindAll(unit_.operators, sink);
  registry_.Freeze();
  spdlog::debug(
      "unit '{}': {} of {} operator declarations bound", unit_.name, bound,
      unit_.operators.size());
}

void UnitAnalysis::ResolveTable(DiagnosticSink& sink) {
  std::vector<TypeId> types = unit_.types.NominalTypes();
  for (TypeId instance : unit_.types.GenericInstances()) {
    // Instances spelled with an operator's own parameters are signatures,
    // not types a program can hold.
    if (!unit_.types.IsDependent(instance)) {
      types.push_back(instance);
    }
  }

  table_.clear();
  table_.reserve(types.size());
  for (TypeId type : types) {
    OperationTableRow row{.type = type};
    for (OpKind kind : kAllOpKinds) {
      auto op = resolver_.Resolve(type, kind);
      if (op) {
        row.outcomes[static_cast<size_t>(kind)] = (*op)->outcome;
      }
    }
    table_.push_back(std::move(row));
  }
  FlushResolverDiagnostics(sink);
}

void UnitAnalysis::AnalyzeProcedures(DiagnosticSink& sink) {
  procedures_.clear();
  for (ir::ProcedureId id : unit_.procedures) {
    try {
      procedures_.push_back(AnalyzeProcedure(id, sink));
    } catch (const MissingScopeExitEdgeError& e) {
      FlushResolverDiagnostics(sink);
      sink.Report(
          Diagnostic::Fatal(
              e.Span(), DiagCode::kMissingScopeExitEdge,
              fmt::format(
                  "incomplete scope exit edges in '{}'; analysis of unit "
                  "'{}' stopped",
                  unit_.arena[id].name, unit_.name))
              .WithNote(e.what()));
      aborted_ = true;
      return;
    }
    FlushResolverDiagnostics(sink);
  }
}

auto UnitAnalysis::Run(DiagnosticSink& sink) -> bool {
  BindOperations(sink);
  ResolveTable(sink);
  AnalyzeProcedures(sink);
  return !aborted_;
}

auto UnitAnalysis::AnalyzeProcedure(ir::ProcedureId id, DiagnosticSink& sink)
    -> ProcedureAnalysis {
  const ir::Procedure& proc = unit_.arena[id];
  ProcedureAnalysis result{.id = id, .name = proc.name};

  result.sites = TagSites(proc, unit_.arena);
  ContextValidator validator(resolver_, options_.policy);
  validator.Validate(proc, unit_.arena, result.sites, sink);

  ScopeTree tree = BuildScopeTree(proc, unit_.arena);
  ScopeExitInserter inserter(resolver_);
  result.schedule = inserter.Insert(proc, unit_.arena, tree);

  CrossThreadGate gate(resolver_);
  result.handoffs = gate.Annotate(proc, unit_.arena);
  return result;
}

void UnitAnalysis::FlushResolverDiagnostics(DiagnosticSink& sink) {
  for (const auto& diag : resolver_sink_.GetDiagnostics()) {
    sink.Report(diag);
  }
  resolver_sink_.Clear();
}

}  // namespace lifter::lifecycle
