#pragma once

#include <array>
#include <optional>
#include <string>
#include <vector>

#include "lifter/common/diagnostic/diagnostic_sink.hpp"
#include "lifter/common/type.hpp"
#include "lifter/ir/fwd.hpp"
#include "lifter/ir/unit.hpp"
#include "lifter/lifecycle/context.hpp"
#include "lifter/lifecycle/cross_thread_gate.hpp"
#include "lifter/lifecycle/registry.hpp"
#include "lifter/lifecycle/resolver.hpp"
#include "lifter/lifecycle/scope_exit.hpp"

namespace lifter::lifecycle {

struct AnalysisOptions {
  ContextPolicy policy = ContextPolicy::Default();
};

// Effective outcome per kind, indexed by OpKind; nullopt when the type is
// unresolvable.
struct OperationTableRow {
  TypeId type;
  std::array<std::optional<Outcome>, kAllOpKinds.size()> outcomes;
};

struct ProcedureAnalysis {
  ir::ProcedureId id;
  std::string name;
  std::vector<TaggedSite> sites;
  ProcedureSchedule schedule;
  std::vector<HandoffAnnotation> handoffs;
};

// Lifecycle analysis of one compilation unit: bind, freeze, resolve the
// operation table, then validate, schedule and gate every procedure.
// Holds the registry and resolver, so annotations stay valid as long as
// the analysis lives.
class UnitAnalysis {
 public:
  UnitAnalysis(const ir::CompilationUnit& unit, AnalysisOptions options);

  UnitAnalysis(const UnitAnalysis&) = delete;
  auto operator=(const UnitAnalysis&) -> UnitAnalysis& = delete;
  UnitAnalysis(UnitAnalysis&&) = delete;
  auto operator=(UnitAnalysis&&) -> UnitAnalysis& = delete;
  ~UnitAnalysis() = default;

  // Binder phase. Freezes the registry.
  void BindOperations(DiagnosticSink& sink);

  // Resolves all three kinds for every nominal type and generic instance.
  void ResolveTable(DiagnosticSink& sink);

  // Per-procedure phases. A broken scope tree aborts the rest of the unit
  // with a fatal diagnostic.
  void AnalyzeProcedures(DiagnosticSink& sink);

  // All phases in order. Returns false when the unit was aborted.
  auto Run(DiagnosticSink& sink) -> bool;

  [[nodiscard]] auto Unit() const -> const ir::CompilationUnit& {
    return unit_;
  }
  [[nodiscard]] auto Registry() const -> const OperationRegistry& {
    return registry_;
  }
  [[nodiscard]] auto Table() const -> const std::vector<OperationTableRow>& {
    return table_;
  }
  [[nodiscard]] auto Procedures() const
      -> const std::vector<ProcedureAnalysis>& {
    return procedures_;
  }
  [[nodiscard]] auto Aborted() const -> bool {
    return aborted_;
  }

 private:
  auto AnalyzeProcedure(ir::ProcedureId id, DiagnosticSink& sink)
      -> ProcedureAnalysis;

  // Moves diagnostics raised inside resolver queries to `sink`.
  void FlushResolverDiagnostics(DiagnosticSink& sink);

  const ir::CompilationUnit& unit_;
  AnalysisOptions options_;
  OperationRegistry registry_;
  DiagnosticSink resolver_sink_;
  LiftingResolver resolver_;
  std::vector<OperationTableRow> table_;
  std::vector<ProcedureAnalysis> procedures_;
  bool aborted_ = false;
};

}  // namespace lifter::lifecycle
