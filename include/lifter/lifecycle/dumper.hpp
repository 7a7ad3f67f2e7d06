#pragma once

#include <ostream>
#include <string>

#include "lifter/common/source_manager.hpp"
#include "lifter/common/source_span.hpp"
#include "lifter/ir/fwd.hpp"
#include "lifter/lifecycle/analysis.hpp"

namespace lifter::lifecycle {

// Text rendering of a finished UnitAnalysis.
class Dumper {
 public:
  // `sources` may be null; locations are then omitted.
  Dumper(
      const UnitAnalysis* analysis, const SourceManager* sources,
      std::ostream* out)
      : analysis_(analysis), sources_(sources), out_(out) {
  }

  void DumpTable();
  void DumpSchedules();
  void DumpSites();
  void DumpAll();

  // Dump only the named procedure's schedule (no-op if absent).
  void DumpSchedule(const std::string& proc_name);

 private:
  void DumpProcedureSchedule(const ProcedureAnalysis& proc);

  void PrintIndent();
  void Indent();
  void Dedent();

  [[nodiscard]] auto TypeString(TypeId id) const -> std::string;
  [[nodiscard]] auto Location(SourceSpan span) const -> std::string;
  [[nodiscard]] auto ExpressionString(ir::ExpressionId id) const
      -> std::string;

  const UnitAnalysis* analysis_;
  const SourceManager* sources_;
  std::ostream* out_;
  int indent_ = 0;
};

}  // namespace lifter::lifecycle
