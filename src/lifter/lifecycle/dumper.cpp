#include "lifter/lifecycle/dumper.hpp"

#include <string>
#include <variant>

#include <fmt/core.h>

#include "lifter/common/internal_error.hpp"
#include "lifter/ir/expression.hpp"
#include "lifter/lifecycle/expand.hpp"

namespace lifter::lifecycle {

void Dumper::PrintIndent() {
  for (int i = 0; i < indent_; ++i) {
    *out_ << "  ";
  }
}

void Dumper::Indent() {
  ++indent_;
}

void Dumper::Dedent() {
  if (indent_ == 0) {
    throw common::InternalError("Dumper::Dedent", "unbalanced indentation");
  }
  --indent_;
}

auto Dumper::TypeString(TypeId id) const -> std::string {
  return analysis_->Unit().types.ToString(id);
}

auto Dumper::Location(SourceSpan span) const -> std::string {
  if (sources_ == nullptr || !span.file_id) {
    return "";
  }
  LineColumn lc = ComputeLineColumn(span, *sources_);
  return fmt::format(" @{}:{}", lc.line, lc.column);
}

auto Dumper::ExpressionString(ir::ExpressionId id) const -> std::string {
  const ir::Expression& expr = analysis_->Unit().arena[id];
  switch (expr.kind) {
    case ir::ExpressionKind::kLiteral:
      return fmt::format(
          "literal {}", std::get<ir::LiteralExpressionData>(expr.data).text);
    case ir::ExpressionKind::kNameRef:
      return "name";
    case ir::ExpressionKind::kCall:
      return fmt::format(
          "call {}", std::get<ir::CallExpressionData>(expr.data).callee);
    case ir::ExpressionKind::kConstruct:
      return fmt::format("construct {}", TypeString(expr.type));
    case ir::ExpressionKind::kTupleLiteral:
      return "tuple";
    case ir::ExpressionKind::kArrayLiteral:
      return "array";
    case ir::ExpressionKind::kMove:
      return "move";
    case ir::ExpressionKind::kFieldAccess:
      return "field";
    case ir::ExpressionKind::kIndex:
      return "index";
    case ir::ExpressionKind::kDeref:
      return "deref";
  }
  return "expression";
}

void Dumper::DumpTable() {
  const auto& types = analysis_->Unit().types;
  *out_ << "operations {\n";
  Indent();
  for (const auto& row : analysis_->Table()) {
    PrintIndent();
    *out_ << TypeString(row.type) << ":";
    for (OpKind kind : kAllOpKinds) {
      const auto& outcome = row.outcomes[static_cast<size_t>(kind)];
      *out_ << fmt::format(
          " {}={}", ToString(kind),
          outcome ? ToString(*outcome) : "unresolvable");
    }
    *out_ << Location(types.DeclarationSpan(row.type)) << "\n";
  }
  Dedent();
  *out_ << "}\n";
}

void Dumper::DumpProcedureSchedule(const ProcedureAnalysis& proc) {
  const auto& types = analysis_->Unit().types;
  PrintIndent();
  *out_ << fmt::format("proc {} {{\n", proc.name);
  Indent();
  for (const auto& exit : proc.schedule.exits) {
    PrintIndent();
    *out_ << fmt::format(
        "exit {}{}", ToString(exit.edge.kind), Location(exit.edge.span));
    if (exit.destroys.empty()) {
      *out_ << ": none\n";
      continue;
    }
    *out_ << ":\n";
    Indent();
    for (const auto& destroy : exit.destroys) {
      for (const auto& call : destroy.calls) {
        PrintIndent();
        *out_ << FormatHookCall(types, call) << "\n";
      }
    }
    Dedent();
  }
  for (const auto& reset : proc.schedule.resets) {
    PrintIndent();
    *out_ << fmt::format(
        "reset {}{}\n", reset.name,
        Location(analysis_->Unit().arena[reset.expression].span));
  }
  for (const auto& handoff : proc.handoffs) {
    PrintIndent();
    *out_ << fmt::format(
        "handoff {}[{}] {}: {}\n", handoff.callee, handoff.argument_index,
        TypeString(handoff.type), ToString(handoff.strategy));
    Indent();
    for (const auto& call : handoff.calls) {
      PrintIndent();
      *out_ << FormatHookCall(types, call) << "\n";
    }
    Dedent();
  }
  Dedent();
  PrintIndent();
  *out_ << "}\n";
}

void Dumper::DumpSchedules() {
  for (const auto& proc : analysis_->Procedures()) {
    DumpProcedureSchedule(proc);
  }
}

void Dumper::DumpSchedule(const std::string& proc_name) {
  for (const auto& proc : analysis_->Procedures()) {
    if (proc.name == proc_name) {
      DumpProcedureSchedule(proc);
    }
  }
}

void Dumper::DumpSites() {
  const auto& arena = analysis_->Unit().arena;
  for (const auto& proc : analysis_->Procedures()) {
    *out_ << fmt::format("proc {} {{\n", proc.name);
    Indent();
    for (const auto& site : proc.sites) {
      const ir::Expression& expr = arena[site.expression];
      PrintIndent();
      *out_ << fmt::format(
          "{}: {} ({}){}\n", ToString(site.site),
          ExpressionString(site.expression), TypeString(expr.type),
          Location(expr.span));
    }
    Dedent();
    *out_ << "}\n";
  }
}

void Dumper::DumpAll() {
  DumpTable();
  DumpSchedules();
  DumpSites();
}

}  // namespace lifter::lifecycle
