#include "lifter/lifecycle/cross_thread_gate.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>

#include "lifter/common/internal_error.hpp"
#include "lifter/ir/expression.hpp"
#include "lifter/ir/statement.hpp"

namespace lifter::lifecycle {

namespace {

// Handed-over copies are named after the local they copy.
auto ArgumentPath(
    const ir::Procedure& proc, const ir::Arena& arena, ir::ExpressionId arg,
    size_t index) -> std::string {
  const ir::Expression& expr = arena[arg];
  if (const auto* name = std::get_if<ir::NameRefExpressionData>(&expr.data)) {
    return proc.Local(name->local).name;
  }
  return fmt::format("arg{}", index);
}

}  // namespace

auto ToString(HandoffStrategy strategy) -> std::string_view {
  switch (strategy) {
    case HandoffStrategy::kUserDeepCopy:
      return "user deep copy";
    case HandoffStrategy::kLiftedDeepCopy:
      return "lifted deep copy";
    case HandoffStrategy::kStructuralClone:
      return "structural clone";
    case HandoffStrategy::kBitwiseCopy:
      return "bitwise copy";
  }
  return "unknown";
}

auto CrossThreadGate::Handoff(TypeId type, std::string_view path)
    -> HandoffAnnotation {
  HandoffAnnotation annotation{.type = type};
  auto op = resolver_.Resolve(type, OpKind::kDeepCopy);
  Outcome outcome = op ? (*op)->outcome : Outcome::kDefault;
  switch (outcome) {
    case Outcome::kUserOverride:
      annotation.strategy = HandoffStrategy::kUserDeepCopy;
      annotation.calls = ExpandCalls(resolver_, type, OpKind::kDeepCopy, path);
      break;
    case Outcome::kLifted:
      annotation.strategy = HandoffStrategy::kLiftedDeepCopy;
      annotation.calls = ExpandCalls(resolver_, type, OpKind::kDeepCopy, path);
      break;
    case Outcome::kDefault:
      annotation.strategy = resolver_.ReachesIndirection(type)
                                ? HandoffStrategy::kStructuralClone
                                : HandoffStrategy::kBitwiseCopy;
      break;
  }
  return annotation;
}

auto CrossThreadGate::Annotate(const ir::Procedure& proc, const ir::Arena& arena)
    -> std::vector<HandoffAnnotation> {
  std::vector<HandoffAnnotation> out;
  if (proc.body) {
    VisitStatement(proc, arena, proc.body, out);
  }
  return out;
}

void CrossThreadGate::VisitStatement(
    const ir::Procedure& proc, const ir::Arena& arena, ir::StatementId id,
    std::vector<HandoffAnnotation>& out) {
  const ir::Statement& stmt = arena[id];
  if (const auto* block = std::get_if<ir::BlockStatementData>(&stmt.data)) {
    for (ir::StatementId child : block->statements) {
      VisitStatement(proc, arena, child, out);
    }
  } else if (const auto* cond =
                 std::get_if<ir::ConditionalStatementData>(&stmt.data)) {
    VisitStatement(proc, arena, cond->then_branch, out);
    if (cond->else_branch) {
      VisitStatement(proc, arena, *cond->else_branch, out);
    }
  } else if (const auto* loop =
                 std::get_if<ir::WhileLoopStatementData>(&stmt.data)) {
    VisitStatement(proc, arena, loop->body, out);
  } else if (const auto* spawn =
                 std::get_if<ir::SpawnStatementData>(&stmt.data)) {
    const ir::Expression& call_expr = arena[spawn->call];
    const auto* call = std::get_if<ir::CallExpressionData>(&call_expr.data);
    if (call == nullptr) {
      throw common::InternalError(
          "CrossThreadGate", "spawn operand is not a call");
    }
    for (size_t i = 0; i < call->arguments.size(); ++i) {
      ir::ExpressionId arg = call->arguments[i];
      HandoffAnnotation annotation =
          Handoff(arena[arg].type, ArgumentPath(proc, arena, arg, i));
      annotation.statement = id;
      annotation.callee = call->callee;
      annotation.argument_index = static_cast<uint32_t>(i);
      annotation.argument = arg;
      out.push_back(std::move(annotation));
    }
  }
}

}  // namespace lifter::lifecycle
