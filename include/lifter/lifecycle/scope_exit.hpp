#pragma once

#include <string>
#include <vector>

#include "lifter/common/internal_error.hpp"
#include "lifter/common/type.hpp"
#include "lifter/ir/arena.hpp"
#include "lifter/ir/fwd.hpp"
#include "lifter/ir/procedure.hpp"
#include "lifter/lifecycle/expand.hpp"
#include "lifter/lifecycle/resolver.hpp"
#include "lifter/lifecycle/scope.hpp"

namespace lifter::lifecycle {

// The scope tree handed to the inserter does not enumerate every way control
// leaves a scope. The unit cannot be processed further.
class MissingScopeExitEdgeError : public common::InternalError {
 public:
  MissingScopeExitEdgeError(const std::string& detail, SourceSpan span)
      : common::InternalError("ScopeExitInserter", detail), span_(span) {
  }

  [[nodiscard]] auto Span() const -> SourceSpan {
    return span_;
  }

 private:
  SourceSpan span_;
};

struct ScheduledDestroy {
  ir::LocalId local;
  std::string name;
  TypeId type;
  Outcome outcome = Outcome::kDefault;
  std::vector<HookCall> calls;
};

// Destroys to run, in order, before control takes `edge`.
struct ExitSchedule {
  ExitEdge edge;
  std::vector<ScheduledDestroy> destroys;
};

// A consuming use that may or may not run before a scheduled destroy: the
// local is reset to its moved-from state at this expression.
struct MoveReset {
  ir::LocalId local;
  std::string name;
  ir::ExpressionId expression;
  ir::StatementId statement;
};

struct ProcedureSchedule {
  std::vector<ExitSchedule> exits;  // program order
  std::vector<MoveReset> resets;
};

class ScopeExitInserter {
 public:
  explicit ScopeExitInserter(LiftingResolver& resolver) : resolver_(resolver) {
  }

  // Throws MissingScopeExitEdgeError if `tree` lacks an exit edge.
  auto Insert(
      const ir::Procedure& proc, const ir::Arena& arena, const ScopeTree& tree)
      -> ProcedureSchedule;

 private:
  void VerifyExitEdges(
      const ir::Procedure& proc, const ir::Arena& arena,
      const ScopeTree& tree) const;

  [[nodiscard]] auto IsConsumedBefore(
      const ScopeTree& tree, const ScopedLocal& local,
      const ExitEdge& edge) const -> bool;

  LiftingResolver& resolver_;
};

}  // namespace lifter::lifecycle
