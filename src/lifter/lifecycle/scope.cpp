#include "lifter/lifecycle/scope.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "lifter/common/internal_error.hpp"
#include "lifter/ir/expression.hpp"
#include "lifter/ir/statement.hpp"

namespace lifter::lifecycle {

auto ToString(ScopeKind kind) -> std::string_view {
  switch (kind) {
    case ScopeKind::kProcedure:
      return "procedure";
    case ScopeKind::kBlock:
      return "block";
    case ScopeKind::kBranch:
      return "branch";
    case ScopeKind::kLoopBody:
      return "loop body";
  }
  return "unknown";
}

auto ToString(ExitKind kind) -> std::string_view {
  switch (kind) {
    case ExitKind::kFallthrough:
      return "fallthrough";
    case ExitKind::kReturn:
      return "return";
    case ExitKind::kBreak:
      return "break";
    case ExitKind::kContinue:
      return "continue";
  }
  return "unknown";
}

auto ScopeTree::AddScope(ScopeKind kind, ScopeId parent, ir::StatementId owner)
    -> ScopeId {
  ScopeId id{static_cast<uint32_t>(scopes_.size())};
  scopes_.push_back(
      Scope{.id = id, .parent = parent, .kind = kind, .owner = owner});
  return id;
}

void ScopeTree::DeclareLocal(ScopeId scope, ScopedLocal local) {
  local_scope_[local.local] = scope;
  scopes_.at(scope.value).locals.push_back(local);
}

void ScopeTree::AddExit(ExitEdge edge) {
  scopes_.at(edge.from.value).exits.push_back(edge);
}

auto ScopeTree::DeclaringScope(ir::LocalId local) const -> ScopeId {
  auto it = local_scope_.find(local);
  if (it == local_scope_.end()) {
    return kInvalidScopeId;
  }
  return it->second;
}

namespace {

struct LoopFrame {
  ScopeId body;
  ScopeId enclosing;
};

class ScopeBuilder {
 public:
  ScopeBuilder(const ir::Procedure& proc, const ir::Arena& arena)
      : proc_(proc), arena_(arena) {
  }

  auto Build() -> ScopeTree {
    ScopeId root =
        tree_.AddScope(ScopeKind::kProcedure, kInvalidScopeId, proc_.body);
    VisitScopeBody(root, proc_.body, kInvalidScopeId);
    return std::move(tree_);
  }

 private:
  // Walks the statement list of `block` inside `scope`; a list that does not
  // end in a control transfer gets a fallthrough edge to `fallthrough_target`.
  void VisitScopeBody(
      ScopeId scope, ir::StatementId block, ScopeId fallthrough_target) {
    const ir::Statement& stmt = arena_[block];
    const auto* data = std::get_if<ir::BlockStatementData>(&stmt.data);
    if (data == nullptr) {
      throw common::InternalError(
          "BuildScopeTree", "scope owner is not a block statement");
    }
    for (ir::StatementId child : data->statements) {
      VisitStatement(scope, child);
    }
    bool terminated = !data->statements.empty() &&
                      ir::IsControlTransfer(arena_[data->statements.back()].kind);
    if (!terminated) {
      tree_.AddExit(
          ExitEdge{
              .kind = ExitKind::kFallthrough,
              .from = scope,
              .target = fallthrough_target,
              .point = ++point_,
              .span = stmt.span,
          });
    }
  }

  void VisitNested(
      ScopeKind kind, ScopeId parent, ir::StatementId block) {
    ScopeId scope = tree_.AddScope(kind, parent, block);
    VisitScopeBody(scope, block, parent);
  }

  void VisitStatement(ScopeId scope, ir::StatementId id) {
    const ir::Statement& stmt = arena_[id];
    uint32_t point = ++point_;
    std::visit(
        [&](const auto& data) {
          using T = std::decay_t<decltype(data)>;
          if constexpr (std::is_same_v<T, ir::BlockStatementData>) {
            VisitNested(ScopeKind::kBlock, scope, id);
          } else if constexpr (std::is_same_v<
                                   T, ir::VariableDeclarationStatementData>) {
            if (data.init) {
              ScanConsumption(data.init, id, scope, point, false, false);
            }
            tree_.DeclareLocal(
                scope, ScopedLocal{
                           .local = data.local,
                           .decl_order = next_decl_order_++,
                           .point = point,
                           .declaration = id,
                       });
          } else if constexpr (std::is_same_v<T, ir::AssignmentStatementData>) {
            ScanConsumption(data.value, id, scope, point, false, false);
            ScanConsumption(data.target, id, scope, point, false, false);
          } else if constexpr (std::is_same_v<T, ir::ExpressionStatementData>) {
            ScanConsumption(data.expression, id, scope, point, false, false);
          } else if constexpr (std::is_same_v<T, ir::SpawnStatementData>) {
            ScanConsumption(data.call, id, scope, point, false, false);
          } else if constexpr (std::is_same_v<
                                   T, ir::ConditionalStatementData>) {
            ScanConsumption(data.condition, id, scope, point, false, false);
            VisitNested(ScopeKind::kBranch, scope, data.then_branch);
            if (data.else_branch) {
              VisitNested(ScopeKind::kBranch, scope, *data.else_branch);
            }
          } else if constexpr (std::is_same_v<T, ir::WhileLoopStatementData>) {
            // The condition runs once per iteration.
            ScanConsumption(data.condition, id, scope, point, true, false);
            ScopeId body =
                tree_.AddScope(ScopeKind::kLoopBody, scope, data.body);
            loops_.push_back(LoopFrame{.body = body, .enclosing = scope});
            VisitScopeBody(body, data.body, scope);
            loops_.pop_back();
          } else if constexpr (std::is_same_v<T, ir::ReturnStatementData>) {
            if (data.value) {
              ScanReturnValue(data.value, id, scope, point);
            }
            tree_.AddExit(
                ExitEdge{
                    .kind = ExitKind::kReturn,
                    .from = scope,
                    .target = kInvalidScopeId,
                    .source = id,
                    .point = point,
                    .span = stmt.span,
                });
          } else if constexpr (std::is_same_v<T, ir::BreakStatementData>) {
            AddLoopExit(ExitKind::kBreak, scope, id, point, stmt.span);
          } else if constexpr (std::is_same_v<T, ir::ContinueStatementData>) {
            AddLoopExit(ExitKind::kContinue, scope, id, point, stmt.span);
          }
        },
        stmt.data);
  }

  void AddLoopExit(
      ExitKind kind, ScopeId scope, ir::StatementId id, uint32_t point,
      SourceSpan span) {
    if (loops_.empty()) {
      throw common::InternalError(
          "BuildScopeTree",
          std::string(ToString(kind)) + " outside of a loop");
    }
    tree_.AddExit(
        ExitEdge{
            .kind = kind,
            .from = scope,
            .target = loops_.back().enclosing,
            .source = id,
            .point = point,
            .span = span,
        });
  }

  void ScanReturnValue(
      ir::ExpressionId expr, ir::StatementId stmt, ScopeId scope,
      uint32_t point) {
    const ir::Expression& value = arena_[expr];
    if (const auto* name = std::get_if<ir::NameRefExpressionData>(&value.data)) {
      RecordUse(name->local, expr, stmt, scope, point, false, true);
      return;
    }
    ScanConsumption(expr, stmt, scope, point, false, true);
  }

  void ScanConsumption(
      ir::ExpressionId expr, ir::StatementId stmt, ScopeId scope,
      uint32_t point, bool repeated, bool in_return) {
    const ir::Expression& node = arena_[expr];
    if (const auto* move = std::get_if<ir::MoveExpressionData>(&node.data)) {
      const ir::Expression& operand = arena_[move->operand];
      if (const auto* name =
              std::get_if<ir::NameRefExpressionData>(&operand.data)) {
        RecordUse(name->local, expr, stmt, scope, point, repeated, in_return);
        return;
      }
    }
    for (ir::ExpressionId child : ir::ChildExpressions(node)) {
      ScanConsumption(child, stmt, scope, point, repeated, in_return);
    }
  }

  void RecordUse(
      ir::LocalId local, ir::ExpressionId expr, ir::StatementId stmt,
      ScopeId scope, uint32_t point, bool repeated, bool in_return) {
    const ir::LocalSymbol& symbol = proc_.Local(local);
    if (symbol.kind == ir::LocalKind::kParameter ||
        symbol.kind == ir::LocalKind::kResult) {
      return;
    }
    ScopeId declaring = tree_.DeclaringScope(local);
    if (!declaring) {
      throw common::InternalError(
          "BuildScopeTree",
          "use of local '" + symbol.name + "' before its declaration");
    }
    tree_.AddConsumingUse(
        ConsumingUse{
            .local = local,
            .expression = expr,
            .statement = stmt,
            .scope = scope,
            .point = point,
            .unconditional = !repeated && IsUnconditional(scope, declaring),
            .in_return = in_return,
        });
  }

  // True if reaching `scope` from `declaring` takes no branch or loop.
  [[nodiscard]] auto IsUnconditional(ScopeId scope, ScopeId declaring) const
      -> bool {
    for (ScopeId s = scope; s != declaring; s = tree_[s].parent) {
      if (!s) {
        return false;
      }
      ScopeKind kind = tree_[s].kind;
      if (kind == ScopeKind::kBranch || kind == ScopeKind::kLoopBody) {
        return false;
      }
    }
    return true;
  }

  const ir::Procedure& proc_;
  const ir::Arena& arena_;
  ScopeTree tree_;
  std::vector<LoopFrame> loops_;
  uint32_t point_ = 0;
  uint32_t next_decl_order_ = 0;
};

}  // namespace

auto BuildScopeTree(const ir::Procedure& proc, const ir::Arena& arena)
    -> ScopeTree {
  return ScopeBuilder(proc, arena).Build();
}

}  // namespace lifter::lifecycle
