#include "lifter/lifecycle/scope_exit.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "absl/container/flat_hash_map.h"
#include "lifter/ir/statement.hpp"

namespace lifter::lifecycle {

namespace {

void CollectJumps(
    const ir::Arena& arena, ir::StatementId id,
    std::vector<ir::StatementId>& jumps) {
  const ir::Statement& stmt = arena[id];
  if (ir::IsControlTransfer(stmt.kind)) {
    jumps.push_back(id);
    return;
  }
  if (const auto* block = std::get_if<ir::BlockStatementData>(&stmt.data)) {
    for (ir::StatementId child : block->statements) {
      CollectJumps(arena, child, jumps);
    }
  } else if (const auto* cond =
                 std::get_if<ir::ConditionalStatementData>(&stmt.data)) {
    CollectJumps(arena, cond->then_branch, jumps);
    if (cond->else_branch) {
      CollectJumps(arena, *cond->else_branch, jumps);
    }
  } else if (const auto* loop =
                 std::get_if<ir::WhileLoopStatementData>(&stmt.data)) {
    CollectJumps(arena, loop->body, jumps);
  }
}

auto EndsInControlTransfer(const ir::Arena& arena, ir::StatementId block)
    -> bool {
  const auto* data = std::get_if<ir::BlockStatementData>(&arena[block].data);
  return data != nullptr && !data->statements.empty() &&
         ir::IsControlTransfer(arena[data->statements.back()].kind);
}

}  // namespace

void ScopeExitInserter::VerifyExitEdges(
    const ir::Procedure& proc, const ir::Arena& arena,
    const ScopeTree& tree) const {
  absl::flat_hash_map<ir::StatementId, int> edges_by_source;
  for (const Scope& scope : tree.Scopes()) {
    int fallthroughs = 0;
    for (const ExitEdge& edge : scope.exits) {
      if (edge.kind == ExitKind::kFallthrough) {
        ++fallthroughs;
      } else {
        ++edges_by_source[edge.source];
      }
    }
    int expected = EndsInControlTransfer(arena, scope.owner) ? 0 : 1;
    if (fallthroughs != expected) {
      throw MissingScopeExitEdgeError(
          fmt::format(
              "{} scope {} in '{}' has {} fallthrough edges, expected {}",
              ToString(scope.kind), scope.id.value, proc.name, fallthroughs,
              expected),
          arena[scope.owner].span);
    }
  }

  std::vector<ir::StatementId> jumps;
  if (proc.body) {
    CollectJumps(arena, proc.body, jumps);
  }
  for (ir::StatementId jump : jumps) {
    auto it = edges_by_source.find(jump);
    int count = it == edges_by_source.end() ? 0 : it->second;
    if (count != 1) {
      throw MissingScopeExitEdgeError(
          fmt::format(
              "control transfer in '{}' has {} exit edges, expected 1",
              proc.name, count),
          arena[jump].span);
    }
  }
}

auto ScopeExitInserter::IsConsumedBefore(
    const ScopeTree& tree, const ScopedLocal& local,
    const ExitEdge& edge) const -> bool {
  for (const ConsumingUse& use : tree.ConsumingUses()) {
    if (use.local != local.local) {
      continue;
    }
    if (edge.source && use.statement == edge.source) {
      return true;
    }
    if (use.unconditional && use.point >= local.point &&
        use.point <= edge.point) {
      return true;
    }
  }
  return false;
}

auto ScopeExitInserter::Insert(
    const ir::Procedure& proc, const ir::Arena& arena, const ScopeTree& tree)
    -> ProcedureSchedule {
  VerifyExitEdges(proc, arena, tree);

  ProcedureSchedule schedule;
  for (const Scope& scope : tree.Scopes()) {
    for (const ExitEdge& edge : scope.exits) {
      std::vector<ScopedLocal> live;
      for (ScopeId s = scope.id; s && s != edge.target; s = tree[s].parent) {
        for (const ScopedLocal& local : tree[s].locals) {
          if (local.point < edge.point &&
              !IsConsumedBefore(tree, local, edge)) {
            live.push_back(local);
          }
        }
      }
      std::sort(
          live.begin(), live.end(),
          [](const ScopedLocal& a, const ScopedLocal& b) {
            return a.decl_order > b.decl_order;
          });

      ExitSchedule exit{.edge = edge};
      for (const ScopedLocal& local : live) {
        const ir::LocalSymbol& symbol = proc.Local(local.local);
        auto op = resolver_.Resolve(symbol.type, OpKind::kDestroy);
        if (!op || (*op)->outcome == Outcome::kDefault) {
          continue;
        }
        exit.destroys.push_back(
            ScheduledDestroy{
                .local = local.local,
                .name = symbol.name,
                .type = symbol.type,
                .outcome = (*op)->outcome,
                .calls = ExpandCalls(
                    resolver_, symbol.type, OpKind::kDestroy, symbol.name),
            });
      }
      schedule.exits.push_back(std::move(exit));
    }
  }
  std::sort(
      schedule.exits.begin(), schedule.exits.end(),
      [](const ExitSchedule& a, const ExitSchedule& b) {
        return a.edge.point < b.edge.point;
      });

  for (const ConsumingUse& use : tree.ConsumingUses()) {
    if (use.unconditional || use.in_return) {
      continue;
    }
    const ir::LocalSymbol& symbol = proc.Local(use.local);
    if (resolver_.OutcomeOf(symbol.type, OpKind::kDestroy) ==
        Outcome::kDefault) {
      continue;
    }
    schedule.resets.push_back(
        MoveReset{
            .local = use.local,
            .name = symbol.name,
            .expression = use.expression,
            .statement = use.statement,
        });
  }

  spdlog::debug(
      "scheduled {} exit edges and {} moved-from resets in '{}'",
      schedule.exits.size(), schedule.resets.size(), proc.name);
  return schedule;
}

}  // namespace lifter::lifecycle
