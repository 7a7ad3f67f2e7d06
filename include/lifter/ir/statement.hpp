#pragma once

#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

#include "lifter/common/source_span.hpp"
#include "lifter/ir/fwd.hpp"

namespace lifter::ir {

enum class StatementKind {
  kBlock,
  kVariableDeclaration,
  kAssignment,
  kExpression,
  kConditional,
  kWhileLoop,
  kReturn,
  kBreak,
  kContinue,
  kSpawn,
};

// Control transfers end the current statement list.
inline auto IsControlTransfer(StatementKind kind) -> bool {
  return kind == StatementKind::kReturn || kind == StatementKind::kBreak ||
         kind == StatementKind::kContinue;
}

struct BlockStatementData {
  std::vector<StatementId> statements;

  auto operator==(const BlockStatementData&) const -> bool = default;
};

enum class Mutability : uint8_t {
  kVar,
  kLet,
};

struct VariableDeclarationStatementData {
  LocalId local;
  ExpressionId init;  // kInvalidExpressionId if no initializer
  Mutability mutability = Mutability::kVar;

  auto operator==(const VariableDeclarationStatementData&) const
      -> bool = default;
};

struct AssignmentStatementData {
  ExpressionId target;
  ExpressionId value;

  auto operator==(const AssignmentStatementData&) const -> bool = default;
};

struct ExpressionStatementData {
  ExpressionId expression;

  auto operator==(const ExpressionStatementData&) const -> bool = default;
};

// Branches are always block statements, so each opens its own scope.
struct ConditionalStatementData {
  ExpressionId condition;
  StatementId then_branch;
  std::optional<StatementId> else_branch;

  auto operator==(const ConditionalStatementData&) const -> bool = default;
};

struct WhileLoopStatementData {
  ExpressionId condition;
  StatementId body;

  auto operator==(const WhileLoopStatementData&) const -> bool = default;
};

struct ReturnStatementData {
  ExpressionId value;  // kInvalidExpressionId for a bare return

  auto operator==(const ReturnStatementData&) const -> bool = default;
};

struct BreakStatementData {
  auto operator==(const BreakStatementData&) const -> bool = default;
};

struct ContinueStatementData {
  auto operator==(const ContinueStatementData&) const -> bool = default;
};

// Task submission: the call runs on another execution unit.
struct SpawnStatementData {
  ExpressionId call;

  auto operator==(const SpawnStatementData&) const -> bool = default;
};

using StatementData = std::variant<
    BlockStatementData, VariableDeclarationStatementData,
    AssignmentStatementData, ExpressionStatementData, ConditionalStatementData,
    WhileLoopStatementData, ReturnStatementData, BreakStatementData,
    ContinueStatementData, SpawnStatementData>;

struct Statement {
  StatementKind kind;
  SourceSpan span;
  StatementData data;

  auto operator==(const Statement&) const -> bool = default;
};

}  // namespace lifter::ir
