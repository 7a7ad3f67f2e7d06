#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "lifter/common/source_span.hpp"
#include "lifter/common/type.hpp"
#include "lifter/ir/fwd.hpp"

namespace lifter::ir {

enum class ExpressionKind {
  kLiteral,
  kNameRef,
  kCall,
  kConstruct,     // Object construction: T(a: x, b: y)
  kTupleLiteral,  // (x, y)
  kArrayLiteral,  // [x, y]
  kMove,          // move(x): transfers ownership out of a place
  kFieldAccess,
  kIndex,
  kDeref,
};

// Place expressions denote existing storage; they never create a value that
// needs destruction of its own.
inline auto IsPlaceExpressionKind(ExpressionKind kind) -> bool {
  switch (kind) {
    case ExpressionKind::kNameRef:
    case ExpressionKind::kFieldAccess:
    case ExpressionKind::kIndex:
    case ExpressionKind::kDeref:
      return true;
    default:
      return false;
  }
}

struct LiteralExpressionData {
  std::string text;

  auto operator==(const LiteralExpressionData&) const -> bool = default;
};

struct NameRefExpressionData {
  LocalId local;

  auto operator==(const NameRefExpressionData&) const -> bool = default;
};

struct CallExpressionData {
  std::string callee;
  std::vector<ExpressionId> arguments;

  auto operator==(const CallExpressionData&) const -> bool = default;
};

struct ConstructExpressionData {
  // One initializer per object field, in field order; kInvalidExpressionId
  // for a field left at its default value.
  std::vector<ExpressionId> fields;

  auto operator==(const ConstructExpressionData&) const -> bool = default;
};

struct TupleLiteralExpressionData {
  std::vector<ExpressionId> elements;

  auto operator==(const TupleLiteralExpressionData&) const -> bool = default;
};

struct ArrayLiteralExpressionData {
  std::vector<ExpressionId> elements;

  auto operator==(const ArrayLiteralExpressionData&) const -> bool = default;
};

struct MoveExpressionData {
  ExpressionId operand;

  auto operator==(const MoveExpressionData&) const -> bool = default;
};

struct FieldAccessExpressionData {
  ExpressionId base;
  uint32_t field_index = 0;

  auto operator==(const FieldAccessExpressionData&) const -> bool = default;
};

struct IndexExpressionData {
  ExpressionId base;
  ExpressionId index;

  auto operator==(const IndexExpressionData&) const -> bool = default;
};

struct DerefExpressionData {
  ExpressionId operand;

  auto operator==(const DerefExpressionData&) const -> bool = default;
};

using ExpressionData = std::variant<
    LiteralExpressionData, NameRefExpressionData, CallExpressionData,
    ConstructExpressionData, TupleLiteralExpressionData,
    ArrayLiteralExpressionData, MoveExpressionData, FieldAccessExpressionData,
    IndexExpressionData, DerefExpressionData>;

struct Expression {
  ExpressionKind kind;
  TypeId type;
  SourceSpan span;
  ExpressionData data;

  auto operator==(const Expression&) const -> bool = default;
};

// Direct operands of an expression, in evaluation order.
auto ChildExpressions(const Expression& expr) -> std::vector<ExpressionId>;

}  // namespace lifter::ir
