#pragma once

#include <cstdint>
#include <utility>

namespace lifter::ir {

struct ExpressionId {
  uint32_t value = 0;

  auto operator==(const ExpressionId&) const -> bool = default;
  auto operator<=>(const ExpressionId&) const = default;
  explicit operator bool() const {
    return value != UINT32_MAX;
  }

  template <typename H>
  friend auto AbslHashValue(H h, ExpressionId id) -> H {
    return H::combine(std::move(h), id.value);
  }
};

constexpr ExpressionId kInvalidExpressionId{UINT32_MAX};

struct StatementId {
  uint32_t value = 0;

  auto operator==(const StatementId&) const -> bool = default;
  auto operator<=>(const StatementId&) const = default;
  explicit operator bool() const {
    return value != UINT32_MAX;
  }

  template <typename H>
  friend auto AbslHashValue(H h, StatementId id) -> H {
    return H::combine(std::move(h), id.value);
  }
};

constexpr StatementId kInvalidStatementId{UINT32_MAX};

// Index into Procedure::locals.
struct LocalId {
  uint32_t value = 0;

  auto operator==(const LocalId&) const -> bool = default;
  auto operator<=>(const LocalId&) const = default;
  explicit operator bool() const {
    return value != UINT32_MAX;
  }

  template <typename H>
  friend auto AbslHashValue(H h, LocalId id) -> H {
    return H::combine(std::move(h), id.value);
  }
};

constexpr LocalId kInvalidLocalId{UINT32_MAX};

struct ProcedureId {
  uint32_t value = 0;

  auto operator==(const ProcedureId&) const -> bool = default;
  auto operator<=>(const ProcedureId&) const = default;
  explicit operator bool() const {
    return value != UINT32_MAX;
  }

  template <typename H>
  friend auto AbslHashValue(H h, ProcedureId id) -> H {
    return H::combine(std::move(h), id.value);
  }
};

constexpr ProcedureId kInvalidProcedureId{UINT32_MAX};

struct Expression;
struct Statement;
struct Procedure;

}  // namespace lifter::ir
