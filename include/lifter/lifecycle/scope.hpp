#pragma once

#include <cstdint>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "lifter/common/source_span.hpp"
#include "lifter/ir/arena.hpp"
#include "lifter/ir/fwd.hpp"
#include "lifter/ir/procedure.hpp"

namespace lifter::lifecycle {

struct ScopeId {
  uint32_t value = 0;

  auto operator==(const ScopeId&) const -> bool = default;
  auto operator<=>(const ScopeId&) const = default;
  explicit operator bool() const {
    return value != UINT32_MAX;
  }

  template <typename H>
  friend auto AbslHashValue(H h, ScopeId id) -> H {
    return H::combine(std::move(h), id.value);
  }
};

constexpr ScopeId kInvalidScopeId{UINT32_MAX};

enum class ScopeKind : uint8_t {
  kProcedure,
  kBlock,
  kBranch,
  kLoopBody,
};

enum class ExitKind : uint8_t {
  kFallthrough,
  kReturn,
  kBreak,
  kContinue,
};

auto ToString(ScopeKind kind) -> std::string_view;
auto ToString(ExitKind kind) -> std::string_view;

// Program points number statements in pre-order; the end of each scope gets
// its own point after its last statement.
struct ScopedLocal {
  ir::LocalId local;
  uint32_t decl_order = 0;  // procedure-wide declaration order
  uint32_t point = 0;
  ir::StatementId declaration;
};

// Control leaves every scope from `from` up to, not including, `target`.
// A return (and the procedure's own fallthrough) has no target.
struct ExitEdge {
  ExitKind kind;
  ScopeId from;
  ScopeId target = kInvalidScopeId;
  ir::StatementId source = ir::kInvalidStatementId;  // fallthrough: none
  uint32_t point = 0;
  SourceSpan span;
};

// `move x` or `return x` of a bare local.
struct ConsumingUse {
  ir::LocalId local;
  ir::ExpressionId expression;
  ir::StatementId statement;
  ScopeId scope;
  uint32_t point = 0;
  // Executes whenever the local's own scope reaches this point.
  bool unconditional = false;
  // Part of a return statement; control leaves with the value.
  bool in_return = false;
};

struct Scope {
  ScopeId id;
  ScopeId parent = kInvalidScopeId;
  ScopeKind kind;
  ir::StatementId owner;  // block statement whose list forms the scope
  std::vector<ScopedLocal> locals;
  std::vector<ExitEdge> exits;
};

class ScopeTree {
 public:
  auto AddScope(ScopeKind kind, ScopeId parent, ir::StatementId owner)
      -> ScopeId;

  [[nodiscard]] auto operator[](ScopeId id) const -> const Scope& {
    return scopes_.at(id.value);
  }

  // Mutable access for tests and collaborators that patch edges.
  [[nodiscard]] auto MutableScope(ScopeId id) -> Scope& {
    return scopes_.at(id.value);
  }

  [[nodiscard]] auto Scopes() const -> const std::vector<Scope>& {
    return scopes_;
  }

  void DeclareLocal(ScopeId scope, ScopedLocal local);
  void AddExit(ExitEdge edge);
  void AddConsumingUse(ConsumingUse use) {
    uses_.push_back(use);
  }

  // kInvalidScopeId for parameters and the result variable.
  [[nodiscard]] auto DeclaringScope(ir::LocalId local) const -> ScopeId;

  [[nodiscard]] auto ConsumingUses() const
      -> const std::vector<ConsumingUse>& {
    return uses_;
  }

 private:
  std::vector<Scope> scopes_;
  absl::flat_hash_map<ir::LocalId, ScopeId> local_scope_;
  std::vector<ConsumingUse> uses_;
};

// Builds the lexical scope tree of a procedure body with an explicit exit
// edge for every way control leaves each scope. Throws InternalError on a
// break or continue outside a loop.
auto BuildScopeTree(const ir::Procedure& proc, const ir::Arena& arena)
    -> ScopeTree;

}  // namespace lifter::lifecycle
