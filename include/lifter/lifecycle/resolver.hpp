#pragma once

#include <cstdint>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/container/node_hash_map.h"
#include "lifter/common/diagnostic/diagnostic.hpp"
#include "lifter/common/diagnostic/diagnostic_sink.hpp"
#include "lifter/common/type_arena.hpp"
#include "lifter/lifecycle/operation_kind.hpp"
#include "lifter/lifecycle/registry.hpp"

namespace lifter::lifecycle {

enum class Outcome : uint8_t {
  kDefault,       // bitwise / no-op; structural clone for DeepCopy
  kUserOverride,  // the bound hook is called
  kLifted,        // synthesized from the constituents' operations
};

auto ToString(Outcome outcome) -> std::string_view;

enum class SlotKind : uint8_t {
  kField,
  kTupleSlot,
  kElements,  // every element of an array or sequence
  kBase,
  kDistinctBase,
  kPointee,  // DeepCopy through ref/ptr
};

// One constituent visited by a lifted operation, in visiting order.
struct LiftStep {
  SlotKind slot;
  uint32_t index = 0;  // field or tuple slot index
  std::string label;   // field name
  uint32_t count = 0;  // static element count of an array
  bool dynamic_count = false;
  TypeId constituent;
  Outcome constituent_outcome = Outcome::kDefault;
};

struct EffectiveOperation {
  OpKind kind;
  TypeId type;
  Outcome outcome = Outcome::kDefault;
  const BoundOperation* binding = nullptr;  // kUserOverride only
  std::vector<LiftStep> steps;              // kLifted only
};

// Answers "which operation runs for (type, kind)" by structural recursion
// over the frozen registry. Results, including failures, are cached for the
// lifetime of the resolver and returned pointers stay valid as long.
class LiftingResolver {
 public:
  // Recursive-type diagnostics go to `sink` when one is given.
  LiftingResolver(
      const TypeArena& types, const OperationRegistry& registry,
      DiagnosticSink* sink = nullptr)
      : types_(types), registry_(registry), sink_(sink) {
  }

  // Throws InternalError when the registry is not frozen yet.
  auto Resolve(TypeId type, OpKind kind) -> Result<const EffectiveOperation*>;

  // Outcome of Resolve; unresolvable types count as default.
  auto OutcomeOf(TypeId type, OpKind kind) -> Outcome;

  // Binding that applies to `type` itself: its own, its generic origin's,
  // or for DeepCopy on ref/ptr the pointee's.
  [[nodiscard]] auto FindBinding(TypeId type, OpKind kind) const
      -> const BoundOperation*;

  // True if a value of the type owns or refers to storage outside itself.
  auto ReachesIndirection(TypeId type) -> bool;

  // Number of distinct (type, kind) computations so far.
  [[nodiscard]] auto ComputedCount() const -> size_t {
    return memo_.size();
  }

  [[nodiscard]] auto Types() const -> const TypeArena& {
    return types_;
  }

 private:
  enum class CycleState : uint8_t { kVisiting, kAcyclic, kCyclic };

  auto Compute(TypeId type, OpKind kind) -> Result<EffectiveOperation>;

  auto CheckValueCycle(TypeId type) -> Result<void>;
  void VisitValueGraph(TypeId type, std::vector<TypeId>& stack);
  void ReportCycle(TypeId type, const std::vector<TypeId>& stack);
  [[nodiscard]] auto ValueConstituents(TypeId type) const
      -> std::vector<TypeId>;

  [[nodiscard]] auto Constituents(TypeId type, OpKind kind) const
      -> std::vector<TypeId>;
  [[nodiscard]] auto ReachesOverride(
      TypeId type, OpKind kind, absl::flat_hash_set<TypeId>& visited) const
      -> bool;
  [[nodiscard]] auto ConstituentOutcome(TypeId type, OpKind kind) const
      -> Outcome;
  [[nodiscard]] auto BuildSteps(TypeId type, OpKind kind) const
      -> std::vector<LiftStep>;
  auto ReachesIndirectionImpl(
      TypeId type, absl::flat_hash_set<TypeId>& visited) -> bool;

  const TypeArena& types_;
  const OperationRegistry& registry_;
  DiagnosticSink* sink_;

  absl::node_hash_map<std::pair<TypeId, OpKind>, Result<EffectiveOperation>>
      memo_;
  absl::flat_hash_map<TypeId, CycleState> cycle_state_;
  absl::flat_hash_map<TypeId, Diagnostic> cycle_errors_;
  absl::flat_hash_map<TypeId, bool> indirection_memo_;
};

}  // namespace lifter::lifecycle
