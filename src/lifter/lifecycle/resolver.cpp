#include "lifter/lifecycle/resolver.hpp"

#include <algorithm>
#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "lifter/common/internal_error.hpp"
#include "lifter/common/type.hpp"

namespace lifter::lifecycle {

auto ToString(Outcome outcome) -> std::string_view {
  switch (outcome) {
    case Outcome::kDefault:
      return "default";
    case Outcome::kUserOverride:
      return "user";
    case Outcome::kLifted:
      return "lifted";
  }
  return "unknown";
}

auto LiftingResolver::Resolve(TypeId type, OpKind kind)
    -> Result<const EffectiveOperation*> {
  if (!registry_.IsFrozen()) {
    throw common::InternalError(
        "LiftingResolver::Resolve",
        "queried before the operation registry was frozen");
  }
  auto key = std::make_pair(type, kind);
  auto it = memo_.find(key);
  if (it == memo_.end()) {
    it = memo_.emplace(key, Compute(type, kind)).first;
  }
  if (!it->second) {
    return std::unexpected(it->second.error());
  }
  return &*it->second;
}

auto LiftingResolver::OutcomeOf(TypeId type, OpKind kind) -> Outcome {
  auto result = Resolve(type, kind);
  if (!result) {
    return Outcome::kDefault;
  }
  return (*result)->outcome;
}

auto LiftingResolver::FindBinding(TypeId type, OpKind kind) const
    -> const BoundOperation* {
  const Type& t = types_[type];
  if (IsNominal(t.Kind())) {
    if (const auto* binding = registry_.Lookup(type, kind)) {
      return binding;
    }
    TypeId origin = types_.GenericOrigin(type);
    if (origin != type) {
      return registry_.Lookup(origin, kind);
    }
    return nullptr;
  }
  if (kind == OpKind::kDeepCopy && IsHeapIndirection(t.Kind())) {
    TypeId pointee = t.AsIndirection().pointee;
    if (IsNominal(types_[pointee].Kind())) {
      return FindBinding(pointee, kind);
    }
  }
  return nullptr;
}

auto LiftingResolver::Compute(TypeId type, OpKind kind)
    -> Result<EffectiveOperation> {
  if (auto acyclic = CheckValueCycle(type); !acyclic) {
    return std::unexpected(std::move(acyclic.error()));
  }

  EffectiveOperation op{.kind = kind, .type = type};
  if (const auto* binding = FindBinding(type, kind)) {
    op.outcome = Outcome::kUserOverride;
    op.binding = binding;
    return op;
  }

  absl::flat_hash_set<TypeId> visited;
  if (!ReachesOverride(type, kind, visited)) {
    return op;
  }

  op.outcome = Outcome::kLifted;
  op.steps = BuildSteps(type, kind);
  spdlog::trace(
      "lifted {} for '{}' over {} constituents", ToString(kind),
      types_.ToString(type), op.steps.size());
  return op;
}

// By-value recursion check

auto LiftingResolver::ValueConstituents(TypeId type) const
    -> std::vector<TypeId> {
  const Type& t = types_[type];
  std::vector<TypeId> result;
  switch (t.Kind()) {
    case TypeKind::kObject: {
      const ObjectInfo& info = t.AsObject();
      if (info.base) {
        result.push_back(info.base);
      }
      for (const auto& field : info.fields) {
        result.push_back(field.type);
      }
      break;
    }
    case TypeKind::kDistinct:
      if (t.AsDistinct().base) {
        result.push_back(t.AsDistinct().base);
      }
      break;
    case TypeKind::kTuple:
      result = t.AsTuple().elements;
      break;
    case TypeKind::kArray:
      result.push_back(t.AsArray().element);
      break;
    default:
      // Sequences own a heap buffer; ref/ptr/var/lent point elsewhere.
      break;
  }
  return result;
}

auto LiftingResolver::CheckValueCycle(TypeId type) -> Result<void> {
  std::vector<TypeId> stack;
  VisitValueGraph(type, stack);
  auto it = cycle_errors_.find(type);
  if (it != cycle_errors_.end()) {
    return std::unexpected(it->second);
  }
  return {};
}

void LiftingResolver::VisitValueGraph(
    TypeId type, std::vector<TypeId>& stack) {
  auto [it, inserted] = cycle_state_.try_emplace(type, CycleState::kVisiting);
  if (!inserted) {
    if (it->second == CycleState::kVisiting) {
      ReportCycle(type, stack);
    }
    return;
  }

  stack.push_back(type);
  for (TypeId child : ValueConstituents(type)) {
    VisitValueGraph(child, stack);
    auto child_error = cycle_errors_.find(child);
    if (child_error != cycle_errors_.end() && !cycle_errors_.contains(type)) {
      // Containing a recursive type by value makes this one unresolvable
      // too, under the same diagnostic.
      Diagnostic diag = child_error->second;
      cycle_errors_.emplace(type, std::move(diag));
    }
  }
  stack.pop_back();
  cycle_state_[type] = cycle_errors_.contains(type) ? CycleState::kCyclic
                                                    : CycleState::kAcyclic;
}

void LiftingResolver::ReportCycle(
    TypeId type, const std::vector<TypeId>& stack) {
  auto start = std::find(stack.begin(), stack.end(), type);
  if (start == stack.end()) {
    throw common::InternalError(
        "LiftingResolver::ReportCycle", "back edge to a type not on stack");
  }
  std::vector<TypeId> members(start, stack.end());

  bool all_known = std::all_of(members.begin(), members.end(), [&](TypeId m) {
    return cycle_errors_.contains(m);
  });
  if (all_known) {
    return;
  }

  // Anchor the diagnostic on the first nominal type of the cycle.
  TypeId anchor = type;
  for (TypeId member : members) {
    if (IsNominal(types_[member].Kind())) {
      anchor = member;
      break;
    }
  }

  std::vector<std::string> path;
  path.reserve(members.size() + 1);
  for (TypeId member : members) {
    path.push_back(types_.ToString(member));
  }
  path.push_back(types_.ToString(type));

  Diagnostic diag =
      Diagnostic::Error(
          types_.DeclarationSpan(anchor), DiagCode::kUnresolvableRecursiveType,
          fmt::format(
              "type '{}' contains itself by value ({})",
              types_.ToString(anchor), fmt::join(path, " -> ")))
          .WithNote("use 'ref', 'ptr' or 'seq' to break the cycle");

  for (TypeId member : members) {
    cycle_errors_.emplace(member, diag);
  }
  if (sink_ != nullptr) {
    sink_->Report(std::move(diag));
  }
}

// Reachability of user overrides

auto LiftingResolver::Constituents(TypeId type, OpKind kind) const
    -> std::vector<TypeId> {
  const Type& t = types_[type];
  switch (t.Kind()) {
    case TypeKind::kSequence:
      return {t.AsSequence().element};
    case TypeKind::kRef:
    case TypeKind::kPtr:
      if (kind == OpKind::kDeepCopy) {
        return {t.AsIndirection().pointee};
      }
      return {};
    default:
      return ValueConstituents(type);
  }
}

auto LiftingResolver::ReachesOverride(
    TypeId type, OpKind kind, absl::flat_hash_set<TypeId>& visited) const
    -> bool {
  if (!visited.insert(type).second) {
    return false;
  }
  if (FindBinding(type, kind) != nullptr) {
    return true;
  }
  for (TypeId child : Constituents(type, kind)) {
    if (ReachesOverride(child, kind, visited)) {
      return true;
    }
  }
  return false;
}

auto LiftingResolver::ConstituentOutcome(TypeId type, OpKind kind) const
    -> Outcome {
  if (FindBinding(type, kind) != nullptr) {
    return Outcome::kUserOverride;
  }
  absl::flat_hash_set<TypeId> visited;
  if (ReachesOverride(type, kind, visited)) {
    return Outcome::kLifted;
  }
  return Outcome::kDefault;
}

auto LiftingResolver::BuildSteps(TypeId type, OpKind kind) const
    -> std::vector<LiftStep> {
  const Type& t = types_[type];
  std::vector<LiftStep> steps;
  auto make = [&](SlotKind slot, TypeId constituent) {
    return LiftStep{
        .slot = slot,
        .constituent = constituent,
        .constituent_outcome = ConstituentOutcome(constituent, kind),
    };
  };

  switch (t.Kind()) {
    case TypeKind::kObject: {
      const ObjectInfo& info = t.AsObject();
      std::vector<LiftStep> fields;
      fields.reserve(info.fields.size());
      for (size_t i = 0; i < info.fields.size(); ++i) {
        LiftStep step = make(SlotKind::kField, info.fields[i].type);
        step.index = static_cast<uint32_t>(i);
        step.label = info.fields[i].name;
        fields.push_back(std::move(step));
      }
      if (kind == OpKind::kDestroy) {
        // Own fields torn down last-declared first, then the base.
        std::reverse(fields.begin(), fields.end());
        steps = std::move(fields);
        if (info.base) {
          steps.push_back(make(SlotKind::kBase, info.base));
        }
      } else {
        if (info.base) {
          steps.push_back(make(SlotKind::kBase, info.base));
        }
        for (auto& step : fields) {
          steps.push_back(std::move(step));
        }
      }
      break;
    }
    case TypeKind::kDistinct:
      steps.push_back(make(SlotKind::kDistinctBase, t.AsDistinct().base));
      break;
    case TypeKind::kTuple: {
      const auto& elements = t.AsTuple().elements;
      for (size_t i = 0; i < elements.size(); ++i) {
        LiftStep step = make(SlotKind::kTupleSlot, elements[i]);
        step.index = static_cast<uint32_t>(i);
        steps.push_back(std::move(step));
      }
      if (kind == OpKind::kDestroy) {
        std::reverse(steps.begin(), steps.end());
      }
      break;
    }
    case TypeKind::kArray: {
      LiftStep step = make(SlotKind::kElements, t.AsArray().element);
      step.count = t.AsArray().length;
      steps.push_back(std::move(step));
      break;
    }
    case TypeKind::kSequence: {
      LiftStep step = make(SlotKind::kElements, t.AsSequence().element);
      step.dynamic_count = true;
      steps.push_back(std::move(step));
      break;
    }
    case TypeKind::kRef:
    case TypeKind::kPtr:
      steps.push_back(make(SlotKind::kPointee, t.AsIndirection().pointee));
      break;
    default:
      throw common::InternalError(
          "LiftingResolver::BuildSteps",
          fmt::format("type '{}' has no constituents", types_.ToString(type)));
  }
  return steps;
}

auto LiftingResolver::ReachesIndirection(TypeId type) -> bool {
  auto it = indirection_memo_.find(type);
  if (it != indirection_memo_.end()) {
    return it->second;
  }
  absl::flat_hash_set<TypeId> visited;
  bool result = ReachesIndirectionImpl(type, visited);
  indirection_memo_.emplace(type, result);
  return result;
}

auto LiftingResolver::ReachesIndirectionImpl(
    TypeId type, absl::flat_hash_set<TypeId>& visited) -> bool {
  if (!visited.insert(type).second) {
    return false;
  }
  const Type& t = types_[type];
  switch (t.Kind()) {
    case TypeKind::kString:
    case TypeKind::kSequence:
    case TypeKind::kRef:
    case TypeKind::kPtr:
    case TypeKind::kVar:
    case TypeKind::kLent:
      return true;
    default:
      break;
  }
  for (TypeId child : ValueConstituents(type)) {
    if (ReachesIndirectionImpl(child, visited)) {
      return true;
    }
  }
  return false;
}

}  // namespace lifter::lifecycle
