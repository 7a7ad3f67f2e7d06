#include "lifter/lifecycle/expand.hpp"

#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "lifter/common/internal_error.hpp"

namespace lifter::lifecycle {

namespace {

// i, j, k, then i3, i4, ...
auto LoopVariable(uint32_t depth) -> std::string {
  static constexpr std::string_view kNames = "ijk";
  if (depth < kNames.size()) {
    return std::string(1, kNames[depth]);
  }
  return fmt::format("i{}", depth);
}

class Expander {
 public:
  Expander(LiftingResolver& resolver, OpKind kind)
      : resolver_(resolver), kind_(kind) {
  }

  void Expand(TypeId type, const std::string& path, uint32_t depth) {
    auto result = resolver_.Resolve(type, kind_);
    if (!result) {
      return;
    }
    const EffectiveOperation& op = **result;
    switch (op.outcome) {
      case Outcome::kDefault:
        if (kind_ == OpKind::kDeepCopy && !active_.empty() &&
            resolver_.ReachesIndirection(type)) {
          Push(CallTarget::kStructuralClone, type, path, depth);
        }
        return;
      case Outcome::kUserOverride:
        calls_.push_back(
            HookCall{
                .target = CallTarget::kUserHook,
                .kind = kind_,
                .type = type,
                .binding = op.binding,
                .path = path,
                .loop_depth = depth,
            });
        return;
      case Outcome::kLifted:
        break;
    }

    if (std::find(active_.begin(), active_.end(), type) != active_.end()) {
      Push(CallTarget::kLiftedHook, type, path, depth);
      return;
    }

    if (kind_ == OpKind::kDeepCopy && OwnsSeparateStorage(type)) {
      Push(CallTarget::kShallowCopy, type, path, depth);
    }

    active_.push_back(type);
    for (const LiftStep& step : op.steps) {
      if (step.constituent_outcome == Outcome::kDefault &&
          kind_ != OpKind::kDeepCopy) {
        continue;
      }
      ExpandStep(step, path, depth);
    }
    active_.pop_back();
  }

  auto TakeCalls() -> std::vector<HookCall> {
    return std::move(calls_);
  }

 private:
  void Push(
      CallTarget target, TypeId type, const std::string& path, uint32_t depth) {
    calls_.push_back(
        HookCall{
            .target = target,
            .kind = kind_,
            .type = type,
            .path = path,
            .loop_depth = depth,
        });
  }

  [[nodiscard]] auto OwnsSeparateStorage(TypeId type) const -> bool {
    TypeKind kind = resolver_.Types()[type].Kind();
    return kind == TypeKind::kSequence || IsHeapIndirection(kind);
  }

  void ExpandStep(const LiftStep& step, const std::string& path,
                  uint32_t depth) {
    const TypeArena& types = resolver_.Types();
    switch (step.slot) {
      case SlotKind::kField:
        Expand(step.constituent, fmt::format("{}.{}", path, step.label), depth);
        return;
      case SlotKind::kTupleSlot:
        Expand(step.constituent, fmt::format("{}[{}]", path, step.index), depth);
        return;
      case SlotKind::kBase:
      case SlotKind::kDistinctBase:
        Expand(
            step.constituent,
            fmt::format("{}({})", types.ToString(step.constituent), path),
            depth);
        return;
      case SlotKind::kPointee:
        Expand(step.constituent, fmt::format("{}[]", path), depth);
        return;
      case SlotKind::kElements:
        if (!step.dynamic_count && step.count <= kMaxUnrolledElements) {
          for (uint32_t i = 0; i < step.count; ++i) {
            Expand(step.constituent, fmt::format("{}[{}]", path, i), depth);
          }
        } else {
          Expand(
              step.constituent,
              fmt::format("{}[{}]", path, LoopVariable(depth)), depth + 1);
        }
        return;
    }
    throw common::InternalError("ExpandCalls", "unknown slot kind");
  }

  LiftingResolver& resolver_;
  OpKind kind_;
  std::vector<TypeId> active_;
  std::vector<HookCall> calls_;
};

}  // namespace

auto ExpandCalls(
    LiftingResolver& resolver, TypeId type, OpKind kind,
    std::string_view root_path) -> std::vector<HookCall> {
  Expander expander(resolver, kind);
  expander.Expand(type, std::string(root_path), 0);
  return expander.TakeCalls();
}

auto FormatHookCall(const TypeArena& types, const HookCall& call)
    -> std::string {
  switch (call.target) {
    case CallTarget::kUserHook:
      return fmt::format(
          "{}[{}]({})", OperatorName(call.kind), types.ToString(call.type),
          call.path);
    case CallTarget::kLiftedHook:
      return fmt::format(
          "lifted {}[{}]({})", OperatorName(call.kind),
          types.ToString(call.type), call.path);
    case CallTarget::kShallowCopy:
      return fmt::format(
          "shallowCopy[{}]({})", types.ToString(call.type), call.path);
    case CallTarget::kStructuralClone:
      return fmt::format("clone[{}]({})", types.ToString(call.type), call.path);
  }
  throw common::InternalError("FormatHookCall", "unknown call target");
}

}  // namespace lifter::lifecycle
