#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "lifter/common/type.hpp"
#include "lifter/lifecycle/operation_kind.hpp"
#include "lifter/lifecycle/registry.hpp"
#include "lifter/lifecycle/resolver.hpp"

namespace lifter::lifecycle {

enum class CallTarget : uint8_t {
  kUserHook,
  // Call back into the synthesized operation of a type that is already being
  // expanded (recursion through a sequence or a pointee).
  kLiftedHook,
  // DeepCopy only. Fresh storage for a sequence buffer or pointee, copied
  // bitwise; the calls that follow fix up its slots.
  kShallowCopy,
  // DeepCopy only. A default constituent that still reaches heap storage.
  kStructuralClone,
};

// One leaf call code generation emits for an effective operation.
struct HookCall {
  CallTarget target;
  OpKind kind;
  TypeId type;
  const BoundOperation* binding = nullptr;  // kUserHook only
  std::string path;                         // e.g. "o.items[i].h"
  uint32_t loop_depth = 0;  // number of enclosing per-element loops
};

// Arrays up to this length are expanded element by element; longer ones get
// a per-element loop like sequences.
inline constexpr uint32_t kMaxUnrolledElements = 16;

// Flattens resolve(type, kind) into ordered leaf calls on `root_path`.
// Default constituents produce nothing, except under DeepCopy where one that
// reaches an indirection gets a structural clone. Unresolvable types produce
// nothing (their diagnostic has already been reported).
auto ExpandCalls(
    LiftingResolver& resolver, TypeId type, OpKind kind,
    std::string_view root_path) -> std::vector<HookCall>;

// "=destroy[Handle](o.b)", "lifted =destroy[Node](n.kids[i])",
// "shallowCopy[seq[Job]](jobs)" or "clone[seq[int]](j.tags)".
auto FormatHookCall(const TypeArena& types, const HookCall& call)
    -> std::string;

}  // namespace lifter::lifecycle
