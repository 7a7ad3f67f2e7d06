#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "lifter/common/type.hpp"
#include "lifter/ir/arena.hpp"
#include "lifter/ir/fwd.hpp"
#include "lifter/ir/procedure.hpp"
#include "lifter/lifecycle/expand.hpp"
#include "lifter/lifecycle/resolver.hpp"

namespace lifter::lifecycle {

enum class HandoffStrategy : uint8_t {
  kUserDeepCopy,    // the bound =deepCopy hook
  kLiftedDeepCopy,  // synthesized from constituent hooks
  kStructuralClone,
  kBitwiseCopy,
};

auto ToString(HandoffStrategy strategy) -> std::string_view;

// How one argument of a task submission is handed to the other thread.
struct HandoffAnnotation {
  ir::StatementId statement;
  std::string callee;
  uint32_t argument_index = 0;
  ir::ExpressionId argument;
  TypeId type;
  HandoffStrategy strategy = HandoffStrategy::kBitwiseCopy;
  std::vector<HookCall> calls;  // deep-copy strategies only
};

// Resolves DeepCopy for every argument of every spawn in a procedure,
// independently of Assign and Destroy.
class CrossThreadGate {
 public:
  explicit CrossThreadGate(LiftingResolver& resolver) : resolver_(resolver) {
  }

  auto Annotate(const ir::Procedure& proc, const ir::Arena& arena)
      -> std::vector<HandoffAnnotation>;

  // Strategy and calls for handing over one value of `type`.
  auto Handoff(TypeId type, std::string_view path) -> HandoffAnnotation;

 private:
  void VisitStatement(
      const ir::Procedure& proc, const ir::Arena& arena, ir::StatementId id,
      std::vector<HandoffAnnotation>& out);

  LiftingResolver& resolver_;
};

}  // namespace lifter::lifecycle
