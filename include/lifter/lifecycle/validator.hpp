#pragma once

#include <vector>

#include "lifter/common/diagnostic/diagnostic_sink.hpp"
#include "lifter/ir/arena.hpp"
#include "lifter/ir/procedure.hpp"
#include "lifter/lifecycle/context.hpp"
#include "lifter/lifecycle/resolver.hpp"

namespace lifter::lifecycle {

// Rejects values with a non-default destroy created outside the policy's
// sites. Place expressions (names, field access, indexing, dereference)
// denote existing storage and are never checked.
class ContextValidator {
 public:
  ContextValidator(LiftingResolver& resolver, const ContextPolicy& policy)
      : resolver_(resolver), policy_(policy) {
  }

  // Reports IllegalDestructibleUsage per offending expression. Returns the
  // number of errors reported.
  auto Validate(
      const ir::Procedure& proc, const ir::Arena& arena,
      const std::vector<TaggedSite>& sites, DiagnosticSink& sink) -> size_t;

 private:
  LiftingResolver& resolver_;
  const ContextPolicy& policy_;
};

}  // namespace lifter::lifecycle
