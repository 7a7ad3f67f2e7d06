#pragma once

#include <vector>

#include "lifter/common/diagnostic/diagnostic.hpp"
#include "lifter/common/diagnostic/diagnostic_sink.hpp"
#include "lifter/common/type_arena.hpp"
#include "lifter/ir/unit.hpp"
#include "lifter/lifecycle/registry.hpp"

namespace lifter::lifecycle {

// Validates lifecycle operator declarations and records them in the
// registry. A rejected declaration is treated as absent.
class OperationBinder {
 public:
  OperationBinder(const TypeArena& types, OperationRegistry& registry)
      : types_(types), registry_(registry) {
  }

  // Returns nullptr for operators that are not lifecycle hooks.
  auto Bind(const ir::OperatorDecl& decl, uint32_t decl_index = 0)
      -> Result<const BoundOperation*>;

  // Binds every declaration in order, reporting each failure to the sink.
  // Returns the number of bindings recorded.
  auto BindAll(
      const std::vector<ir::OperatorDecl>& decls, DiagnosticSink& sink)
      -> size_t;

 private:
  auto BindAssign(const ir::OperatorDecl& decl, uint32_t decl_index)
      -> Result<const BoundOperation*>;
  auto BindDestroy(const ir::OperatorDecl& decl, uint32_t decl_index)
      -> Result<const BoundOperation*>;
  auto BindDeepCopy(const ir::OperatorDecl& decl, uint32_t decl_index)
      -> Result<const BoundOperation*>;

  // Maps a receiver type to the nominal the binding is keyed on. A generic
  // instance spelled with exactly the operator's own generic parameters
  // binds to the generic definition.
  auto NormalizeReceiver(const ir::OperatorDecl& decl, TypeId receiver)
      -> Result<TypeId>;

  auto CheckVoidResult(const ir::OperatorDecl& decl) -> Result<void>;

  auto Record(BoundOperation op) -> Result<const BoundOperation*>;

  const TypeArena& types_;
  OperationRegistry& registry_;
};

}  // namespace lifter::lifecycle
