#pragma once

#include <string>
#include <vector>

#include "lifter/common/source_span.hpp"
#include "lifter/common/type.hpp"
#include "lifter/common/type_arena.hpp"
#include "lifter/ir/arena.hpp"
#include "lifter/ir/fwd.hpp"

namespace lifter::ir {

struct ParameterDecl {
  std::string name;
  TypeId type;
  SourceSpan span;
};

// A declared operator whose name may reserve it as a lifecycle hook.
struct OperatorDecl {
  std::string name;
  std::vector<TypeId> generic_params;
  std::vector<ParameterDecl> params;
  TypeId result = kInvalidTypeId;  // kInvalidTypeId when absent
  std::string impl;                // symbol of the user implementation
  SourceSpan span;
};

// Everything the front end hands over for one compilation unit: the resolved
// type graph, lifecycle operator declarations, and procedure bodies.
struct CompilationUnit {
  std::string name;
  TypeArena types;
  Arena arena;
  std::vector<OperatorDecl> operators;
  std::vector<ProcedureId> procedures;
};

}  // namespace lifter::ir
