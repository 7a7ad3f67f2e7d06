#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "lifter/common/source_span.hpp"
#include "lifter/common/type.hpp"
#include "lifter/ir/fwd.hpp"

namespace lifter::ir {

enum class LocalKind : uint8_t {
  kParameter,
  kVariable,
  kLet,
  kResult,  // implicit result variable of a procedure with a result type
};

struct LocalSymbol {
  std::string name;
  TypeId type;
  LocalKind kind = LocalKind::kVariable;
  SourceSpan span;
};

struct Procedure {
  std::string name;
  std::vector<LocalId> params;
  TypeId result_type = kInvalidTypeId;  // kInvalidTypeId for no result
  LocalId result_local = kInvalidLocalId;
  StatementId body = kInvalidStatementId;  // always a block statement
  std::vector<LocalSymbol> locals;
  SourceSpan span;

  [[nodiscard]] auto Local(LocalId id) const -> const LocalSymbol& {
    return locals.at(id.value);
  }
};

}  // namespace lifter::ir
