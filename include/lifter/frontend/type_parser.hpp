#pragma once

#include <string>
#include <string_view>

#include "absl/container/flat_hash_map.h"
#include "lifter/common/diagnostic/diagnostic.hpp"
#include "lifter/common/type.hpp"
#include "lifter/common/type_arena.hpp"

namespace lifter::frontend {

using TypeNameMap = absl::flat_hash_map<std::string, TypeId>;

// Names visible to a type expression.
struct TypeScope {
  const TypeNameMap* types = nullptr;
  const TypeNameMap* generics = nullptr;  // may be null
};

// Parses a type expression:
//
//   type    := ('ref' | 'ptr' | 'var' | 'lent') type | primary
//   primary := '(' type (',' type)* ')'
//            | 'array' '[' INT ',' type ']'
//            | 'seq' '[' type ']'
//            | NAME ('[' type (',' type)* ']')?
//
// Errors are host errors without a span; the caller knows where the text
// came from.
auto ParseTypeExpression(
    std::string_view text, TypeArena& arena, const TypeScope& scope)
    -> Result<TypeId>;

}  // namespace lifter::frontend
