#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "lifter/common/type.hpp"
#include "lifter/frontend/type_parser.hpp"
#include "lifter/frontend/unit_loader.hpp"
#include "lifter/ir/procedure.hpp"
#include "lifter/ir/unit.hpp"

namespace lifter::test {

// Loads a unit from inline YAML. A document that fails to load throws, which
// fails the calling test with the loader's message.
inline auto LoadOrThrow(std::string_view yaml) -> ir::CompilationUnit {
  auto unit = frontend::LoadUnit(yaml, FileId{1}, "test");
  if (!unit) {
    throw std::runtime_error(
        "unit failed to load: " + unit.error().primary.message);
  }
  return std::move(*unit);
}

// Nominal type declared as `name`.
inline auto FindType(const ir::CompilationUnit& unit, std::string_view name)
    -> TypeId {
  for (TypeId id : unit.types.NominalTypes()) {
    if (unit.types.ToString(id) == name) {
      return id;
    }
  }
  throw std::runtime_error("no type named '" + std::string(name) + "'");
}

// Parses a type expression against the unit's nominal types, creating
// compound types on demand.
inline auto TypeOf(ir::CompilationUnit& unit, std::string_view text)
    -> TypeId {
  frontend::TypeNameMap names;
  for (TypeId id : unit.types.NominalTypes()) {
    const Type& type = unit.types[id];
    names.emplace(
        type.Kind() == TypeKind::kObject ? type.AsObject().name
                                         : type.AsDistinct().name,
        id);
  }
  auto type = frontend::ParseTypeExpression(
      text, unit.types, frontend::TypeScope{.types = &names});
  if (!type) {
    throw std::runtime_error(type.error().primary.message);
  }
  return *type;
}

inline auto FindProcedure(
    const ir::CompilationUnit& unit, std::string_view name)
    -> const ir::Procedure& {
  for (ir::ProcedureId id : unit.procedures) {
    if (unit.arena[id].name == name) {
      return unit.arena[id];
    }
  }
  throw std::runtime_error("no procedure named '" + std::string(name) + "'");
}

}  // namespace lifter::test
