#include "lifter/common/type_arena.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>

#include "lifter/common/internal_error.hpp"
#include "lifter/common/type.hpp"

namespace lifter {

auto ToString(TypeKind kind) -> std::string_view {
  switch (kind) {
    case TypeKind::kVoid:
      return "void";
    case TypeKind::kBool:
      return "bool";
    case TypeKind::kInt:
      return "int";
    case TypeKind::kFloat:
      return "float";
    case TypeKind::kString:
      return "string";
    case TypeKind::kObject:
      return "object";
    case TypeKind::kDistinct:
      return "distinct";
    case TypeKind::kGenericParam:
      return "generic parameter";
    case TypeKind::kArray:
      return "array";
    case TypeKind::kSequence:
      return "seq";
    case TypeKind::kTuple:
      return "tuple";
    case TypeKind::kRef:
      return "ref";
    case TypeKind::kPtr:
      return "ptr";
    case TypeKind::kVar:
      return "var";
    case TypeKind::kLent:
      return "lent";
  }
  return "unknown";
}

namespace {

template <typename T>
auto GetPayload(const TypePayload& payload, const char* accessor) -> const T& {
  const auto* info = std::get_if<T>(&payload);
  if (info == nullptr) {
    throw common::InternalError(accessor, "type kind mismatch");
  }
  return *info;
}

}  // namespace

auto Type::AsObject() const -> const ObjectInfo& {
  return GetPayload<ObjectInfo>(payload_, "Type::AsObject");
}

auto Type::AsDistinct() const -> const DistinctInfo& {
  return GetPayload<DistinctInfo>(payload_, "Type::AsDistinct");
}

auto Type::AsGenericParam() const -> const GenericParamInfo& {
  return GetPayload<GenericParamInfo>(payload_, "Type::AsGenericParam");
}

auto Type::AsArray() const -> const ArrayInfo& {
  return GetPayload<ArrayInfo>(payload_, "Type::AsArray");
}

auto Type::AsSequence() const -> const SequenceInfo& {
  return GetPayload<SequenceInfo>(payload_, "Type::AsSequence");
}

auto Type::AsTuple() const -> const TupleInfo& {
  return GetPayload<TupleInfo>(payload_, "Type::AsTuple");
}

auto Type::AsIndirection() const -> const IndirectionInfo& {
  return GetPayload<IndirectionInfo>(payload_, "Type::AsIndirection");
}

TypeArena::TypeArena() {
  void_ = Intern(TypeKind::kVoid, {}, std::monostate{});
  bool_ = Intern(TypeKind::kBool, {}, std::monostate{});
  int_ = Intern(TypeKind::kInt, {}, std::monostate{});
  float_ = Intern(TypeKind::kFloat, {}, std::monostate{});
  string_ = Intern(TypeKind::kString, {}, std::monostate{});
}

auto TypeArena::operator[](TypeId id) const -> const Type& {
  if (!id || id.value >= types_.size()) {
    throw common::InternalError(
        "TypeArena", fmt::format("type id {} out of range", id.value));
  }
  return types_[id.value];
}

auto TypeArena::Push(TypeKind kind, TypePayload payload) -> TypeId {
  TypeId id{static_cast<uint32_t>(types_.size())};
  types_.emplace_back();
  types_.back().kind_ = kind;
  types_.back().payload_ = std::move(payload);
  return id;
}

auto TypeArena::Intern(
    TypeKind kind, std::vector<uint32_t> operands, TypePayload payload)
    -> TypeId {
  TypeKey key{.kind = kind, .operands = std::move(operands)};
  auto it = map_.find(key);
  if (it != map_.end()) {
    return it->second;
  }
  TypeId id = Push(kind, std::move(payload));
  map_.emplace(std::move(key), id);
  return id;
}

auto TypeArena::DeclareObject(std::string name, SourceSpan span) -> TypeId {
  TypeId id = Push(
      TypeKind::kObject, ObjectInfo{.name = std::move(name), .span = span});
  nominals_.push_back(id);
  return id;
}

auto TypeArena::DeclareGenericObject(
    std::string name, const std::vector<std::string>& params, SourceSpan span)
    -> TypeId {
  std::vector<TypeId> param_types;
  param_types.reserve(params.size());
  for (size_t i = 0; i < params.size(); ++i) {
    param_types.push_back(
        MakeGenericParam(params[i], static_cast<uint32_t>(i)));
  }
  TypeId id = Push(
      TypeKind::kObject, ObjectInfo{
                             .name = std::move(name),
                             .span = span,
                             .type_params = std::move(param_types),
                         });
  nominals_.push_back(id);
  return id;
}

auto TypeArena::DeclareDistinct(std::string name, SourceSpan span) -> TypeId {
  TypeId id = Push(
      TypeKind::kDistinct, DistinctInfo{.name = std::move(name), .span = span});
  nominals_.push_back(id);
  return id;
}

auto TypeArena::MakeGenericParam(std::string name, uint32_t index) -> TypeId {
  return Push(
      TypeKind::kGenericParam,
      GenericParamInfo{.name = std::move(name), .index = index});
}

void TypeArena::SetObjectBody(
    TypeId object, std::vector<FieldInfo> fields, TypeId base) {
  if ((*this)[object].Kind() != TypeKind::kObject) {
    throw common::InternalError("SetObjectBody", "not an object type");
  }
  auto& info = std::get<ObjectInfo>(types_[object.value].payload_);
  if (info.complete) {
    throw common::InternalError(
        "SetObjectBody", fmt::format("body of '{}' set twice", info.name));
  }
  info.fields = std::move(fields);
  info.base = base;
  info.complete = true;

  // Complete instances that were created before the definition had a body.
  auto it = instances_.find(object);
  if (it != instances_.end()) {
    std::vector<TypeId> pending = it->second;
    for (TypeId instance : pending) {
      PopulateInstance(instance);
    }
  }
}

void TypeArena::SetDistinctBase(TypeId distinct, TypeId base) {
  if ((*this)[distinct].Kind() != TypeKind::kDistinct) {
    throw common::InternalError("SetDistinctBase", "not a distinct type");
  }
  std::get<DistinctInfo>(types_[distinct.value].payload_).base = base;
}

auto TypeArena::Array(TypeId element, uint32_t length) -> TypeId {
  return Intern(
      TypeKind::kArray, {element.value, length},
      ArrayInfo{.element = element, .length = length});
}

auto TypeArena::Sequence(TypeId element) -> TypeId {
  return Intern(
      TypeKind::kSequence, {element.value}, SequenceInfo{.element = element});
}

auto TypeArena::Tuple(std::vector<TypeId> elements) -> TypeId {
  std::vector<uint32_t> operands;
  operands.reserve(elements.size());
  for (TypeId element : elements) {
    operands.push_back(element.value);
  }
  return Intern(
      TypeKind::kTuple, std::move(operands),
      TupleInfo{.elements = std::move(elements)});
}

auto TypeArena::Ref(TypeId pointee) -> TypeId {
  return Intern(
      TypeKind::kRef, {pointee.value}, IndirectionInfo{.pointee = pointee});
}

auto TypeArena::Ptr(TypeId pointee) -> TypeId {
  return Intern(
      TypeKind::kPtr, {pointee.value}, IndirectionInfo{.pointee = pointee});
}

auto TypeArena::Var(TypeId pointee) -> TypeId {
  return Intern(
      TypeKind::kVar, {pointee.value}, IndirectionInfo{.pointee = pointee});
}

auto TypeArena::Lent(TypeId pointee) -> TypeId {
  return Intern(
      TypeKind::kLent, {pointee.value}, IndirectionInfo{.pointee = pointee});
}

auto TypeArena::Instantiate(TypeId generic, std::vector<TypeId> args)
    -> TypeId {
  const Type& def = (*this)[generic];
  if (def.Kind() != TypeKind::kObject || def.AsObject().type_params.empty()) {
    throw common::InternalError(
        "Instantiate",
        fmt::format("'{}' is not a generic object definition", ToString(generic)));
  }
  if (def.AsObject().type_params.size() != args.size()) {
    throw common::InternalError(
        "Instantiate",
        fmt::format(
            "'{}' expects {} type arguments, got {}", def.AsObject().name,
            def.AsObject().type_params.size(), args.size()));
  }

  // Instance key: marker kind kObject with (definition, args...).
  std::vector<uint32_t> operands;
  operands.reserve(args.size() + 1);
  operands.push_back(generic.value);
  for (TypeId arg : args) {
    operands.push_back(arg.value);
  }
  TypeKey key{.kind = TypeKind::kObject, .operands = std::move(operands)};
  auto it = map_.find(key);
  if (it != map_.end()) {
    return it->second;
  }

  ObjectInfo info{
      .name = def.AsObject().name,
      .span = def.AsObject().span,
      .generic_origin = generic,
      .type_args = std::move(args),
  };
  TypeId id = Push(TypeKind::kObject, std::move(info));
  map_.emplace(std::move(key), id);
  instances_[generic].push_back(id);
  instance_order_.push_back(id);

  if ((*this)[generic].AsObject().complete) {
    PopulateInstance(id);
  }
  return id;
}

void TypeArena::PopulateInstance(TypeId instance) {
  // Copy everything needed up front: Substitute may grow types_.
  ObjectInfo inst_info = (*this)[instance].AsObject();
  if (inst_info.complete) {
    return;
  }
  ObjectInfo def_info = (*this)[inst_info.generic_origin].AsObject();

  std::vector<FieldInfo> fields;
  fields.reserve(def_info.fields.size());
  for (const auto& field : def_info.fields) {
    fields.push_back(
        FieldInfo{
            .name = field.name,
            .type = Substitute(
                field.type, def_info.type_params, inst_info.type_args),
            .span = field.span,
        });
  }
  TypeId base = kInvalidTypeId;
  if (def_info.base) {
    base = Substitute(def_info.base, def_info.type_params, inst_info.type_args);
  }

  auto& info = std::get<ObjectInfo>(types_[instance.value].payload_);
  info.fields = std::move(fields);
  info.base = base;
  info.complete = true;
}

auto TypeArena::Substitute(
    TypeId type, const std::vector<TypeId>& params,
    const std::vector<TypeId>& args) -> TypeId {
  const Type& t = (*this)[type];
  switch (t.Kind()) {
    case TypeKind::kGenericParam: {
      for (size_t i = 0; i < params.size(); ++i) {
        if (params[i] == type) {
          return args[i];
        }
      }
      return type;
    }
    case TypeKind::kArray: {
      ArrayInfo info = t.AsArray();
      return Array(Substitute(info.element, params, args), info.length);
    }
    case TypeKind::kSequence: {
      TypeId element = t.AsSequence().element;
      return Sequence(Substitute(element, params, args));
    }
    case TypeKind::kTuple: {
      std::vector<TypeId> elements = t.AsTuple().elements;
      for (auto& element : elements) {
        element = Substitute(element, params, args);
      }
      return Tuple(std::move(elements));
    }
    case TypeKind::kRef:
      return Ref(Substitute(t.AsIndirection().pointee, params, args));
    case TypeKind::kPtr:
      return Ptr(Substitute(t.AsIndirection().pointee, params, args));
    case TypeKind::kVar:
      return Var(Substitute(t.AsIndirection().pointee, params, args));
    case TypeKind::kLent:
      return Lent(Substitute(t.AsIndirection().pointee, params, args));
    case TypeKind::kObject: {
      const ObjectInfo& info = t.AsObject();
      if (!info.generic_origin) {
        return type;
      }
      TypeId origin = info.generic_origin;
      std::vector<TypeId> new_args = info.type_args;
      for (auto& arg : new_args) {
        arg = Substitute(arg, params, args);
      }
      return Instantiate(origin, std::move(new_args));
    }
    default:
      return type;
  }
}

auto TypeArena::GenericOrigin(TypeId id) const -> TypeId {
  const Type& t = (*this)[id];
  if (t.Kind() == TypeKind::kObject && t.AsObject().generic_origin) {
    return t.AsObject().generic_origin;
  }
  return id;
}

auto TypeArena::IsGenericDefinition(TypeId id) const -> bool {
  const Type& t = (*this)[id];
  return t.Kind() == TypeKind::kObject && !t.AsObject().type_params.empty();
}

auto TypeArena::IsDependent(TypeId id) const -> bool {
  const Type& t = (*this)[id];
  switch (t.Kind()) {
    case TypeKind::kGenericParam:
      return true;
    case TypeKind::kArray:
      return IsDependent(t.AsArray().element);
    case TypeKind::kSequence:
      return IsDependent(t.AsSequence().element);
    case TypeKind::kTuple:
      for (TypeId element : t.AsTuple().elements) {
        if (IsDependent(element)) {
          return true;
        }
      }
      return false;
    case TypeKind::kRef:
    case TypeKind::kPtr:
    case TypeKind::kVar:
    case TypeKind::kLent:
      return IsDependent(t.AsIndirection().pointee);
    case TypeKind::kObject:
      for (TypeId arg : t.AsObject().type_args) {
        if (IsDependent(arg)) {
          return true;
        }
      }
      return false;
    default:
      return false;
  }
}

auto TypeArena::ToString(TypeId id) const -> std::string {
  if (!id) {
    return "<invalid>";
  }
  const Type& t = (*this)[id];
  switch (t.Kind()) {
    case TypeKind::kVoid:
    case TypeKind::kBool:
    case TypeKind::kInt:
    case TypeKind::kFloat:
    case TypeKind::kString:
      return std::string(lifter::ToString(t.Kind()));
    case TypeKind::kObject: {
      const ObjectInfo& info = t.AsObject();
      if (info.type_args.empty()) {
        return info.name;
      }
      std::vector<std::string> args;
      args.reserve(info.type_args.size());
      for (TypeId arg : info.type_args) {
        args.push_back(ToString(arg));
      }
      return fmt::format("{}[{}]", info.name, fmt::join(args, ", "));
    }
    case TypeKind::kDistinct:
      return t.AsDistinct().name;
    case TypeKind::kGenericParam:
      return t.AsGenericParam().name;
    case TypeKind::kArray:
      return fmt::format(
          "array[{}, {}]", t.AsArray().length, ToString(t.AsArray().element));
    case TypeKind::kSequence:
      return fmt::format("seq[{}]", ToString(t.AsSequence().element));
    case TypeKind::kTuple: {
      std::vector<std::string> elements;
      for (TypeId element : t.AsTuple().elements) {
        elements.push_back(ToString(element));
      }
      return fmt::format("({})", fmt::join(elements, ", "));
    }
    case TypeKind::kRef:
    case TypeKind::kPtr:
    case TypeKind::kVar:
    case TypeKind::kLent:
      return fmt::format(
          "{} {}", lifter::ToString(t.Kind()),
          ToString(t.AsIndirection().pointee));
  }
  return "<unknown>";
}

auto TypeArena::DeclarationSpan(TypeId id) const -> SourceSpan {
  const Type& t = (*this)[id];
  if (t.Kind() == TypeKind::kObject) {
    return t.AsObject().span;
  }
  if (t.Kind() == TypeKind::kDistinct) {
    return t.AsDistinct().span;
  }
  return {};
}

}  // namespace lifter
