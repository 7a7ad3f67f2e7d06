#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/hash/hash.h"
#include "lifter/common/type.hpp"

namespace lifter {

struct TypeKey {
  TypeKind kind;
  std::vector<uint32_t> operands;

  auto operator==(const TypeKey&) const -> bool = default;
};

struct TypeKeyHash {
  auto operator()(const TypeKey& key) const -> size_t {
    return absl::HashOf(key.kind, key.operands);
  }
};

// Owns every type of a compilation unit.
//
// Nominal types (objects, distinct types, generic parameters) get a fresh
// TypeId per declaration: two declarations with the same name are different
// types. Builtins, compound types, indirections and generic instances are
// interned, so structurally equal spellings share one TypeId.
class TypeArena final {
 public:
  TypeArena();
  ~TypeArena() = default;

  TypeArena(const TypeArena&) = delete;
  auto operator=(const TypeArena&) -> TypeArena& = delete;

  TypeArena(TypeArena&&) = default;
  auto operator=(TypeArena&&) -> TypeArena& = default;

  [[nodiscard]] auto operator[](TypeId id) const -> const Type&;
  [[nodiscard]] auto Size() const -> size_t {
    return types_.size();
  }

  [[nodiscard]] auto Void() const -> TypeId {
    return void_;
  }
  [[nodiscard]] auto Bool() const -> TypeId {
    return bool_;
  }
  [[nodiscard]] auto Int() const -> TypeId {
    return int_;
  }
  [[nodiscard]] auto Float() const -> TypeId {
    return float_;
  }
  [[nodiscard]] auto String() const -> TypeId {
    return string_;
  }

  // Nominal declarations. Bodies are attached separately so that
  // declarations may reference each other in any order.
  auto DeclareObject(std::string name, SourceSpan span) -> TypeId;
  auto DeclareGenericObject(
      std::string name, const std::vector<std::string>& params,
      SourceSpan span) -> TypeId;
  auto DeclareDistinct(std::string name, SourceSpan span) -> TypeId;
  auto MakeGenericParam(std::string name, uint32_t index) -> TypeId;

  // Attach fields and optional base to a declared object. For a generic
  // definition this also completes every instance created so far.
  void SetObjectBody(TypeId object, std::vector<FieldInfo> fields, TypeId base);
  void SetDistinctBase(TypeId distinct, TypeId base);

  auto Array(TypeId element, uint32_t length) -> TypeId;
  auto Sequence(TypeId element) -> TypeId;
  auto Tuple(std::vector<TypeId> elements) -> TypeId;
  auto Ref(TypeId pointee) -> TypeId;
  auto Ptr(TypeId pointee) -> TypeId;
  auto Var(TypeId pointee) -> TypeId;
  auto Lent(TypeId pointee) -> TypeId;

  // Instantiate a generic object definition. Interned by (definition, args).
  auto Instantiate(TypeId generic, std::vector<TypeId> args) -> TypeId;

  // Nominal types in declaration order (excluding generic parameters).
  [[nodiscard]] auto NominalTypes() const -> const std::vector<TypeId>& {
    return nominals_;
  }

  // Generic instances in creation order.
  [[nodiscard]] auto GenericInstances() const -> const std::vector<TypeId>& {
    return instance_order_;
  }

  // Generic definition of an instance, or the type itself.
  [[nodiscard]] auto GenericOrigin(TypeId id) const -> TypeId;

  [[nodiscard]] auto IsGenericDefinition(TypeId id) const -> bool;

  // True if the type mentions a generic parameter anywhere.
  [[nodiscard]] auto IsDependent(TypeId id) const -> bool;

  // Display name of a nominal type, rendering of any other type.
  [[nodiscard]] auto ToString(TypeId id) const -> std::string;

  // Span of the declaration of a nominal type (or its generic origin).
  [[nodiscard]] auto DeclarationSpan(TypeId id) const -> SourceSpan;

 private:
  auto Push(TypeKind kind, TypePayload payload) -> TypeId;
  auto Intern(TypeKind kind, std::vector<uint32_t> operands, TypePayload payload)
      -> TypeId;
  auto Substitute(TypeId type, const std::vector<TypeId>& params,
                  const std::vector<TypeId>& args) -> TypeId;
  void PopulateInstance(TypeId instance);

  std::vector<Type> types_;
  absl::flat_hash_map<TypeKey, TypeId, TypeKeyHash> map_;
  std::vector<TypeId> nominals_;
  std::vector<TypeId> instance_order_;
  absl::flat_hash_map<TypeId, std::vector<TypeId>> instances_;

  TypeId void_;
  TypeId bool_;
  TypeId int_;
  TypeId float_;
  TypeId string_;
};

}  // namespace lifter
