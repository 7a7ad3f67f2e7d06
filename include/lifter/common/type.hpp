#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "lifter/common/source_span.hpp"

namespace lifter {

struct TypeId {
  uint32_t value = 0;

  auto operator==(const TypeId&) const -> bool = default;
  auto operator<=>(const TypeId&) const = default;
  explicit operator bool() const {
    return value != UINT32_MAX;
  }

  template <typename H>
  friend auto AbslHashValue(H h, TypeId id) -> H {
    return H::combine(std::move(h), id.value);
  }
};

constexpr TypeId kInvalidTypeId{UINT32_MAX};

enum class TypeKind : uint8_t {
  // Builtin scalars
  kVoid,
  kBool,
  kInt,
  kFloat,
  kString,
  // Nominal (identity = declaration site)
  kObject,
  kDistinct,
  kGenericParam,
  // Compound (interned structurally)
  kArray,
  kSequence,
  kTuple,
  // Indirections
  kRef,   // traced heap reference
  kPtr,   // untraced pointer
  kVar,   // mutable reference (parameter passing)
  kLent,  // const reference (parameter passing)
};

auto ToString(TypeKind kind) -> std::string_view;

struct FieldInfo {
  std::string name;
  TypeId type;
  SourceSpan span;
};

// Object type. Non-generic objects and generic instances carry their fields;
// a generic definition carries its type parameters and the fields in terms of
// those parameters.
struct ObjectInfo {
  std::string name;
  std::vector<FieldInfo> fields;
  TypeId base = kInvalidTypeId;
  SourceSpan span;

  // Generic definition: type parameters (kGenericParam types).
  std::vector<TypeId> type_params;

  // Generic instance: the definition it was instantiated from.
  TypeId generic_origin = kInvalidTypeId;
  std::vector<TypeId> type_args;

  // False between declaration and SetObjectBody.
  bool complete = false;
};

struct DistinctInfo {
  std::string name;
  TypeId base = kInvalidTypeId;
  SourceSpan span;
};

struct GenericParamInfo {
  std::string name;
  uint32_t index = 0;
};

struct ArrayInfo {
  TypeId element;
  uint32_t length = 0;
};

struct SequenceInfo {
  TypeId element;
};

struct TupleInfo {
  std::vector<TypeId> elements;
};

// Shared by kRef, kPtr, kVar and kLent.
struct IndirectionInfo {
  TypeId pointee;
};

using TypePayload = std::variant<
    std::monostate, ObjectInfo, DistinctInfo, GenericParamInfo, ArrayInfo,
    SequenceInfo, TupleInfo, IndirectionInfo>;

class TypeArena;

class Type final {
 public:
  [[nodiscard]] auto Kind() const -> TypeKind {
    return kind_;
  }

  [[nodiscard]] auto AsObject() const -> const ObjectInfo&;
  [[nodiscard]] auto AsDistinct() const -> const DistinctInfo&;
  [[nodiscard]] auto AsGenericParam() const -> const GenericParamInfo&;
  [[nodiscard]] auto AsArray() const -> const ArrayInfo&;
  [[nodiscard]] auto AsSequence() const -> const SequenceInfo&;
  [[nodiscard]] auto AsTuple() const -> const TupleInfo&;
  [[nodiscard]] auto AsIndirection() const -> const IndirectionInfo&;

 private:
  friend class TypeArena;

  TypeKind kind_ = TypeKind::kVoid;
  TypePayload payload_;
};

inline auto IsNominal(TypeKind kind) -> bool {
  return kind == TypeKind::kObject || kind == TypeKind::kDistinct;
}

inline auto IsIndirection(TypeKind kind) -> bool {
  return kind == TypeKind::kRef || kind == TypeKind::kPtr ||
         kind == TypeKind::kVar || kind == TypeKind::kLent;
}

// Heap indirections: a cycle through one of these is not a by-value cycle.
inline auto IsHeapIndirection(TypeKind kind) -> bool {
  return kind == TypeKind::kRef || kind == TypeKind::kPtr;
}

}  // namespace lifter
