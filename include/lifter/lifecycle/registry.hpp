#pragma once

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "lifter/common/source_span.hpp"
#include "lifter/common/type.hpp"
#include "lifter/lifecycle/operation_kind.hpp"

namespace lifter::lifecycle {

// Indirection through which a =deepCopy hook receives its operand.
enum class Indirection : uint8_t {
  kNone,
  kRef,
  kPtr,
};

auto ToString(Indirection indirection) -> std::string_view;

// A validated user override, keyed by (target nominal type, kind).
struct BoundOperation {
  OpKind kind;
  TypeId target;
  std::vector<TypeId> params;
  TypeId result = kInvalidTypeId;
  std::string impl;
  Indirection via = Indirection::kNone;
  SourceSpan span;
  uint32_t decl_index = 0;  // position in the unit's operator list
};

// Per-type operation slots. Filled by the binder, then frozen; every later
// consumer only reads.
class OperationRegistry final {
 public:
  OperationRegistry() = default;

  OperationRegistry(const OperationRegistry&) = delete;
  auto operator=(const OperationRegistry&) -> OperationRegistry& = delete;
  OperationRegistry(OperationRegistry&&) = delete;
  auto operator=(OperationRegistry&&) -> OperationRegistry& = delete;
  ~OperationRegistry() = default;

  // Binding recorded for exactly this type, or nullptr.
  [[nodiscard]] auto Lookup(TypeId target, OpKind kind) const
      -> const BoundOperation*;

  // Throws InternalError when frozen or when the slot is already taken.
  auto Insert(BoundOperation op) -> const BoundOperation&;

  void Freeze() {
    frozen_ = true;
  }
  [[nodiscard]] auto IsFrozen() const -> bool {
    return frozen_;
  }

  [[nodiscard]] auto Size() const -> size_t {
    return entries_.size();
  }

  // Entries in binding order.
  [[nodiscard]] auto Entries() const -> const std::deque<BoundOperation>& {
    return entries_;
  }

 private:
  std::deque<BoundOperation> entries_;
  absl::flat_hash_map<std::pair<TypeId, OpKind>, size_t> slots_;
  bool frozen_ = false;
};

}  // namespace lifter::lifecycle
