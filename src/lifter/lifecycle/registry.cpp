#include "lifter/lifecycle/registry.hpp"

#include <string_view>
#include <utility>

#include <fmt/core.h>

#include "lifter/common/internal_error.hpp"

namespace lifter::lifecycle {

auto ToString(Indirection indirection) -> std::string_view {
  switch (indirection) {
    case Indirection::kNone:
      return "none";
    case Indirection::kRef:
      return "ref";
    case Indirection::kPtr:
      return "ptr";
  }
  return "unknown";
}

auto OperationRegistry::Lookup(TypeId target, OpKind kind) const
    -> const BoundOperation* {
  auto it = slots_.find(std::make_pair(target, kind));
  if (it == slots_.end()) {
    return nullptr;
  }
  return &entries_[it->second];
}

auto OperationRegistry::Insert(BoundOperation op) -> const BoundOperation& {
  if (frozen_) {
    throw common::InternalError(
        "OperationRegistry::Insert", "registry is frozen");
  }
  auto key = std::make_pair(op.target, op.kind);
  if (slots_.contains(key)) {
    throw common::InternalError(
        "OperationRegistry::Insert",
        fmt::format(
            "slot {} of type {} already bound", ToString(op.kind),
            op.target.value));
  }
  slots_.emplace(key, entries_.size());
  entries_.push_back(std::move(op));
  return entries_.back();
}

}  // namespace lifter::lifecycle
