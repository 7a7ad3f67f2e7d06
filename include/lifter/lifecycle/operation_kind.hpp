#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace lifter::lifecycle {

enum class OpKind : uint8_t {
  kAssign,
  kDestroy,
  kDeepCopy,
};

inline constexpr std::array<OpKind, 3> kAllOpKinds = {
    OpKind::kAssign, OpKind::kDestroy, OpKind::kDeepCopy};

// Display name ("assign", "destroy", "deepCopy").
auto ToString(OpKind kind) -> std::string_view;

// Operator token bound to a kind ("=", "=destroy", "=deepCopy").
auto OperatorName(OpKind kind) -> std::string_view;

auto OpKindFromOperatorName(std::string_view name) -> std::optional<OpKind>;

// Names of the form "=<identifier>" are reserved for lifecycle hooks.
auto IsReservedLifecycleName(std::string_view name) -> bool;

}  // namespace lifter::lifecycle
