#include "lifter/lifecycle/operation_kind.hpp"

#include <cctype>
#include <optional>
#include <string_view>

namespace lifter::lifecycle {

auto ToString(OpKind kind) -> std::string_view {
  switch (kind) {
    case OpKind::kAssign:
      return "assign";
    case OpKind::kDestroy:
      return "destroy";
    case OpKind::kDeepCopy:
      return "deepCopy";
  }
  return "unknown";
}

auto OperatorName(OpKind kind) -> std::string_view {
  switch (kind) {
    case OpKind::kAssign:
      return "=";
    case OpKind::kDestroy:
      return "=destroy";
    case OpKind::kDeepCopy:
      return "=deepCopy";
  }
  return "";
}

auto OpKindFromOperatorName(std::string_view name) -> std::optional<OpKind> {
  for (OpKind kind : kAllOpKinds) {
    if (OperatorName(kind) == name) {
      return kind;
    }
  }
  return std::nullopt;
}

auto IsReservedLifecycleName(std::string_view name) -> bool {
  if (name == "=") {
    return true;
  }
  return name.size() > 1 && name[0] == '=' &&
         std::isalpha(static_cast<unsigned char>(name[1])) != 0;
}

}  // namespace lifter::lifecycle
