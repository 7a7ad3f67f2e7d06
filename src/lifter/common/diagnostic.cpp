#include "lifter/common/diagnostic/diagnostic.hpp"

#include <array>
#include <optional>
#include <string_view>
#include <utility>

namespace lifter {

namespace {

constexpr std::array<std::pair<DiagCode, std::string_view>, 7> kCodeNames = {{
    {DiagCode::kDuplicateBinding, "DuplicateBinding"},
    {DiagCode::kInvalidSignature, "InvalidSignature"},
    {DiagCode::kNonNominalReceiver, "NonNominalReceiver"},
    {DiagCode::kConflictingIndirectionBinding,
     "ConflictingIndirectionBinding"},
    {DiagCode::kUnresolvableRecursiveType, "UnresolvableRecursiveType"},
    {DiagCode::kIllegalDestructibleUsage, "IllegalDestructibleUsage"},
    {DiagCode::kMissingScopeExitEdge, "MissingScopeExitEdge"},
}};

}  // namespace

auto ToString(DiagCode code) -> std::string_view {
  for (const auto& [c, name] : kCodeNames) {
    if (c == code) {
      return name;
    }
  }
  return "Unknown";
}

auto ParseDiagCode(std::string_view name) -> std::optional<DiagCode> {
  for (const auto& [code, n] : kCodeNames) {
    if (n == name) {
      return code;
    }
  }
  return std::nullopt;
}

}  // namespace lifter
