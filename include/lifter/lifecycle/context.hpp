#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "lifter/common/diagnostic/diagnostic.hpp"
#include "lifter/ir/arena.hpp"
#include "lifter/ir/fwd.hpp"
#include "lifter/ir/procedure.hpp"

namespace lifter::lifecycle {

// Syntactic position of an expression, as far as destructible values care.
enum class SiteKind : uint8_t {
  kVarInit,
  kLetInit,
  kReturnValue,
  kResultAssignment,
  kOther,
};

inline constexpr size_t kSiteKindCount = 5;

// "var-init", "let-init", "return-value", "result-assignment", "other".
auto ToString(SiteKind site) -> std::string_view;
auto ParseSiteKind(std::string_view name) -> std::optional<SiteKind>;

// Whitelist of sites where a value with a non-default destroy may be created.
class ContextPolicy {
 public:
  ContextPolicy() = default;

  // var-init, let-init, return-value and result-assignment.
  static auto Default() -> ContextPolicy;

  // Host error naming the first unknown site.
  static auto FromNames(const std::vector<std::string>& names)
      -> Result<ContextPolicy>;

  void Allow(SiteKind site) {
    allowed_[static_cast<size_t>(site)] = true;
  }

  [[nodiscard]] auto Allows(SiteKind site) const -> bool {
    return allowed_[static_cast<size_t>(site)];
  }

  [[nodiscard]] auto AllowedSites() const -> std::vector<SiteKind>;

 private:
  std::array<bool, kSiteKindCount> allowed_{};
};

struct TaggedSite {
  ir::ExpressionId expression;
  SiteKind site;
  ir::StatementId statement;  // statement the expression belongs to
};

// Tags every expression of the procedure body, in statement order and
// pre-order within a statement.
auto TagSites(const ir::Procedure& proc, const ir::Arena& arena)
    -> std::vector<TaggedSite>;

}  // namespace lifter::lifecycle
