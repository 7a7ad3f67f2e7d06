#include "lifter/lifecycle/context.hpp"

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>

#include "lifter/ir/expression.hpp"
#include "lifter/ir/statement.hpp"

namespace lifter::lifecycle {

auto ToString(SiteKind site) -> std::string_view {
  switch (site) {
    case SiteKind::kVarInit:
      return "var-init";
    case SiteKind::kLetInit:
      return "let-init";
    case SiteKind::kReturnValue:
      return "return-value";
    case SiteKind::kResultAssignment:
      return "result-assignment";
    case SiteKind::kOther:
      return "other";
  }
  return "unknown";
}

auto ParseSiteKind(std::string_view name) -> std::optional<SiteKind> {
  for (size_t i = 0; i < kSiteKindCount; ++i) {
    auto site = static_cast<SiteKind>(i);
    if (ToString(site) == name) {
      return site;
    }
  }
  return std::nullopt;
}

auto ContextPolicy::Default() -> ContextPolicy {
  ContextPolicy policy;
  policy.Allow(SiteKind::kVarInit);
  policy.Allow(SiteKind::kLetInit);
  policy.Allow(SiteKind::kReturnValue);
  policy.Allow(SiteKind::kResultAssignment);
  return policy;
}

auto ContextPolicy::FromNames(const std::vector<std::string>& names)
    -> Result<ContextPolicy> {
  ContextPolicy policy;
  for (const auto& name : names) {
    auto site = ParseSiteKind(name);
    if (!site) {
      return std::unexpected(
          Diagnostic::HostError(
              fmt::format(
                  "unknown destructible context '{}'; expected one of "
                  "var-init, let-init, return-value, result-assignment, "
                  "other",
                  name)));
    }
    policy.Allow(*site);
  }
  return policy;
}

auto ContextPolicy::AllowedSites() const -> std::vector<SiteKind> {
  std::vector<SiteKind> sites;
  for (size_t i = 0; i < kSiteKindCount; ++i) {
    if (allowed_[i]) {
      sites.push_back(static_cast<SiteKind>(i));
    }
  }
  return sites;
}

namespace {

class SiteTagger {
 public:
  SiteTagger(const ir::Procedure& proc, const ir::Arena& arena)
      : proc_(proc), arena_(arena) {
  }

  void VisitStatement(ir::StatementId id) {
    const ir::Statement& stmt = arena_[id];
    std::visit(
        [&](const auto& data) {
          using T = std::decay_t<decltype(data)>;
          if constexpr (std::is_same_v<T, ir::BlockStatementData>) {
            for (ir::StatementId child : data.statements) {
              VisitStatement(child);
            }
          } else if constexpr (std::is_same_v<
                                   T, ir::VariableDeclarationStatementData>) {
            if (data.init) {
              Tag(data.init,
                  data.mutability == ir::Mutability::kLet
                      ? SiteKind::kLetInit
                      : SiteKind::kVarInit,
                  id);
            }
          } else if constexpr (std::is_same_v<T, ir::AssignmentStatementData>) {
            Tag(data.target, SiteKind::kOther, id);
            Tag(data.value,
                AssignsResult(data.target) ? SiteKind::kResultAssignment
                                           : SiteKind::kOther,
                id);
          } else if constexpr (std::is_same_v<T, ir::ExpressionStatementData>) {
            Tag(data.expression, SiteKind::kOther, id);
          } else if constexpr (std::is_same_v<
                                   T, ir::ConditionalStatementData>) {
            Tag(data.condition, SiteKind::kOther, id);
            VisitStatement(data.then_branch);
            if (data.else_branch) {
              VisitStatement(*data.else_branch);
            }
          } else if constexpr (std::is_same_v<T, ir::WhileLoopStatementData>) {
            Tag(data.condition, SiteKind::kOther, id);
            VisitStatement(data.body);
          } else if constexpr (std::is_same_v<T, ir::ReturnStatementData>) {
            if (data.value) {
              Tag(data.value, SiteKind::kReturnValue, id);
            }
          } else if constexpr (std::is_same_v<T, ir::SpawnStatementData>) {
            Tag(data.call, SiteKind::kOther, id);
          }
        },
        stmt.data);
  }

  auto TakeSites() -> std::vector<TaggedSite> {
    return std::move(sites_);
  }

 private:
  // The site tag applies to the expression itself; every operand is "other".
  void Tag(ir::ExpressionId expr, SiteKind site, ir::StatementId stmt) {
    sites_.push_back(
        TaggedSite{.expression = expr, .site = site, .statement = stmt});
    for (ir::ExpressionId child : ir::ChildExpressions(arena_[expr])) {
      Tag(child, SiteKind::kOther, stmt);
    }
  }

  [[nodiscard]] auto AssignsResult(ir::ExpressionId target) const -> bool {
    if (!proc_.result_local) {
      return false;
    }
    const ir::Expression& expr = arena_[target];
    const auto* name = std::get_if<ir::NameRefExpressionData>(&expr.data);
    return name != nullptr && name->local == proc_.result_local;
  }

  const ir::Procedure& proc_;
  const ir::Arena& arena_;
  std::vector<TaggedSite> sites_;
};

}  // namespace

auto TagSites(const ir::Procedure& proc, const ir::Arena& arena)
    -> std::vector<TaggedSite> {
  SiteTagger tagger(proc, arena);
  if (proc.body) {
    tagger.VisitStatement(proc.body);
  }
  return tagger.TakeSites();
}

}  // namespace lifter::lifecycle
