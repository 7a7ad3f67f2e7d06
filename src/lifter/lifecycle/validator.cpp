#include "lifter/lifecycle/validator.hpp"

#include <string>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>

#include "lifter/common/diagnostic/diagnostic.hpp"
#include "lifter/ir/expression.hpp"

namespace lifter::lifecycle {

namespace {

auto DescribeAllowedSites(const ContextPolicy& policy) -> std::string {
  std::vector<std::string> names;
  for (SiteKind site : policy.AllowedSites()) {
    names.emplace_back(ToString(site));
  }
  if (names.empty()) {
    return "no context allows such values";
  }
  return fmt::format("allowed contexts: {}", fmt::join(names, ", "));
}

}  // namespace

auto ContextValidator::Validate(
    const ir::Procedure& proc, const ir::Arena& arena,
    const std::vector<TaggedSite>& sites, DiagnosticSink& sink) -> size_t {
  size_t errors = 0;
  for (const auto& tagged : sites) {
    const ir::Expression& expr = arena[tagged.expression];
    if (ir::IsPlaceExpressionKind(expr.kind) ||
        expr.kind == ir::ExpressionKind::kLiteral || !expr.type) {
      continue;
    }
    if (policy_.Allows(tagged.site)) {
      continue;
    }
    if (resolver_.OutcomeOf(expr.type, OpKind::kDestroy) == Outcome::kDefault) {
      continue;
    }
    sink.Report(
        Diagnostic::Error(
            expr.span, DiagCode::kIllegalDestructibleUsage,
            fmt::format(
                "value of type '{}' has a destructor and cannot be used as "
                "{} in '{}'",
                resolver_.Types().ToString(expr.type),
                tagged.site == SiteKind::kOther
                    ? std::string("an operand")
                    : fmt::format("a {}", ToString(tagged.site)),
                proc.name))
            .WithNote(DescribeAllowedSites(policy_)));
    ++errors;
  }
  return errors;
}

}  // namespace lifter::lifecycle
