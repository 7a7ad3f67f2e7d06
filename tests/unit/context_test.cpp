#include "lifter/lifecycle/context.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "lifter/common/diagnostic/diagnostic.hpp"
#include "lifter/common/diagnostic/diagnostic_sink.hpp"
#include "lifter/lifecycle/binder.hpp"
#include "lifter/lifecycle/registry.hpp"
#include "lifter/lifecycle/resolver.hpp"
#include "lifter/lifecycle/validator.hpp"
#include "tests/common/load_util.hpp"

namespace lifter::lifecycle {
namespace {

constexpr std::string_view kTypes = R"(
types:
  - object: Handle
  - object: Plain
    fields: [{name: x, type: int}]
  - object: Holder
    fields: [{name: h, type: Handle}]
operators:
  - name: "=destroy"
    params: [{name: h, type: Handle}]
)";

class ContextTest : public ::testing::Test {
 protected:
  void Load(std::string_view procs) {
    unit_ = test::LoadOrThrow(std::string(kTypes) + std::string(procs));
    OperationBinder binder(unit_.types, registry_);
    binder.BindAll(unit_.operators, sink_);
    registry_.Freeze();
    resolver_ = std::make_unique<LiftingResolver>(unit_.types, registry_, &sink_);
  }

  auto Validate(const ContextPolicy& policy = ContextPolicy::Default())
      -> size_t {
    const ir::Procedure& proc = unit_.arena[unit_.procedures.front()];
    ContextValidator validator(*resolver_, policy);
    return validator.Validate(
        proc, unit_.arena, TagSites(proc, unit_.arena), sink_);
  }

  // "site kind" per tagged expression, in tagging order.
  auto SiteLines() -> std::vector<std::string> {
    const ir::Procedure& proc = unit_.arena[unit_.procedures.front()];
    std::vector<std::string> out;
    for (const TaggedSite& site : TagSites(proc, unit_.arena)) {
      out.push_back(
          std::string(ToString(site.site)) + " " +
          unit_.types.ToString(unit_.arena[site.expression].type));
    }
    return out;
  }

  ir::CompilationUnit unit_;
  OperationRegistry registry_;
  DiagnosticSink sink_;
  std::unique_ptr<LiftingResolver> resolver_;
};

// ============================================================================
// Site tagging
// ============================================================================

TEST_F(ContextTest, TagsEachSyntacticPosition) {
  Load(R"(
procs:
  - name: make
    result: Handle
    body:
      - var: a
        init: {construct: Handle}
      - let: b
        init: {call: open, type: Handle}
      - assign: {target: {name: result}, value: {construct: Handle}}
      - expr: {call: use, args: [{name: a}]}
      - return: {construct: Handle}
)");
  EXPECT_EQ(
      SiteLines(), (std::vector<std::string>{
                       "var-init Handle",
                       "let-init Handle",
                       "other Handle",
                       "result-assignment Handle",
                       "other void",
                       "other Handle",
                       "return-value Handle",
                   }));
}

TEST_F(ContextTest, OperandsAreAlwaysOther) {
  Load(R"(
procs:
  - name: p
    body:
      - var: pair
        init: {tuple: [{literal: 1}, {literal: x}]}
      - while:
          cond: {literal: true}
          body:
            - if:
                cond: {literal: false}
                then: [{var: n, init: {literal: 2}}]
)");
  EXPECT_EQ(
      SiteLines(), (std::vector<std::string>{
                       "var-init (int, string)",
                       "other int",
                       "other string",
                       "other bool",
                       "other bool",
                       "var-init int",
                   }));
}

TEST_F(ContextTest, AssignmentToOtherVariableIsNotResultAssignment) {
  Load(R"(
procs:
  - name: p
    body:
      - var: h
        init: {construct: Handle}
      - assign: {target: {name: h}, value: {construct: Handle}}
)");
  auto lines = SiteLines();
  ASSERT_EQ(lines.size(), 3U);
  EXPECT_EQ(lines[2], "other Handle");
}

// ============================================================================
// Policy
// ============================================================================

TEST_F(ContextTest, DefaultPolicy) {
  ContextPolicy policy = ContextPolicy::Default();
  EXPECT_TRUE(policy.Allows(SiteKind::kVarInit));
  EXPECT_TRUE(policy.Allows(SiteKind::kLetInit));
  EXPECT_TRUE(policy.Allows(SiteKind::kReturnValue));
  EXPECT_TRUE(policy.Allows(SiteKind::kResultAssignment));
  EXPECT_FALSE(policy.Allows(SiteKind::kOther));
}

TEST_F(ContextTest, PolicyFromNames) {
  auto policy = ContextPolicy::FromNames({"let-init", "return-value"});
  ASSERT_TRUE(policy);
  EXPECT_EQ(
      policy->AllowedSites(),
      (std::vector<SiteKind>{SiteKind::kLetInit, SiteKind::kReturnValue}));

  auto bad = ContextPolicy::FromNames({"var-init", "field-init"});
  ASSERT_FALSE(bad);
  EXPECT_EQ(bad.error().primary.kind, DiagKind::kHostError);
  EXPECT_EQ(ParseSiteKind("result-assignment"), SiteKind::kResultAssignment);
  EXPECT_FALSE(ParseSiteKind("var").has_value());
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(ContextTest, DestructibleValueInVarInitIsAccepted) {
  Load(R"(
procs:
  - name: p
    result: Holder
    body:
      - var: h
        init: {construct: Handle}
      - let: k
        init: {call: open, type: Handle}
      - assign: {target: {name: result}, value: {construct: Holder}}
      - return: {construct: Holder}
)");
  EXPECT_EQ(Validate(), 0U);
  EXPECT_FALSE(sink_.HasErrors());
}

TEST_F(ContextTest, BareExpressionStatementIsRejected) {
  Load(R"(
procs:
  - name: p
    body:
      - expr: {call: open, type: Handle}
)");
  EXPECT_EQ(Validate(), 1U);
  ASSERT_EQ(sink_.GetDiagnostics().size(), 1U);
  const Diagnostic& diag = sink_.GetDiagnostics().front();
  EXPECT_EQ(diag.primary.code, DiagCode::kIllegalDestructibleUsage);
  EXPECT_EQ(
      diag.primary.message,
      "value of type 'Handle' has a destructor and cannot be used as an "
      "operand in 'p'");
  ASSERT_EQ(diag.notes.size(), 1U);
  EXPECT_EQ(
      diag.notes[0].message,
      "allowed contexts: var-init, let-init, return-value, result-assignment");
}

TEST_F(ContextTest, LiftedDestroyCountsAsDestructible) {
  Load(R"(
procs:
  - name: p
    body:
      - var: xs
        init: {array: [], type: "array[2, Holder]"}
      - expr: {call: consume, args: [{construct: Holder}]}
      - expr: {call: consume, args: [{move: {name: xs}}]}
)");
  EXPECT_EQ(Validate(), 2U);
  EXPECT_EQ(sink_.CountCode(DiagCode::kIllegalDestructibleUsage), 2U);
}

TEST_F(ContextTest, PlacesAndDefaultTypesAreNotChecked) {
  Load(R"(
procs:
  - name: p
    params: [{name: r, type: ref Holder}]
    body:
      - var: h
        init: {construct: Holder}
      - expr: {name: h}
      - expr: {field: h, of: {name: h}}
      - expr: {deref: {name: r}}
      - expr: {call: build, type: Plain}
      - expr: {call: peek, args: [{name: h}, {construct: Plain}], type: int}
      - expr: {literal: "0", type: Handle}
)");
  EXPECT_EQ(Validate(), 0U);
}

TEST_F(ContextTest, NestedConstructionIsAnOperand) {
  Load(R"(
procs:
  - name: p
    body:
      - var: t
        init: {tuple: [{construct: Handle}, {literal: 1}]}
)");
  EXPECT_EQ(Validate(), 1U);
}

TEST_F(ContextTest, PolicyNarrowsAllowedSites) {
  Load(R"(
procs:
  - name: p
    body:
      - var: a
        init: {construct: Handle}
      - let: b
        init: {construct: Handle}
)");
  auto policy = ContextPolicy::FromNames({"var-init"});
  ASSERT_TRUE(policy);
  EXPECT_EQ(Validate(*policy), 1U);
  EXPECT_EQ(
      sink_.GetDiagnostics().front().primary.message,
      "value of type 'Handle' has a destructor and cannot be used as a "
      "let-init in 'p'");
}

TEST_F(ContextTest, PolicyAllowingOtherAcceptsEverything) {
  Load(R"(
procs:
  - name: p
    body:
      - expr: {call: open, type: Handle}
)");
  ContextPolicy policy = ContextPolicy::Default();
  policy.Allow(SiteKind::kOther);
  EXPECT_EQ(Validate(policy), 0U);
}

}  // namespace
}  // namespace lifter::lifecycle
