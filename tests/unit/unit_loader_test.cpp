#include "lifter/frontend/unit_loader.hpp"

#include <gtest/gtest.h>

#include <string>
#include <variant>

#include "lifter/common/type.hpp"
#include "lifter/ir/expression.hpp"
#include "lifter/ir/statement.hpp"
#include "tests/common/load_util.hpp"

namespace lifter::frontend {
namespace {

using test::FindProcedure;
using test::FindType;
using test::LoadOrThrow;

class UnitLoaderTest : public ::testing::Test {
 protected:
  static auto ErrorOf(const std::string& yaml) -> std::string {
    auto unit = LoadUnit(yaml, FileId{1}, "test");
    if (unit) {
      return "";
    }
    return unit.error().primary.message;
  }

  static auto Body(const ir::CompilationUnit& unit, const ir::Procedure& proc)
      -> const ir::BlockStatementData& {
    return std::get<ir::BlockStatementData>(unit.arena[proc.body].data);
  }
};

// ============================================================================
// Types
// ============================================================================

TEST_F(UnitLoaderTest, TypesMayReferenceLaterDeclarations) {
  auto unit = LoadOrThrow(R"yaml(
types:
  - object: Outer
    fields:
      - {name: inner, type: Inner}
      - {name: items, type: "seq[Inner]"}
  - object: Inner
    fields:
      - {name: fd, type: int}
)yaml");
  TypeId outer = FindType(unit, "Outer");
  TypeId inner = FindType(unit, "Inner");
  const ObjectInfo& info = unit.types[outer].AsObject();
  ASSERT_EQ(info.fields.size(), 2U);
  EXPECT_EQ(info.fields[0].name, "inner");
  EXPECT_EQ(info.fields[0].type, inner);
  EXPECT_EQ(info.fields[1].type, unit.types.Sequence(inner));
  EXPECT_TRUE(info.complete);
}

TEST_F(UnitLoaderTest, BaseAndDistinctTypes) {
  auto unit = LoadOrThrow(R"yaml(
types:
  - object: Base
  - object: Derived
    base: Base
  - distinct: Fd
    base: int
)yaml");
  EXPECT_EQ(
      unit.types[FindType(unit, "Derived")].AsObject().base,
      FindType(unit, "Base"));
  EXPECT_EQ(unit.types[FindType(unit, "Fd")].AsDistinct().base, unit.types.Int());
}

TEST_F(UnitLoaderTest, GenericDefinitionUsesItsParameters) {
  auto unit = LoadOrThrow(R"yaml(
types:
  - object: Box
    params: [T]
    fields:
      - {name: value, type: T}
  - object: Holder
    fields:
      - {name: box, type: "Box[int]"}
)yaml");
  TypeId holder = FindType(unit, "Holder");
  TypeId box_int = unit.types[holder].AsObject().fields[0].type;
  EXPECT_EQ(unit.types.GenericOrigin(box_int), FindType(unit, "Box"));
  EXPECT_EQ(unit.types[box_int].AsObject().fields[0].type, unit.types.Int());
}

TEST_F(UnitLoaderTest, TypeErrors) {
  EXPECT_EQ(
      ErrorOf("types: [{object: A}, {object: A}]"),
      "type 'A' is already declared");
  EXPECT_EQ(
      ErrorOf("types: [{object: seq}]"), "type 'seq' is already declared");
  EXPECT_EQ(
      ErrorOf("types: [{distinct: D}]"), "distinct type 'D' needs a base");
  EXPECT_EQ(
      ErrorOf("types: [{object: A, colour: red}]"),
      "unknown field 'colour' in object declaration");
  EXPECT_EQ(
      ErrorOf("types: [{object: A, fields: [{name: x, type: Nope}]}]"),
      "in type 'Nope': unknown type 'Nope'");
}

// ============================================================================
// Operators
// ============================================================================

TEST_F(UnitLoaderTest, OperatorDeclarations) {
  auto unit = LoadOrThrow(R"yaml(
types:
  - object: Handle
  - object: Box
    params: [T]
operators:
  - name: "=destroy"
    params: [{name: h, type: Handle}]
    impl: closeHandle
  - name: "=deepCopy"
    generic: [U]
    params: [{name: b, type: "ref Box[U]"}]
    result: "ref Box[U]"
)yaml");
  ASSERT_EQ(unit.operators.size(), 2U);
  const auto& destroy = unit.operators[0];
  EXPECT_EQ(destroy.name, "=destroy");
  EXPECT_EQ(destroy.impl, "closeHandle");
  EXPECT_FALSE(destroy.result);
  ASSERT_EQ(destroy.params.size(), 1U);
  EXPECT_EQ(destroy.params[0].type, FindType(unit, "Handle"));

  const auto& deep_copy = unit.operators[1];
  EXPECT_EQ(deep_copy.impl, "=deepCopy");
  ASSERT_EQ(deep_copy.generic_params.size(), 1U);
  EXPECT_EQ(deep_copy.result, deep_copy.params[0].type);
  EXPECT_TRUE(unit.types.IsDependent(deep_copy.result));
}

// ============================================================================
// Procedures
// ============================================================================

TEST_F(UnitLoaderTest, ParametersResultAndLocals) {
  auto unit = LoadOrThrow(R"yaml(
types:
  - object: Handle
procs:
  - name: open
    params: [{name: path, type: string}]
    result: Handle
    body:
      - var: h
        init: {construct: Handle}
      - return: {name: h}
)yaml");
  const ir::Procedure& proc = FindProcedure(unit, "open");
  ASSERT_EQ(proc.params.size(), 1U);
  EXPECT_EQ(proc.Local(proc.params[0]).kind, ir::LocalKind::kParameter);
  EXPECT_EQ(proc.result_type, FindType(unit, "Handle"));
  ASSERT_TRUE(proc.result_local);
  EXPECT_EQ(proc.Local(proc.result_local).name, "result");

  const auto& body = Body(unit, proc);
  ASSERT_EQ(body.statements.size(), 2U);
  const auto& decl = std::get<ir::VariableDeclarationStatementData>(
      unit.arena[body.statements[0]].data);
  EXPECT_EQ(proc.Local(decl.local).name, "h");
  EXPECT_EQ(proc.Local(decl.local).type, FindType(unit, "Handle"));
  EXPECT_EQ(unit.arena[decl.init].kind, ir::ExpressionKind::kConstruct);
  EXPECT_EQ(
      unit.arena[body.statements[1]].kind, ir::StatementKind::kReturn);
}

TEST_F(UnitLoaderTest, VoidResultHasNoResultVariable) {
  auto unit = LoadOrThrow(R"yaml(
procs:
  - name: run
    result: void
    body: []
)yaml");
  const ir::Procedure& proc = FindProcedure(unit, "run");
  EXPECT_FALSE(proc.result_type);
  EXPECT_FALSE(proc.result_local);
  EXPECT_TRUE(Body(unit, proc).statements.empty());
}

TEST_F(UnitLoaderTest, ControlFlowStatements) {
  auto unit = LoadOrThrow(R"yaml(
procs:
  - name: loop
    body:
      - var: n
        init: {literal: 3}
      - while:
          cond: {literal: true}
          body:
            - if:
                cond: {literal: false}
                then: [{break: ~}]
                else: [{continue: ~}]
      - spawn: {call: worker, args: [{name: n}]}
)yaml");
  const ir::Procedure& proc = FindProcedure(unit, "loop");
  const auto& body = Body(unit, proc);
  ASSERT_EQ(body.statements.size(), 3U);
  EXPECT_EQ(
      unit.arena[body.statements[1]].kind, ir::StatementKind::kWhileLoop);
  EXPECT_EQ(unit.arena[body.statements[2]].kind, ir::StatementKind::kSpawn);

  const auto& decl = std::get<ir::VariableDeclarationStatementData>(
      unit.arena[body.statements[0]].data);
  EXPECT_EQ(proc.Local(decl.local).type, unit.types.Int());
}

TEST_F(UnitLoaderTest, ExpressionTypes) {
  auto unit = LoadOrThrow(R"yaml(
types:
  - object: Pair
    fields:
      - {name: left, type: int}
      - {name: right, type: "(string, float)"}
procs:
  - name: exprs
    body:
      - var: p
        init: {construct: Pair, fields: {left: {literal: 1}}}
      - var: r
        init: {field: right, of: {name: p}}
      - var: s
        init: {index: {name: r}, at: {literal: 0}}
      - var: xs
        init: {array: [{literal: 1}, {literal: 2}]}
      - var: x
        init: {index: {name: xs}, at: {name: s}}
)yaml");
  const ir::Procedure& proc = FindProcedure(unit, "exprs");
  auto type_of = [&](size_t local) { return proc.locals.at(local).type; };
  EXPECT_EQ(type_of(0), FindType(unit, "Pair"));
  EXPECT_EQ(
      type_of(1), unit.types.Tuple({unit.types.String(), unit.types.Float()}));
  EXPECT_EQ(type_of(2), unit.types.String());
  EXPECT_EQ(type_of(3), unit.types.Array(unit.types.Int(), 2));
  EXPECT_EQ(type_of(4), unit.types.Int());
}

TEST_F(UnitLoaderTest, ProcedureErrors) {
  EXPECT_EQ(
      ErrorOf("procs: [{name: p, body: [{var: x}]}]"),
      "declaration needs a type or an initializer");
  EXPECT_EQ(
      ErrorOf("procs: [{name: p, body: [{let: x, type: int}]}]"),
      "'let' needs an initializer");
  EXPECT_EQ(
      ErrorOf("procs: [{name: p, body: [{expr: {name: y}}]}]"),
      "unknown name 'y'");
  EXPECT_EQ(
      ErrorOf("procs: [{name: p, body: [{break: ~}]}]"),
      "'break' outside of a loop");
  EXPECT_EQ(
      ErrorOf(
          "procs: [{name: p, body: [{var: x, init: {literal: 1}}, "
          "{var: x, init: {literal: 2}}]}]"),
      "'x' is already declared in this scope");
  EXPECT_EQ(
      ErrorOf(
          "procs: [{name: p, body: [{var: x, type: string, init: "
          "{literal: 1}}]}]"),
      "initializer of type 'int' does not match declared type 'string'");
  EXPECT_EQ(
      ErrorOf(
          "procs: [{name: p, body: [{assign: {target: {literal: 1}, value: "
          "{literal: 2}}}]}]"),
      "assignment target must be a place expression");
  EXPECT_EQ(
      ErrorOf("procs: [{name: p, body: [{expr: {move: {call: f}}}]}]"),
      "only a place can be moved from");
  EXPECT_EQ(
      ErrorOf("procs: [{name: p, body: [{spawn: {literal: 1}}]}]"),
      "spawn needs a call");
  EXPECT_EQ(
      ErrorOf("procs: [{name: p, body: [{expr: {name: a, call: f}}]}]"),
      "expression has both 'name' and 'call'");
}

TEST_F(UnitLoaderTest, ShadowingInNestedBlockIsAllowed) {
  auto unit = LoadOrThrow(R"yaml(
procs:
  - name: p
    body:
      - var: x
        init: {literal: 1}
      - block:
          - var: x
            init: {literal: "two"}
)yaml");
  const ir::Procedure& proc = FindProcedure(unit, "p");
  ASSERT_EQ(proc.locals.size(), 2U);
  EXPECT_EQ(proc.locals[1].type, unit.types.String());
}

TEST_F(UnitLoaderTest, MalformedYamlIsHostError) {
  auto unit = LoadUnit("procs: [", FileId{1}, "test");
  ASSERT_FALSE(unit);
  EXPECT_EQ(unit.error().primary.kind, DiagKind::kHostError);
}

TEST_F(UnitLoaderTest, UnitNameFromDocument) {
  auto unit = LoadOrThrow("unit: sockets\n");
  EXPECT_EQ(unit.name, "sockets");
}

TEST_F(UnitLoaderTest, SpansPointAtTheNode) {
  auto unit = LoadOrThrow("types:\n  - object: Handle\n");
  SourceSpan span = unit.types.DeclarationSpan(FindType(unit, "Handle"));
  EXPECT_EQ(span.file_id, FileId{1});
  EXPECT_EQ(span.begin, 19U);
  EXPECT_EQ(span.end, 25U);
}

}  // namespace
}  // namespace lifter::frontend
