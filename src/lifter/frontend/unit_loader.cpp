#include "lifter/frontend/unit_loader.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include "absl/container/flat_hash_map.h"
#include "lifter/common/diagnostic/diagnostic.hpp"
#include "lifter/common/type.hpp"
#include "lifter/frontend/type_parser.hpp"
#include "lifter/ir/expression.hpp"
#include "lifter/ir/procedure.hpp"
#include "lifter/ir/statement.hpp"

namespace lifter::frontend {

namespace {

constexpr std::array<std::string_view, 11> kStatementKeys = {
    "var",   "let",    "assign", "expr",     "block", "if",
    "while", "return", "break",  "continue", "spawn"};

constexpr std::array<std::string_view, 10> kExpressionKeys = {
    "name", "call", "construct", "tuple", "array",
    "literal", "move", "field", "index", "deref"};

using LocalScope = absl::flat_hash_map<std::string, ir::LocalId>;

class UnitLoader {
 public:
  UnitLoader(FileId file, std::string unit_name) : file_(file) {
    unit_.name = std::move(unit_name);
  }

  auto Load(const YAML::Node& root) -> ir::CompilationUnit {
    if (!root.IsMap()) {
      Fail(root, "compilation unit must be a mapping");
    }
    ValidateKeys(root, {"unit", "types", "operators", "procs"}, "unit");
    if (root["unit"]) {
      unit_.name = Scalar(root["unit"], "unit name");
    }
    if (const auto& types = root["types"]) {
      RequireSequence(types, "types");
      for (const auto& entry : types) {
        DeclareType(entry);
      }
      for (const auto& entry : types) {
        DefineType(entry);
      }
    }
    if (const auto& ops = root["operators"]) {
      RequireSequence(ops, "operators");
      for (const auto& entry : ops) {
        LoadOperator(entry);
      }
    }
    if (const auto& procs = root["procs"]) {
      RequireSequence(procs, "procs");
      for (const auto& entry : procs) {
        LoadProcedure(entry);
      }
    }
    return std::move(unit_);
  }

 private:
  // Diagnostics

  [[nodiscard]] auto SpanOf(const YAML::Node& node) const -> SourceSpan {
    YAML::Mark mark = node.Mark();
    if (mark.pos < 0) {
      return SourceSpan{.file_id = file_};
    }
    auto begin = static_cast<uint32_t>(mark.pos);
    uint32_t end = begin;
    if (node.IsScalar()) {
      end += static_cast<uint32_t>(node.Scalar().size());
    }
    return SourceSpan{.file_id = file_, .begin = begin, .end = end};
  }

  [[noreturn]] void Fail(const YAML::Node& node, std::string message) const {
    throw DiagnosticException(
        Diagnostic::HostError(SpanOf(node), std::move(message)));
  }

  void ValidateKeys(
      const YAML::Node& node, std::initializer_list<std::string_view> allowed,
      std::string_view context) const {
    if (!node.IsMap()) {
      return;
    }
    for (const auto& pair : node) {
      auto key = pair.first.as<std::string>();
      if (std::ranges::find(allowed, key) == allowed.end()) {
        Fail(pair.first, fmt::format("unknown field '{}' in {}", key, context));
      }
    }
  }

  auto Scalar(const YAML::Node& node, std::string_view what) const
      -> std::string {
    if (!node || !node.IsScalar()) {
      Fail(node, fmt::format("expected {} to be a scalar", what));
    }
    return node.Scalar();
  }

  void RequireSequence(const YAML::Node& node, std::string_view what) const {
    if (!node.IsSequence()) {
      Fail(node, fmt::format("expected {} to be a list", what));
    }
  }

  // Finds the single key of `node` drawn from `keys`.
  template <size_t N>
  auto SelectKey(
      const YAML::Node& node, const std::array<std::string_view, N>& keys,
      std::string_view what) const -> std::string {
    if (!node.IsMap()) {
      Fail(node, fmt::format("expected {} to be a mapping", what));
    }
    std::optional<std::string> found;
    for (const auto& pair : node) {
      auto key = pair.first.as<std::string>();
      if (std::ranges::find(keys, key) == keys.end()) {
        continue;
      }
      if (found) {
        Fail(
            pair.first,
            fmt::format("{} has both '{}' and '{}'", what, *found, key));
      }
      found = key;
    }
    if (!found) {
      Fail(node, fmt::format("unrecognized {}", what));
    }
    return *found;
  }

  // Types

  auto ParseType(const YAML::Node& node, const TypeNameMap* generics)
      -> TypeId {
    std::string text = Scalar(node, "type");
    auto type = ParseTypeExpression(
        text, unit_.types, TypeScope{.types = &type_names_, .generics = generics});
    if (!type) {
      Fail(node, type.error().primary.message);
    }
    return *type;
  }

  void DeclareType(const YAML::Node& entry) {
    if (!entry.IsMap()) {
      Fail(entry, "type declaration must be a mapping");
    }
    bool is_object = static_cast<bool>(entry["object"]);
    const YAML::Node name_node = is_object ? entry["object"] : entry["distinct"];
    if (!name_node) {
      Fail(entry, "type declaration needs 'object' or 'distinct'");
    }
    std::string name = Scalar(name_node, "type name");
    if (type_names_.contains(name) || IsBuiltinName(name)) {
      Fail(name_node, fmt::format("type '{}' is already declared", name));
    }

    TypeId type;
    if (!is_object) {
      ValidateKeys(entry, {"distinct", "base"}, "distinct declaration");
      type = unit_.types.DeclareDistinct(name, SpanOf(name_node));
    } else if (const auto& params = entry["params"]) {
      ValidateKeys(
          entry, {"object", "fields", "base", "params"}, "object declaration");
      RequireSequence(params, "params");
      std::vector<std::string> names;
      for (const auto& param : params) {
        names.push_back(Scalar(param, "generic parameter"));
      }
      type = unit_.types.DeclareGenericObject(name, names, SpanOf(name_node));
    } else {
      ValidateKeys(
          entry, {"object", "fields", "base", "params"}, "object declaration");
      type = unit_.types.DeclareObject(name, SpanOf(name_node));
    }
    type_names_.emplace(std::move(name), type);
  }

  void DefineType(const YAML::Node& entry) {
    bool is_object = static_cast<bool>(entry["object"]);
    std::string name = (is_object ? entry["object"] : entry["distinct"]).Scalar();
    TypeId type = type_names_.at(name);

    if (!is_object) {
      const auto& base = entry["base"];
      if (!base) {
        Fail(entry, fmt::format("distinct type '{}' needs a base", name));
      }
      unit_.types.SetDistinctBase(type, ParseType(base, nullptr));
      return;
    }

    TypeNameMap generics;
    for (TypeId param : unit_.types[type].AsObject().type_params) {
      generics.emplace(unit_.types[param].AsGenericParam().name, param);
    }

    std::vector<FieldInfo> fields;
    if (const auto& field_list = entry["fields"]) {
      RequireSequence(field_list, "fields");
      for (const auto& field : field_list) {
        ValidateKeys(field, {"name", "type"}, "field");
        std::string field_name = Scalar(field["name"], "field name");
        bool duplicate = std::ranges::any_of(
            fields, [&](const FieldInfo& f) { return f.name == field_name; });
        if (duplicate) {
          Fail(
              field["name"],
              fmt::format("duplicate field '{}' in '{}'", field_name, name));
        }
        fields.push_back(
            FieldInfo{
                .name = std::move(field_name),
                .type = ParseType(field["type"], &generics),
                .span = SpanOf(field["name"]),
            });
      }
    }

    TypeId base = kInvalidTypeId;
    if (const auto& base_node = entry["base"]) {
      base = ParseType(base_node, &generics);
      if (unit_.types[base].Kind() != TypeKind::kObject) {
        Fail(
            base_node,
            fmt::format(
                "base of '{}' must be an object type, got '{}'", name,
                unit_.types.ToString(base)));
      }
    }
    unit_.types.SetObjectBody(type, std::move(fields), base);
  }

  static auto IsBuiltinName(std::string_view name) -> bool {
    static constexpr std::array<std::string_view, 12> kReserved = {
        "int", "float", "bool", "string", "void", "array",
        "seq", "ref",   "ptr",  "var",    "lent", "result"};
    return std::ranges::find(kReserved, name) != kReserved.end();
  }

  // Operators

  void LoadOperator(const YAML::Node& entry) {
    ValidateKeys(
        entry, {"name", "generic", "params", "result", "impl"}, "operator");
    ir::OperatorDecl decl;
    decl.name = Scalar(entry["name"], "operator name");
    decl.span = SpanOf(entry["name"]);

    TypeNameMap generics;
    if (const auto& generic = entry["generic"]) {
      RequireSequence(generic, "generic");
      uint32_t index = 0;
      for (const auto& param : generic) {
        std::string param_name = Scalar(param, "generic parameter");
        TypeId type = unit_.types.MakeGenericParam(param_name, index++);
        generics.emplace(std::move(param_name), type);
        decl.generic_params.push_back(type);
      }
    }

    if (const auto& params = entry["params"]) {
      RequireSequence(params, "params");
      for (const auto& param : params) {
        ValidateKeys(param, {"name", "type"}, "parameter");
        decl.params.push_back(
            ir::ParameterDecl{
                .name = Scalar(param["name"], "parameter name"),
                .type = ParseType(param["type"], &generics),
                .span = SpanOf(param["type"]),
            });
      }
    }
    if (const auto& result = entry["result"]) {
      decl.result = ParseType(result, &generics);
    }
    decl.impl = entry["impl"] ? Scalar(entry["impl"], "impl") : decl.name;
    unit_.operators.push_back(std::move(decl));
  }

  // Procedures

  void LoadProcedure(const YAML::Node& entry) {
    ValidateKeys(entry, {"name", "params", "result", "body"}, "procedure");
    proc_ = ir::Procedure{};
    proc_.name = Scalar(entry["name"], "procedure name");
    proc_.span = SpanOf(entry["name"]);
    scopes_.clear();
    scopes_.emplace_back();
    loop_depth_ = 0;

    if (const auto& params = entry["params"]) {
      RequireSequence(params, "params");
      for (const auto& param : params) {
        ValidateKeys(param, {"name", "type"}, "parameter");
        ir::LocalId id = DeclareLocal(
            param["name"], ParseType(param["type"], nullptr),
            ir::LocalKind::kParameter);
        proc_.params.push_back(id);
      }
    }
    if (const auto& result = entry["result"]) {
      TypeId type = ParseType(result, nullptr);
      if (unit_.types[type].Kind() != TypeKind::kVoid) {
        proc_.result_type = type;
        proc_.result_local = AddLocal("result", type, ir::LocalKind::kResult,
                                      SpanOf(result));
        scopes_.back().emplace("result", proc_.result_local);
      }
    }

    const auto& body = entry["body"];
    proc_.body = LowerBlock(body, SpanOf(entry));
    ir::ProcedureId id = unit_.arena.AddProcedure(std::move(proc_));
    unit_.procedures.push_back(id);
  }

  auto AddLocal(
      std::string name, TypeId type, ir::LocalKind kind, SourceSpan span)
      -> ir::LocalId {
    ir::LocalId id{static_cast<uint32_t>(proc_.locals.size())};
    proc_.locals.push_back(
        ir::LocalSymbol{
            .name = std::move(name), .type = type, .kind = kind, .span = span});
    return id;
  }

  auto DeclareLocal(const YAML::Node& name_node, TypeId type, ir::LocalKind kind)
      -> ir::LocalId {
    std::string name = Scalar(name_node, "variable name");
    if (scopes_.back().contains(name)) {
      Fail(name_node, fmt::format("'{}' is already declared in this scope", name));
    }
    ir::LocalId id = AddLocal(name, type, kind, SpanOf(name_node));
    scopes_.back().emplace(std::move(name), id);
    return id;
  }

  auto LookupLocal(const YAML::Node& name_node) const -> ir::LocalId {
    std::string name = Scalar(name_node, "name");
    for (auto it = scopes_.rbegin(); it != scopes_.rend(); ++it) {
      auto found = it->find(name);
      if (found != it->end()) {
        return found->second;
      }
    }
    Fail(name_node, fmt::format("unknown name '{}'", name));
  }

  // Statements

  auto LowerBlock(const YAML::Node& list, SourceSpan span) -> ir::StatementId {
    ir::BlockStatementData block;
    scopes_.emplace_back();
    if (list && !list.IsNull()) {
      RequireSequence(list, "statement list");
      for (const auto& stmt : list) {
        block.statements.push_back(LowerStatement(stmt));
      }
    }
    scopes_.pop_back();
    return unit_.arena.AddStatement(
        ir::Statement{
            .kind = ir::StatementKind::kBlock,
            .span = span,
            .data = std::move(block),
        });
  }

  auto AddStatement(
      ir::StatementKind kind, const YAML::Node& node, ir::StatementData data)
      -> ir::StatementId {
    return unit_.arena.AddStatement(
        ir::Statement{.kind = kind, .span = SpanOf(node), .data = std::move(data)});
  }

  auto LowerStatement(const YAML::Node& node) -> ir::StatementId {
    std::string key = SelectKey(node, kStatementKeys, "statement");
    const YAML::Node value = node[key];

    if (key == "var" || key == "let") {
      return LowerDeclaration(node, key == "let");
    }
    ValidateKeys(node, {key}, fmt::format("'{}' statement", key));

    if (key == "assign") {
      ValidateKeys(value, {"target", "value"}, "assignment");
      ir::ExpressionId target = LowerExpression(value["target"]);
      if (!ir::IsPlaceExpressionKind(unit_.arena[target].kind)) {
        Fail(value["target"], "assignment target must be a place expression");
      }
      ir::ExpressionId rhs = LowerExpression(value["value"]);
      return AddStatement(
          ir::StatementKind::kAssignment, node,
          ir::AssignmentStatementData{.target = target, .value = rhs});
    }
    if (key == "expr") {
      return AddStatement(
          ir::StatementKind::kExpression, node,
          ir::ExpressionStatementData{.expression = LowerExpression(value)});
    }
    if (key == "block") {
      return LowerBlock(value, SpanOf(node));
    }
    if (key == "if") {
      ValidateKeys(value, {"cond", "then", "else"}, "if statement");
      ir::ExpressionId cond = LowerExpression(value["cond"]);
      ir::StatementId then_branch = LowerBlock(value["then"], SpanOf(node));
      std::optional<ir::StatementId> else_branch;
      if (value["else"]) {
        else_branch = LowerBlock(value["else"], SpanOf(value["else"]));
      }
      return AddStatement(
          ir::StatementKind::kConditional, node,
          ir::ConditionalStatementData{
              .condition = cond,
              .then_branch = then_branch,
              .else_branch = else_branch,
          });
    }
    if (key == "while") {
      ValidateKeys(value, {"cond", "body"}, "while statement");
      ir::ExpressionId cond = LowerExpression(value["cond"]);
      ++loop_depth_;
      ir::StatementId body = LowerBlock(value["body"], SpanOf(node));
      --loop_depth_;
      return AddStatement(
          ir::StatementKind::kWhileLoop, node,
          ir::WhileLoopStatementData{.condition = cond, .body = body});
    }
    if (key == "return") {
      ir::ExpressionId result = ir::kInvalidExpressionId;
      if (value && !value.IsNull()) {
        result = LowerExpression(value);
      }
      return AddStatement(
          ir::StatementKind::kReturn, node,
          ir::ReturnStatementData{.value = result});
    }
    if (key == "break" || key == "continue") {
      if (loop_depth_ == 0) {
        Fail(node, fmt::format("'{}' outside of a loop", key));
      }
      if (key == "break") {
        return AddStatement(
            ir::StatementKind::kBreak, node, ir::BreakStatementData{});
      }
      return AddStatement(
          ir::StatementKind::kContinue, node, ir::ContinueStatementData{});
    }
    // spawn
    ir::ExpressionId call = LowerExpression(value);
    if (unit_.arena[call].kind != ir::ExpressionKind::kCall) {
      Fail(value, "spawn needs a call");
    }
    return AddStatement(
        ir::StatementKind::kSpawn, node, ir::SpawnStatementData{.call = call});
  }

  auto LowerDeclaration(const YAML::Node& node, bool is_let)
      -> ir::StatementId {
    std::string_view key = is_let ? "let" : "var";
    ValidateKeys(node, {key, "type", "init"}, fmt::format("'{}' statement", key));

    ir::ExpressionId init = ir::kInvalidExpressionId;
    if (node["init"]) {
      init = LowerExpression(node["init"]);
    } else if (is_let) {
      Fail(node, "'let' needs an initializer");
    }

    TypeId type = kInvalidTypeId;
    if (node["type"]) {
      type = ParseType(node["type"], nullptr);
      if (init && unit_.arena[init].type != type) {
        Fail(
            node["init"],
            fmt::format(
                "initializer of type '{}' does not match declared type '{}'",
                unit_.types.ToString(unit_.arena[init].type),
                unit_.types.ToString(type)));
      }
    } else if (init) {
      type = unit_.arena[init].type;
    } else {
      Fail(node, "declaration needs a type or an initializer");
    }

    ir::LocalId local = DeclareLocal(
        node[std::string(key)], type,
        is_let ? ir::LocalKind::kLet : ir::LocalKind::kVariable);
    return AddStatement(
        ir::StatementKind::kVariableDeclaration, node,
        ir::VariableDeclarationStatementData{
            .local = local,
            .init = init,
            .mutability = is_let ? ir::Mutability::kLet : ir::Mutability::kVar,
        });
  }

  // Expressions

  auto AddExpression(
      ir::ExpressionKind kind, TypeId type, const YAML::Node& node,
      ir::ExpressionData data) -> ir::ExpressionId {
    return unit_.arena.AddExpression(
        ir::Expression{
            .kind = kind,
            .type = type,
            .span = SpanOf(node),
            .data = std::move(data),
        });
  }

  auto TypeOf(ir::ExpressionId expr) const -> TypeId {
    return unit_.arena[expr].type;
  }

  auto LowerExpressionList(const YAML::Node& list)
      -> std::vector<ir::ExpressionId> {
    std::vector<ir::ExpressionId> exprs;
    if (!list || list.IsNull()) {
      return exprs;
    }
    RequireSequence(list, "expression list");
    for (const auto& item : list) {
      exprs.push_back(LowerExpression(item));
    }
    return exprs;
  }

  auto LowerExpression(const YAML::Node& node) -> ir::ExpressionId {
    if (!node) {
      Fail(node, "missing expression");
    }
    std::string key = SelectKey(node, kExpressionKeys, "expression");
    const YAML::Node value = node[key];

    if (key == "name") {
      ValidateKeys(node, {"name"}, "name expression");
      ir::LocalId local = LookupLocal(value);
      return AddExpression(
          ir::ExpressionKind::kNameRef, proc_.Local(local).type, value,
          ir::NameRefExpressionData{.local = local});
    }
    if (key == "call") {
      ValidateKeys(node, {"call", "args", "type"}, "call expression");
      std::string callee = Scalar(value, "callee");
      auto args = LowerExpressionList(node["args"]);
      TypeId type =
          node["type"] ? ParseType(node["type"], nullptr) : unit_.types.Void();
      return AddExpression(
          ir::ExpressionKind::kCall, type, value,
          ir::CallExpressionData{
              .callee = std::move(callee), .arguments = std::move(args)});
    }
    if (key == "construct") {
      return LowerConstruct(node);
    }
    if (key == "tuple") {
      ValidateKeys(node, {"tuple"}, "tuple expression");
      auto elements = LowerExpressionList(value);
      std::vector<TypeId> types;
      for (ir::ExpressionId element : elements) {
        types.push_back(TypeOf(element));
      }
      return AddExpression(
          ir::ExpressionKind::kTupleLiteral, unit_.types.Tuple(std::move(types)),
          node, ir::TupleLiteralExpressionData{.elements = std::move(elements)});
    }
    if (key == "array") {
      return LowerArray(node);
    }
    if (key == "literal") {
      ValidateKeys(node, {"literal", "type"}, "literal");
      std::string text = Scalar(value, "literal");
      TypeId type = node["type"] ? ParseType(node["type"], nullptr)
                                 : LiteralType(text);
      return AddExpression(
          ir::ExpressionKind::kLiteral, type, value,
          ir::LiteralExpressionData{.text = std::move(text)});
    }
    if (key == "move") {
      ValidateKeys(node, {"move"}, "move expression");
      ir::ExpressionId operand = LowerExpression(value);
      if (!ir::IsPlaceExpressionKind(unit_.arena[operand].kind)) {
        Fail(value, "only a place can be moved from");
      }
      return AddExpression(
          ir::ExpressionKind::kMove, TypeOf(operand), node,
          ir::MoveExpressionData{.operand = operand});
    }
    if (key == "field") {
      return LowerFieldAccess(node);
    }
    if (key == "index") {
      return LowerIndex(node);
    }
    // deref
    ValidateKeys(node, {"deref"}, "deref expression");
    ir::ExpressionId operand = LowerExpression(value);
    const Type& type = unit_.types[TypeOf(operand)];
    if (!IsIndirection(type.Kind())) {
      Fail(
          value, fmt::format(
                     "cannot dereference '{}'",
                     unit_.types.ToString(TypeOf(operand))));
    }
    return AddExpression(
        ir::ExpressionKind::kDeref, type.AsIndirection().pointee, node,
        ir::DerefExpressionData{.operand = operand});
  }

  auto LiteralType(std::string_view text) const -> TypeId {
    if (text == "true" || text == "false") {
      return unit_.types.Bool();
    }
    bool numeric = !text.empty() && std::ranges::all_of(text, [](char c) {
      return (c >= '0' && c <= '9') || c == '.' || c == '-';
    });
    if (numeric) {
      return text.find('.') != std::string_view::npos ? unit_.types.Float()
                                                      : unit_.types.Int();
    }
    return unit_.types.String();
  }

  auto LowerConstruct(const YAML::Node& node) -> ir::ExpressionId {
    ValidateKeys(node, {"construct", "fields"}, "construct expression");
    TypeId type = ParseType(node["construct"], nullptr);
    const Type& t = unit_.types[type];
    if (t.Kind() != TypeKind::kObject) {
      Fail(
          node["construct"],
          fmt::format("cannot construct '{}'", unit_.types.ToString(type)));
    }
    std::vector<FieldInfo> fields = t.AsObject().fields;
    ir::ConstructExpressionData data;
    data.fields.assign(fields.size(), ir::kInvalidExpressionId);
    if (const auto& inits = node["fields"]) {
      if (!inits.IsMap()) {
        Fail(inits, "construct fields must be a mapping");
      }
      for (const auto& pair : inits) {
        auto name = pair.first.as<std::string>();
        auto it = std::ranges::find_if(
            fields, [&](const FieldInfo& f) { return f.name == name; });
        if (it == fields.end()) {
          Fail(
              pair.first, fmt::format(
                              "'{}' has no field '{}'",
                              unit_.types.ToString(type), name));
        }
        data.fields[static_cast<size_t>(it - fields.begin())] =
            LowerExpression(pair.second);
      }
    }
    return AddExpression(
        ir::ExpressionKind::kConstruct, type, node["construct"],
        std::move(data));
  }

  auto LowerArray(const YAML::Node& node) -> ir::ExpressionId {
    ValidateKeys(node, {"array", "type"}, "array expression");
    auto elements = LowerExpressionList(node["array"]);
    TypeId type = kInvalidTypeId;
    if (node["type"]) {
      type = ParseType(node["type"], nullptr);
      if (unit_.types[type].Kind() != TypeKind::kArray) {
        Fail(node["type"], "array literal type must be an array type");
      }
    } else if (elements.empty()) {
      Fail(node, "empty array literal needs a type");
    } else {
      type = unit_.types.Array(
          TypeOf(elements.front()), static_cast<uint32_t>(elements.size()));
    }
    TypeId element_type = unit_.types[type].AsArray().element;
    for (ir::ExpressionId element : elements) {
      if (TypeOf(element) != element_type) {
        Fail(
            node["array"],
            fmt::format(
                "array element of type '{}' in array of '{}'",
                unit_.types.ToString(TypeOf(element)),
                unit_.types.ToString(element_type)));
      }
    }
    return AddExpression(
        ir::ExpressionKind::kArrayLiteral, type, node,
        ir::ArrayLiteralExpressionData{.elements = std::move(elements)});
  }

  auto LowerFieldAccess(const YAML::Node& node) -> ir::ExpressionId {
    ValidateKeys(node, {"field", "of"}, "field expression");
    std::string name = Scalar(node["field"], "field name");
    ir::ExpressionId base = LowerExpression(node["of"]);
    TypeId base_type = TypeOf(base);
    const Type& t = unit_.types[base_type];
    if (t.Kind() != TypeKind::kObject) {
      Fail(
          node["field"], fmt::format(
                             "'{}' has no fields",
                             unit_.types.ToString(base_type)));
    }
    const auto& fields = t.AsObject().fields;
    for (size_t i = 0; i < fields.size(); ++i) {
      if (fields[i].name == name) {
        return AddExpression(
            ir::ExpressionKind::kFieldAccess, fields[i].type, node["field"],
            ir::FieldAccessExpressionData{
                .base = base, .field_index = static_cast<uint32_t>(i)});
      }
    }
    Fail(
        node["field"],
        fmt::format(
            "'{}' has no field '{}'", unit_.types.ToString(base_type), name));
  }

  auto LowerIndex(const YAML::Node& node) -> ir::ExpressionId {
    ValidateKeys(node, {"index", "at"}, "index expression");
    ir::ExpressionId base = LowerExpression(node["index"]);
    ir::ExpressionId index = LowerExpression(node["at"]);
    TypeId base_type = TypeOf(base);
    const Type& t = unit_.types[base_type];
    TypeId element = kInvalidTypeId;
    switch (t.Kind()) {
      case TypeKind::kArray:
        element = t.AsArray().element;
        break;
      case TypeKind::kSequence:
        element = t.AsSequence().element;
        break;
      case TypeKind::kTuple: {
        const auto* literal =
            std::get_if<ir::LiteralExpressionData>(&unit_.arena[index].data);
        size_t slot = 0;
        std::istringstream in(literal != nullptr ? literal->text : "");
        if (literal == nullptr || !(in >> slot) ||
            slot >= t.AsTuple().elements.size()) {
          Fail(node["at"], "tuple index must be an in-range integer literal");
        }
        element = t.AsTuple().elements[slot];
        break;
      }
      default:
        Fail(
            node["index"], fmt::format(
                               "cannot index '{}'",
                               unit_.types.ToString(base_type)));
    }
    return AddExpression(
        ir::ExpressionKind::kIndex, element, node,
        ir::IndexExpressionData{.base = base, .index = index});
  }

  FileId file_;
  ir::CompilationUnit unit_;
  TypeNameMap type_names_;

  // Procedure being lowered.
  ir::Procedure proc_;
  std::vector<LocalScope> scopes_;
  int loop_depth_ = 0;
};

}  // namespace

auto LoadUnit(std::string_view text, FileId file, std::string unit_name)
    -> Result<ir::CompilationUnit> {
  try {
    YAML::Node root = YAML::Load(std::string(text));
    UnitLoader loader(file, std::move(unit_name));
    ir::CompilationUnit unit = loader.Load(root);
    spdlog::debug(
        "loaded unit '{}': {} types, {} operators, {} procedures", unit.name,
        unit.types.Size(), unit.operators.size(), unit.procedures.size());
    return unit;
  } catch (const DiagnosticException& e) {
    return std::unexpected(e.GetDiagnostic());
  } catch (const YAML::Exception& e) {
    SourceSpan span{.file_id = file};
    if (e.mark.pos >= 0) {
      span.begin = static_cast<uint32_t>(e.mark.pos);
      span.end = span.begin;
    }
    return std::unexpected(Diagnostic::HostError(span, e.msg));
  }
}

auto LoadUnitFile(const std::filesystem::path& path, SourceManager& sources)
    -> Result<ir::CompilationUnit> {
  std::ifstream in(path);
  if (!in) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format("cannot read file '{}'", path.string())));
  }
  std::ostringstream content;
  content << in.rdbuf();
  std::string text = content.str();
  FileId file = sources.AddFile(path.string(), text);
  return LoadUnit(text, file, path.stem().string());
}

}  // namespace lifter::frontend
