#include "lifter/lifecycle/binder.hpp"

#include <cstdint>
#include <expected>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "lifter/common/diagnostic/diagnostic.hpp"
#include "lifter/common/type.hpp"
#include "lifter/lifecycle/operation_kind.hpp"

namespace lifter::lifecycle {

namespace {

auto ParamTypes(const ir::OperatorDecl& decl) -> std::vector<TypeId> {
  std::vector<TypeId> types;
  types.reserve(decl.params.size());
  for (const auto& param : decl.params) {
    types.push_back(param.type);
  }
  return types;
}

auto ParamSpan(const ir::OperatorDecl& decl, size_t index) -> SourceSpan {
  if (index < decl.params.size() && decl.params[index].span.file_id) {
    return decl.params[index].span;
  }
  return decl.span;
}

}  // namespace

auto OperationBinder::Bind(const ir::OperatorDecl& decl, uint32_t decl_index)
    -> Result<const BoundOperation*> {
  auto kind = OpKindFromOperatorName(decl.name);
  if (!kind) {
    if (IsReservedLifecycleName(decl.name)) {
      return std::unexpected(
          Diagnostic::Error(
              decl.span, DiagCode::kInvalidSignature,
              fmt::format(
                  "'{}' is not a lifecycle operator; expected '=', "
                  "'=destroy' or '=deepCopy'",
                  decl.name)));
    }
    return nullptr;
  }
  switch (*kind) {
    case OpKind::kAssign:
      return BindAssign(decl, decl_index);
    case OpKind::kDestroy:
      return BindDestroy(decl, decl_index);
    case OpKind::kDeepCopy:
      return BindDeepCopy(decl, decl_index);
  }
  return nullptr;
}

auto OperationBinder::BindAll(
    const std::vector<ir::OperatorDecl>& decls, DiagnosticSink& sink)
    -> size_t {
  size_t bound = 0;
  for (size_t i = 0; i < decls.size(); ++i) {
    auto result = Bind(decls[i], static_cast<uint32_t>(i));
    if (!result) {
      sink.Report(std::move(result.error()));
      continue;
    }
    if (*result != nullptr) {
      ++bound;
    }
  }
  return bound;
}

auto OperationBinder::BindAssign(
    const ir::OperatorDecl& decl, uint32_t decl_index)
    -> Result<const BoundOperation*> {
  if (decl.params.size() != 2) {
    return std::unexpected(
        Diagnostic::Error(
            decl.span, DiagCode::kInvalidSignature,
            fmt::format(
                "'=' expects 2 parameters (var T, T), got {}",
                decl.params.size())));
  }

  const Type& dest = types_[decl.params[0].type];
  if (dest.Kind() != TypeKind::kVar) {
    if (IsNominal(dest.Kind()) || dest.Kind() == TypeKind::kGenericParam) {
      return std::unexpected(
          Diagnostic::Error(
              ParamSpan(decl, 0), DiagCode::kInvalidSignature,
              fmt::format(
                  "first parameter of '=' must be 'var {}', got '{}'",
                  types_.ToString(decl.params[0].type),
                  types_.ToString(decl.params[0].type))));
    }
    return std::unexpected(
        Diagnostic::Error(
            ParamSpan(decl, 0), DiagCode::kNonNominalReceiver,
            fmt::format(
                "'=' cannot be bound to '{}'; the receiver must be an "
                "object or distinct type",
                types_.ToString(decl.params[0].type))));
  }

  TypeId receiver = dest.AsIndirection().pointee;
  auto target = NormalizeReceiver(decl, receiver);
  if (!target) {
    return std::unexpected(std::move(target.error()));
  }

  TypeId source = decl.params[1].type;
  const Type& source_type = types_[source];
  bool source_ok = source == receiver ||
                   (source_type.Kind() == TypeKind::kLent &&
                    source_type.AsIndirection().pointee == receiver);
  if (!source_ok) {
    return std::unexpected(
        Diagnostic::Error(
            ParamSpan(decl, 1), DiagCode::kInvalidSignature,
            fmt::format(
                "second parameter of '=' must be '{0}' or 'lent {0}', got "
                "'{1}'",
                types_.ToString(receiver), types_.ToString(source))));
  }

  auto void_result = CheckVoidResult(decl);
  if (!void_result) {
    return std::unexpected(std::move(void_result.error()));
  }

  return Record(
      BoundOperation{
          .kind = OpKind::kAssign,
          .target = *target,
          .params = ParamTypes(decl),
          .result = kInvalidTypeId,
          .impl = decl.impl,
          .via = Indirection::kNone,
          .span = decl.span,
          .decl_index = decl_index,
      });
}

auto OperationBinder::BindDestroy(
    const ir::OperatorDecl& decl, uint32_t decl_index)
    -> Result<const BoundOperation*> {
  if (decl.params.size() != 1) {
    return std::unexpected(
        Diagnostic::Error(
            decl.span, DiagCode::kInvalidSignature,
            fmt::format(
                "'=destroy' expects 1 parameter, got {}", decl.params.size())));
  }

  auto target = NormalizeReceiver(decl, decl.params[0].type);
  if (!target) {
    return std::unexpected(std::move(target.error()));
  }

  auto void_result = CheckVoidResult(decl);
  if (!void_result) {
    return std::unexpected(std::move(void_result.error()));
  }

  return Record(
      BoundOperation{
          .kind = OpKind::kDestroy,
          .target = *target,
          .params = ParamTypes(decl),
          .result = kInvalidTypeId,
          .impl = decl.impl,
          .via = Indirection::kNone,
          .span = decl.span,
          .decl_index = decl_index,
      });
}

auto OperationBinder::BindDeepCopy(
    const ir::OperatorDecl& decl, uint32_t decl_index)
    -> Result<const BoundOperation*> {
  if (decl.params.size() != 1) {
    return std::unexpected(
        Diagnostic::Error(
            decl.span, DiagCode::kInvalidSignature,
            fmt::format(
                "'=deepCopy' expects 1 parameter, got {}",
                decl.params.size())));
  }

  TypeId param = decl.params[0].type;
  const Type& param_type = types_[param];
  Indirection via = Indirection::kNone;
  if (param_type.Kind() == TypeKind::kRef) {
    via = Indirection::kRef;
  } else if (param_type.Kind() == TypeKind::kPtr) {
    via = Indirection::kPtr;
  } else {
    return std::unexpected(
        Diagnostic::Error(
            ParamSpan(decl, 0), DiagCode::kInvalidSignature,
            fmt::format(
                "'=deepCopy' parameter must be 'ref T' or 'ptr T', got '{}'",
                types_.ToString(param))));
  }

  if (decl.result != param) {
    return std::unexpected(
        Diagnostic::Error(
            decl.span, DiagCode::kInvalidSignature,
            fmt::format(
                "'=deepCopy' must return its parameter type '{}', got '{}'",
                types_.ToString(param),
                decl.result ? types_.ToString(decl.result) : "void")));
  }

  auto target = NormalizeReceiver(decl, param_type.AsIndirection().pointee);
  if (!target) {
    return std::unexpected(std::move(target.error()));
  }

  // Same pointee bound through the other indirection.
  if (const auto* existing = registry_.Lookup(*target, OpKind::kDeepCopy);
      existing != nullptr && existing->via != via) {
    return std::unexpected(
        Diagnostic::Error(
            decl.span, DiagCode::kConflictingIndirectionBinding,
            fmt::format(
                "'=deepCopy' for '{}' is bound through both '{}' and '{}'",
                types_.ToString(*target), ToString(existing->via),
                ToString(via)))
            .WithNote(existing->span, "first binding is here"));
  }

  return Record(
      BoundOperation{
          .kind = OpKind::kDeepCopy,
          .target = *target,
          .params = ParamTypes(decl),
          .result = decl.result,
          .impl = decl.impl,
          .via = via,
          .span = decl.span,
          .decl_index = decl_index,
      });
}

auto OperationBinder::NormalizeReceiver(
    const ir::OperatorDecl& decl, TypeId receiver) -> Result<TypeId> {
  const Type& type = types_[receiver];
  if (!IsNominal(type.Kind())) {
    return std::unexpected(
        Diagnostic::Error(
            ParamSpan(decl, 0), DiagCode::kNonNominalReceiver,
            fmt::format(
                "'{}' cannot be bound to '{}'; the receiver must be an "
                "object or distinct type",
                decl.name, types_.ToString(receiver))));
  }
  if (type.Kind() != TypeKind::kObject || !type.AsObject().generic_origin) {
    return receiver;
  }

  const ObjectInfo& info = type.AsObject();
  if (!types_.IsDependent(receiver)) {
    // Binding on one concrete instance only.
    return receiver;
  }
  if (info.type_args == decl.generic_params) {
    return info.generic_origin;
  }
  return std::unexpected(
      Diagnostic::Error(
          ParamSpan(decl, 0), DiagCode::kInvalidSignature,
          fmt::format(
              "'{}' receiver '{}' must use the operator's generic "
              "parameters in declaration order",
              decl.name, types_.ToString(receiver))));
}

auto OperationBinder::CheckVoidResult(const ir::OperatorDecl& decl)
    -> Result<void> {
  if (!decl.result || types_[decl.result].Kind() == TypeKind::kVoid) {
    return {};
  }
  return std::unexpected(
      Diagnostic::Error(
          decl.span, DiagCode::kInvalidSignature,
          fmt::format(
              "'{}' must not return a value, got '{}'", decl.name,
              types_.ToString(decl.result))));
}

auto OperationBinder::Record(BoundOperation op)
    -> Result<const BoundOperation*> {
  if (const auto* existing = registry_.Lookup(op.target, op.kind);
      existing != nullptr) {
    return std::unexpected(
        Diagnostic::Error(
            op.span, DiagCode::kDuplicateBinding,
            fmt::format(
                "'{}' is already bound for '{}'", OperatorName(op.kind),
                types_.ToString(op.target)))
            .WithNote(existing->span, "first binding is here"));
  }
  spdlog::debug(
      "bound {} for '{}' -> {}", OperatorName(op.kind),
      types_.ToString(op.target), op.impl);
  return &registry_.Insert(std::move(op));
}

}  // namespace lifter::lifecycle
