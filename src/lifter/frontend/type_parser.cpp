#include "lifter/frontend/type_parser.hpp"

#include <cctype>
#include <charconv>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace lifter::frontend {

namespace {

class TypeExpressionParser {
 public:
  TypeExpressionParser(
      std::string_view text, TypeArena& arena, const TypeScope& scope)
      : text_(text), arena_(arena), scope_(scope) {
  }

  auto Parse() -> Result<TypeId> {
    auto type = ParseType();
    if (!type) {
      return type;
    }
    SkipSpace();
    if (pos_ != text_.size()) {
      return Error(fmt::format("unexpected '{}'", text_.substr(pos_)));
    }
    return type;
  }

 private:
  auto Error(std::string message) const -> std::unexpected<Diagnostic> {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format("in type '{}': {}", text_, std::move(message))));
  }

  void SkipSpace() {
    while (pos_ < text_.size() &&
           std::isspace(static_cast<unsigned char>(text_[pos_])) != 0) {
      ++pos_;
    }
  }

  auto Accept(char c) -> bool {
    SkipSpace();
    if (pos_ < text_.size() && text_[pos_] == c) {
      ++pos_;
      return true;
    }
    return false;
  }

  auto Expect(char c) -> Result<void> {
    if (!Accept(c)) {
      return Error(fmt::format("expected '{}'", c));
    }
    return {};
  }

  auto Identifier() -> std::string_view {
    SkipSpace();
    size_t start = pos_;
    while (pos_ < text_.size() &&
           (std::isalnum(static_cast<unsigned char>(text_[pos_])) != 0 ||
            text_[pos_] == '_')) {
      ++pos_;
    }
    return text_.substr(start, pos_ - start);
  }

  auto ParseType() -> Result<TypeId> {
    SkipSpace();
    size_t save = pos_;
    std::string_view word = Identifier();
    if (word == "ref" || word == "ptr" || word == "var" || word == "lent") {
      auto pointee = ParseType();
      if (!pointee) {
        return pointee;
      }
      if (word == "ref") {
        return arena_.Ref(*pointee);
      }
      if (word == "ptr") {
        return arena_.Ptr(*pointee);
      }
      if (word == "var") {
        return arena_.Var(*pointee);
      }
      return arena_.Lent(*pointee);
    }
    pos_ = save;
    return ParsePrimary();
  }

  auto ParseTypeList(char close) -> Result<std::vector<TypeId>> {
    std::vector<TypeId> types;
    do {
      auto type = ParseType();
      if (!type) {
        return std::unexpected(std::move(type.error()));
      }
      types.push_back(*type);
    } while (Accept(','));
    if (auto closed = Expect(close); !closed) {
      return std::unexpected(std::move(closed.error()));
    }
    return types;
  }

  auto ParsePrimary() -> Result<TypeId> {
    if (Accept('(')) {
      auto elements = ParseTypeList(')');
      if (!elements) {
        return std::unexpected(std::move(elements.error()));
      }
      return arena_.Tuple(std::move(*elements));
    }

    std::string_view name = Identifier();
    if (name.empty()) {
      return Error("expected a type");
    }
    if (name == "array") {
      return ParseArray();
    }
    if (name == "seq") {
      if (auto open = Expect('['); !open) {
        return std::unexpected(std::move(open.error()));
      }
      auto element = ParseType();
      if (!element) {
        return element;
      }
      if (auto closed = Expect(']'); !closed) {
        return std::unexpected(std::move(closed.error()));
      }
      return arena_.Sequence(*element);
    }
    return ParseNamed(name);
  }

  auto ParseArray() -> Result<TypeId> {
    if (auto open = Expect('['); !open) {
      return std::unexpected(std::move(open.error()));
    }
    SkipSpace();
    size_t start = pos_;
    while (pos_ < text_.size() &&
           std::isdigit(static_cast<unsigned char>(text_[pos_])) != 0) {
      ++pos_;
    }
    uint32_t length = 0;
    auto parsed =
        std::from_chars(text_.data() + start, text_.data() + pos_, length);
    if (parsed.ec != std::errc{} || start == pos_) {
      return Error("expected an array length");
    }
    if (auto comma = Expect(','); !comma) {
      return std::unexpected(std::move(comma.error()));
    }
    auto element = ParseType();
    if (!element) {
      return element;
    }
    if (auto closed = Expect(']'); !closed) {
      return std::unexpected(std::move(closed.error()));
    }
    return arena_.Array(*element, length);
  }

  auto ParseNamed(std::string_view name) -> Result<TypeId> {
    if (name == "int") {
      return arena_.Int();
    }
    if (name == "float") {
      return arena_.Float();
    }
    if (name == "bool") {
      return arena_.Bool();
    }
    if (name == "string") {
      return arena_.String();
    }
    if (name == "void") {
      return arena_.Void();
    }

    std::string key(name);
    if (scope_.generics != nullptr) {
      auto it = scope_.generics->find(key);
      if (it != scope_.generics->end()) {
        return it->second;
      }
    }
    auto it = scope_.types->find(key);
    if (it == scope_.types->end()) {
      return Error(fmt::format("unknown type '{}'", name));
    }
    TypeId type = it->second;

    bool generic = arena_.IsGenericDefinition(type);
    if (!Accept('[')) {
      if (generic) {
        return Error(
            fmt::format("generic type '{}' needs type arguments", name));
      }
      return type;
    }
    if (!generic) {
      return Error(fmt::format("type '{}' is not generic", name));
    }
    auto args = ParseTypeList(']');
    if (!args) {
      return std::unexpected(std::move(args.error()));
    }
    size_t expected = arena_[type].AsObject().type_params.size();
    if (args->size() != expected) {
      return Error(
          fmt::format(
              "'{}' expects {} type arguments, got {}", name, expected,
              args->size()));
    }
    return arena_.Instantiate(type, std::move(*args));
  }

  std::string_view text_;
  size_t pos_ = 0;
  TypeArena& arena_;
  const TypeScope& scope_;
};

}  // namespace

auto ParseTypeExpression(
    std::string_view text, TypeArena& arena, const TypeScope& scope)
    -> Result<TypeId> {
  return TypeExpressionParser(text, arena, scope).Parse();
}

}  // namespace lifter::frontend
