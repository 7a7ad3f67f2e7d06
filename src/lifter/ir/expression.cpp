#include "lifter/ir/expression.hpp"

#include <type_traits>
#include <variant>
#include <vector>

namespace lifter::ir {

auto ChildExpressions(const Expression& expr) -> std::vector<ExpressionId> {
  std::vector<ExpressionId> children;
  std::visit(
      [&](const auto& data) {
        using T = std::decay_t<decltype(data)>;
        if constexpr (std::is_same_v<T, CallExpressionData>) {
          children = data.arguments;
        } else if constexpr (std::is_same_v<T, ConstructExpressionData>) {
          for (ExpressionId field : data.fields) {
            if (field) {
              children.push_back(field);
            }
          }
        } else if constexpr (std::is_same_v<T, TupleLiteralExpressionData>) {
          children = data.elements;
        } else if constexpr (std::is_same_v<T, ArrayLiteralExpressionData>) {
          children = data.elements;
        } else if constexpr (std::is_same_v<T, MoveExpressionData>) {
          children.push_back(data.operand);
        } else if constexpr (std::is_same_v<T, FieldAccessExpressionData>) {
          children.push_back(data.base);
        } else if constexpr (std::is_same_v<T, IndexExpressionData>) {
          children.push_back(data.base);
          children.push_back(data.index);
        } else if constexpr (std::is_same_v<T, DerefExpressionData>) {
          children.push_back(data.operand);
        }
      },
      expr.data);
  return children;
}

}  // namespace lifter::ir
