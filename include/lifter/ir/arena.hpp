#pragma once

#include <cstdint>
#include <vector>

#include "lifter/ir/expression.hpp"
#include "lifter/ir/procedure.hpp"
#include "lifter/ir/statement.hpp"

namespace lifter::ir {

class Arena final {
 public:
  Arena() = default;
  ~Arena() = default;

  Arena(const Arena&) = delete;
  auto operator=(const Arena&) -> Arena& = delete;

  Arena(Arena&&) = default;
  auto operator=(Arena&&) -> Arena& = default;

  auto AddExpression(Expression expr) -> ExpressionId {
    ExpressionId id{static_cast<uint32_t>(expressions_.size())};
    expressions_.push_back(std::move(expr));
    return id;
  }

  auto AddStatement(Statement stmt) -> StatementId {
    StatementId id{static_cast<uint32_t>(statements_.size())};
    statements_.push_back(std::move(stmt));
    return id;
  }

  auto AddProcedure(Procedure proc) -> ProcedureId {
    ProcedureId id{static_cast<uint32_t>(procedures_.size())};
    procedures_.push_back(std::move(proc));
    return id;
  }

  [[nodiscard]] auto operator[](ExpressionId id) const -> const Expression& {
    return expressions_.at(id.value);
  }

  [[nodiscard]] auto operator[](StatementId id) const -> const Statement& {
    return statements_.at(id.value);
  }

  [[nodiscard]] auto operator[](ProcedureId id) const -> const Procedure& {
    return procedures_.at(id.value);
  }

  // Mutable access for builders that patch a node after creating it.
  [[nodiscard]] auto MutableStatement(StatementId id) -> Statement& {
    return statements_.at(id.value);
  }

 private:
  std::vector<Expression> expressions_;
  std::vector<Statement> statements_;
  std::vector<Procedure> procedures_;
};

}  // namespace lifter::ir
