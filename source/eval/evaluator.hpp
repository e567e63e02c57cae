#pragma once

#include <optional>
#include <utility>
#include <variant>

#include <ast/expression.hpp>
#include <ast/visitor.hpp>
#include <diagnostics/diagnostics.hpp>
#include <diagnostics/errors.hpp>
#include <lexer/token.hpp>

#include "value.hpp"

using eval_result = std::variant<value, runtime_error>;

struct evaluator final : visitor
{
    auto evaluate(const expression& expr) -> eval_result;

  protected:
    void visit(const binary_expression& expr) final;
    void visit(const grouping_expression& expr) final;
    void visit(const literal_expression& expr) final;
    void visit(const unary_expression& expr) final;

  private:
    auto number_operands(const token& op, const value& left, const value& right)
        -> std::optional<std::pair<double, double>>;

    value m_result;
    std::optional<runtime_error> m_error;
};

// evaluates expr, a runtime error is reported through diag instead of being returned
auto interpret(const expression& expr, diagnostics& diag) -> std::optional<value>;
