#pragma once

#include <string>

#include "expression.hpp"

struct grouping_expression final : expression
{
    explicit grouping_expression(expression_ptr expr);
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    expression_ptr inner;
};
