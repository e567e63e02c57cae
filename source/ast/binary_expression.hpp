#pragma once

#include <string>

#include <lexer/token.hpp>

#include "expression.hpp"

struct binary_expression final : expression
{
    binary_expression(expression_ptr lft, token oprtr, expression_ptr rght);
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    expression_ptr left;
    token op;
    expression_ptr right;
};
