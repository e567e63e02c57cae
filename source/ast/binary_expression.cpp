#include <string>
#include <utility>

#include "binary_expression.hpp"

#include <fmt/format.h>

#include "visitor.hpp"

binary_expression::binary_expression(expression_ptr lft, token oprtr, expression_ptr rght)
    : left {std::move(lft)}
    , op {std::move(oprtr)}
    , right {std::move(rght)}
{
}

auto binary_expression::string() const -> std::string
{
    return fmt::format("({} {} {})", op.lexeme, left->string(), right->string());
}

void binary_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}
