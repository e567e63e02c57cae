#include <string>
#include <utility>

#include "unary_expression.hpp"

#include <fmt/format.h>

#include "visitor.hpp"

unary_expression::unary_expression(token oprtr, expression_ptr rght)
    : op {std::move(oprtr)}
    , right {std::move(rght)}
{
}

auto unary_expression::string() const -> std::string
{
    return fmt::format("({} {})", op.lexeme, right->string());
}

void unary_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}
