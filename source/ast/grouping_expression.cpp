#include <string>
#include <utility>

#include "grouping_expression.hpp"

#include <fmt/format.h>

#include "visitor.hpp"

grouping_expression::grouping_expression(expression_ptr expr)
    : inner {std::move(expr)}
{
}

auto grouping_expression::string() const -> std::string
{
    return fmt::format("(group {})", inner->string());
}

void grouping_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}
