#include <string>
#include <utility>
#include <variant>

#include "literal_expression.hpp"

#include <overloaded.hpp>
#include <util.hpp>

#include "visitor.hpp"

literal_expression::literal_expression(literal_value val)
    : value {std::move(val)}
{
}

auto literal_expression::string() const -> std::string
{
    return std::visit(overloaded {
                          [](const std::monostate& /*none*/) -> std::string { return "nil"; },
                          [](const std::string& val) -> std::string { return val; },
                          [](double val) -> std::string { return decimal_to_string(val); },
                          [](bool val) -> std::string { return val ? "true" : "false"; },
                      },
                      value);
}

void literal_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}
