#pragma once

#include <string>

#include <lexer/literal.hpp>

#include "expression.hpp"

struct literal_expression final : expression
{
    explicit literal_expression(literal_value val);
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    literal_value value;
};
