#pragma once

#include <ast/binary_expression.hpp>
#include <ast/grouping_expression.hpp>
#include <ast/literal_expression.hpp>
#include <ast/unary_expression.hpp>

struct visitor
{
    visitor(const visitor&) = delete;
    visitor(visitor&&) = delete;
    auto operator=(const visitor&) -> visitor& = delete;
    auto operator=(visitor&&) -> visitor& = delete;
    visitor() = default;
    virtual ~visitor() = default;

    virtual void visit(const binary_expression& expr) = 0;
    virtual void visit(const grouping_expression& expr) = 0;
    virtual void visit(const literal_expression& expr) = 0;
    virtual void visit(const unary_expression& expr) = 0;
};
