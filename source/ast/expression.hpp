#pragma once

#include <memory>
#include <string>

struct expression
{
    expression() = default;
    virtual ~expression() = default;
    expression(const expression&) = delete;
    expression(expression&&) = delete;
    auto operator=(const expression&) -> expression& = delete;
    auto operator=(expression&&) -> expression& = delete;

    // parenthesised prefix form, e.g. (* (group (+ 1 2)) 3)
    [[nodiscard]] virtual auto string() const -> std::string = 0;
    virtual void accept(struct visitor& visitor) const = 0;
};

using expression_ptr = std::unique_ptr<expression>;
