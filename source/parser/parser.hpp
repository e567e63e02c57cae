#pragma once

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <ast/expression.hpp>
#include <diagnostics/diagnostics.hpp>
#include <diagnostics/errors.hpp>
#include <fmt/format.h>
#include <lexer/token.hpp>
#include <lexer/token_type.hpp>

// the parser, the evaluator and the tree's destructors all recurse once per level
constexpr std::size_t max_nesting_depth = 512;

class parser final
{
  public:
    // tokens must end with an eof token, as scan() produces them
    parser(std::vector<token> tokens, diagnostics& diag);

    // one expression, or an empty pointer after the syntax error has been reported
    auto parse() -> expression_ptr;

    [[nodiscard]] auto current_token() const -> const token&;

  private:
    using operand_parser = expression_ptr (parser::*)();

    auto parse_expression() -> expression_ptr;
    auto parse_equality() -> expression_ptr;
    auto parse_comparison() -> expression_ptr;
    auto parse_term() -> expression_ptr;
    auto parse_factor() -> expression_ptr;
    auto parse_binary_expression(operand_parser operand, std::initializer_list<token_type> operators)
        -> expression_ptr;
    auto parse_unary_expression() -> expression_ptr;
    auto parse_primary() -> expression_ptr;
    auto parse_grouped_expression() -> expression_ptr;
    auto parse_literal(const token& tok) -> expression_ptr;

    auto synchronise() -> void;
    auto next_token() -> void;
    auto get(std::initializer_list<token_type> types) -> bool;
    [[nodiscard]] auto current_token_is(token_type type) const -> bool;
    [[nodiscard]] auto previous_token() const -> const token&;
    [[nodiscard]] auto is_at_end() const -> bool;

    template<typename... T>
    auto new_error(const token& where, fmt::format_string<T...> fmt, T&&... args) -> expression_ptr
    {
        m_error = syntax_error {.tok = where, .message = fmt::format(fmt, std::forward<T>(args)...)};
        return {};
    }

    std::vector<token> m_tokens;
    std::size_t m_current {0};
    // open groups and unary operators around the operand being parsed
    std::size_t m_depth {0};
    // height of the tree returned last, checked against max_nesting_depth
    std::size_t m_height {0};
    diagnostics& m_diag;
    std::optional<syntax_error> m_error;
};

auto parse(std::vector<token> tokens, diagnostics& diag) -> expression_ptr;
