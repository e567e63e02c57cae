#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

#include <diagnostics/diagnostics.hpp>

#include "literal.hpp"
#include "token.hpp"
#include "token_type.hpp"

class scanner final
{
  public:
    scanner(std::string_view input, diagnostics& diag);

    // always ends with exactly one eof token, bad input is reported and skipped
    auto scan_tokens() -> std::vector<token>;

  private:
    auto scan_token() -> void;
    auto read_char() -> char;
    auto match(char expected) -> bool;
    [[nodiscard]] auto peek_char() const -> char;
    [[nodiscard]] auto peek_next_char() const -> char;
    [[nodiscard]] auto is_at_end() const -> bool;
    auto skip_comment() -> void;
    auto read_string() -> void;
    auto read_number() -> void;
    auto read_identifier_or_keyword() -> void;
    auto add_token(token_type type, literal_value literal = {}) -> void;

    std::string_view m_input;
    diagnostics& m_diag;
    std::vector<token> m_tokens;
    std::string_view::size_type m_start {0};
    std::string_view::size_type m_current {0};
    std::size_t m_line {1};
    std::size_t m_start_line {1};
};

auto scan(std::string_view input, diagnostics& diag) -> std::vector<token>;
