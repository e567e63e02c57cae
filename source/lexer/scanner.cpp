#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <cstdlib>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "scanner.hpp"

#include <diagnostics/diagnostics.hpp>
#include <doctest/doctest.h>
#include <fmt/format.h>
#include <util.hpp>

#include "literal.hpp"
#include "token.hpp"
#include "token_type.hpp"

namespace
{
using char_literal_lookup_table =
    std::array<std::optional<token_type>, std::numeric_limits<unsigned char>::max() + 1>;

constexpr auto build_char_to_token_type_map() -> char_literal_lookup_table
{
    auto arr = char_literal_lookup_table {};
    using enum token_type;
    arr['('] = lparen;
    arr[')'] = rparen;
    arr['{'] = lsquirly;
    arr['}'] = rsquirly;
    arr[','] = comma;
    arr['.'] = dot;
    arr['-'] = minus;
    arr['+'] = plus;
    arr[';'] = semicolon;
    arr['*'] = asterisk;
    return arr;
}

constexpr auto char_literal_tokens = build_char_to_token_type_map();

// `! = < >` either stand alone or take a trailing `=`
struct two_char_token
{
    char first;
    token_type single;
    token_type with_equal;
};

constexpr std::array two_char_tokens {
    two_char_token {'!', token_type::exclamation, token_type::not_equals},
    two_char_token {'=', token_type::assign, token_type::equals},
    two_char_token {'<', token_type::less_than, token_type::less_equal},
    two_char_token {'>', token_type::greater_than, token_type::greater_equal},
};

constexpr auto keyword_count = 16;
using keyword_pair = std::pair<std::string_view, token_type>;
using keyword_lookup_table = std::array<keyword_pair, keyword_count>;

constexpr auto build_keyword_to_token_type_map() -> keyword_lookup_table
{
    return {
        std::pair {"and", token_type::logical_and},
        std::pair {"class", token_type::klass},
        std::pair {"else", token_type::elze},
        std::pair {"false", token_type::fals},
        std::pair {"for", token_type::fore},
        std::pair {"fun", token_type::fun},
        std::pair {"if", token_type::eef},
        std::pair {"nil", token_type::nil},
        std::pair {"or", token_type::logical_or},
        std::pair {"print", token_type::print},
        std::pair {"return", token_type::ret},
        std::pair {"super", token_type::super},
        std::pair {"this", token_type::thiz},
        std::pair {"true", token_type::tru},
        std::pair {"var", token_type::var},
        std::pair {"while", token_type::hwile},
    };
}

constexpr auto keyword_tokens = build_keyword_to_token_type_map();

inline auto is_letter(char chr) -> bool
{
    return std::isalpha(static_cast<unsigned char>(chr)) != 0 || chr == '_';
}

inline auto is_digit(char chr) -> bool
{
    return std::isdigit(static_cast<unsigned char>(chr)) != 0;
}

inline auto is_alpha_numeric(char chr) -> bool
{
    return is_letter(chr) || is_digit(chr);
}

inline auto is_utf8_lead(char chr) -> bool
{
    return (static_cast<unsigned char>(chr) & 0xC0U) == 0xC0U;
}

inline auto is_utf8_continuation(char chr) -> bool
{
    return (static_cast<unsigned char>(chr) & 0xC0U) == 0x80U;
}

}  // namespace

scanner::scanner(std::string_view input, diagnostics& diag)
    : m_input {input}
    , m_diag {diag}
{
}

auto scanner::scan_tokens() -> std::vector<token>
{
    while (!is_at_end()) {
        m_start = m_current;
        m_start_line = m_line;
        scan_token();
    }
    m_tokens.push_back(token {.type = token_type::eof, .lexeme = "", .literal = {}, .line = m_line});
    return std::move(m_tokens);
}

auto scanner::scan_token() -> void
{
    const auto chr = read_char();
    if (const auto type = char_literal_tokens[static_cast<unsigned char>(chr)]; type.has_value()) {
        add_token(type.value());
        return;
    }
    // NOLINTBEGIN(*-qualified-auto)
    const auto itr = std::find_if(
        two_char_tokens.cbegin(), two_char_tokens.cend(), [chr](const auto& two) { return two.first == chr; });
    // NOLINTEND(*-qualified-auto)
    if (itr != two_char_tokens.cend()) {
        add_token(match('=') ? itr->with_equal : itr->single);
        return;
    }
    switch (chr) {
        case '/':
            if (match('/')) {
                skip_comment();
                return;
            }
            add_token(token_type::slash);
            return;
        case ' ':
        case '\r':
        case '\t':
            return;
        case '\n':
            m_line++;
            return;
        case '"':
            read_string();
            return;
        default:
            break;
    }
    if (is_digit(chr)) {
        read_number();
        return;
    }
    if (is_letter(chr)) {
        read_identifier_or_keyword();
        return;
    }
    // a multibyte utf-8 character is reported once, with all of its bytes
    if (is_utf8_lead(chr)) {
        while (is_utf8_continuation(peek_char())) {
            m_current++;
        }
    }
    m_diag.error(m_line, fmt::format("unexpected character '{}'", m_input.substr(m_start, m_current - m_start)));
}

auto scanner::read_char() -> char
{
    return m_input[m_current++];
}

auto scanner::match(char expected) -> bool
{
    if (is_at_end() || m_input[m_current] != expected) {
        return false;
    }
    m_current++;
    return true;
}

auto scanner::peek_char() const -> char
{
    if (is_at_end()) {
        return '\0';
    }
    return m_input[m_current];
}

auto scanner::peek_next_char() const -> char
{
    if (m_current + 1 >= m_input.size()) {
        return '\0';
    }
    return m_input[m_current + 1];
}

auto scanner::is_at_end() const -> bool
{
    return m_current >= m_input.size();
}

auto scanner::skip_comment() -> void
{
    while (peek_char() != '\n' && !is_at_end()) {
        read_char();
    }
}

auto scanner::read_string() -> void
{
    while (peek_char() != '"' && !is_at_end()) {
        if (peek_char() == '\n') {
            m_line++;
        }
        read_char();
    }
    if (is_at_end()) {
        m_diag.error(m_line, "unterminated string");
        add_token(token_type::string, std::string {m_input.substr(m_start + 1, m_current - m_start - 1)});
        return;
    }
    read_char();
    add_token(token_type::string, std::string {m_input.substr(m_start + 1, m_current - m_start - 2)});
}

auto scanner::read_number() -> void
{
    while (is_digit(peek_char())) {
        read_char();
    }
    if (peek_char() == '.' && is_digit(peek_next_char())) {
        read_char();
        while (is_digit(peek_char())) {
            read_char();
        }
    }
    const auto lexeme = std::string {m_input.substr(m_start, m_current - m_start)};
    add_token(token_type::number, std::strtod(lexeme.c_str(), nullptr));
}

auto scanner::read_identifier_or_keyword() -> void
{
    while (is_alpha_numeric(peek_char())) {
        read_char();
    }
    const auto identifier_or_keyword = m_input.substr(m_start, m_current - m_start);
    // NOLINTBEGIN(*-qualified-auto)
    const auto itr =
        std::find_if(keyword_tokens.cbegin(),
                     keyword_tokens.cend(),
                     [&identifier_or_keyword](auto pair) -> bool { return pair.first == identifier_or_keyword; });
    // NOLINTEND(*-qualified-auto)
    if (itr == keyword_tokens.cend()) {
        add_token(token_type::ident);
        return;
    }
    switch (itr->second) {
        case token_type::tru:
            add_token(token_type::tru, true);
            return;
        case token_type::fals:
            add_token(token_type::fals, false);
            return;
        default:
            add_token(itr->second);
            return;
    }
}

auto scanner::add_token(token_type type, literal_value literal) -> void
{
    m_tokens.push_back(token {
        .type = type,
        .lexeme = std::string {m_input.substr(m_start, m_current - m_start)},
        .literal = std::move(literal),
        .line = m_start_line,
    });
}

auto scan(std::string_view input, diagnostics& diag) -> std::vector<token>
{
    return scanner {input, diag}.scan_tokens();
}

namespace
{
// NOLINTBEGIN(*)
struct quiet
{
    std::ostringstream err;
    diagnostics diag {err};
};

TEST_SUITE_BEGIN("scanner");

TEST_CASE("lexing")
{
    using enum token_type;
    quiet q;
    const auto tokens = scan(R"((){},.-+;/*
! != = == < <= > >=
and class else false fun for if nil or print return super this true var while
foo _bar b4z
"hello" 12.5 7
)",
                             q.diag);
    const std::vector<token> expected_tokens {
        token {.type = lparen, .lexeme = "(", .line = 1},
        token {.type = rparen, .lexeme = ")", .line = 1},
        token {.type = lsquirly, .lexeme = "{", .line = 1},
        token {.type = rsquirly, .lexeme = "}", .line = 1},
        token {.type = comma, .lexeme = ",", .line = 1},
        token {.type = dot, .lexeme = ".", .line = 1},
        token {.type = minus, .lexeme = "-", .line = 1},
        token {.type = plus, .lexeme = "+", .line = 1},
        token {.type = semicolon, .lexeme = ";", .line = 1},
        token {.type = slash, .lexeme = "/", .line = 1},
        token {.type = asterisk, .lexeme = "*", .line = 1},
        token {.type = exclamation, .lexeme = "!", .line = 2},
        token {.type = not_equals, .lexeme = "!=", .line = 2},
        token {.type = assign, .lexeme = "=", .line = 2},
        token {.type = equals, .lexeme = "==", .line = 2},
        token {.type = less_than, .lexeme = "<", .line = 2},
        token {.type = less_equal, .lexeme = "<=", .line = 2},
        token {.type = greater_than, .lexeme = ">", .line = 2},
        token {.type = greater_equal, .lexeme = ">=", .line = 2},
        token {.type = logical_and, .lexeme = "and", .line = 3},
        token {.type = klass, .lexeme = "class", .line = 3},
        token {.type = elze, .lexeme = "else", .line = 3},
        token {.type = fals, .lexeme = "false", .literal = false, .line = 3},
        token {.type = fun, .lexeme = "fun", .line = 3},
        token {.type = fore, .lexeme = "for", .line = 3},
        token {.type = eef, .lexeme = "if", .line = 3},
        token {.type = nil, .lexeme = "nil", .line = 3},
        token {.type = logical_or, .lexeme = "or", .line = 3},
        token {.type = print, .lexeme = "print", .line = 3},
        token {.type = ret, .lexeme = "return", .line = 3},
        token {.type = super, .lexeme = "super", .line = 3},
        token {.type = thiz, .lexeme = "this", .line = 3},
        token {.type = tru, .lexeme = "true", .literal = true, .line = 3},
        token {.type = var, .lexeme = "var", .line = 3},
        token {.type = hwile, .lexeme = "while", .line = 3},
        token {.type = ident, .lexeme = "foo", .line = 4},
        token {.type = ident, .lexeme = "_bar", .line = 4},
        token {.type = ident, .lexeme = "b4z", .line = 4},
        token {.type = string, .lexeme = R"("hello")", .literal = std::string {"hello"}, .line = 5},
        token {.type = number, .lexeme = "12.5", .literal = 12.5, .line = 5},
        token {.type = number, .lexeme = "7", .literal = 7.0, .line = 5},
        token {.type = eof, .lexeme = "", .line = 6},
    };
    REQUIRE_EQ(tokens.size(), expected_tokens.size());
    for (std::size_t idx = 0; idx < tokens.size(); ++idx) {
        CHECK_EQ(tokens[idx], expected_tokens[idx]);
    }
    CHECK_FALSE(q.diag.had_error());
}

TEST_CASE("numberLiteralsRenderBackToTheirLexeme")
{
    quiet q;
    const std::vector<std::string_view> lexemes {
        "0",
        "7",
        "42",
        "3.14",
        "0.5",
        "100.25",
        "12345.678",
        "1024",
        "10000000000000000",
        "100000000000000000000",
        "0.0000001",
        "0.000123",
    };
    for (const auto lexeme : lexemes) {
        const auto tokens = scan(lexeme, q.diag);
        INFO("lexeme: ", lexeme);
        REQUIRE_EQ(tokens.size(), 2U);
        REQUIRE_EQ(tokens[0].type, token_type::number);
        const auto value = std::get<double>(tokens[0].literal);
        CHECK_EQ(decimal_to_string(value), lexeme);
    }
    CHECK_FALSE(q.diag.had_error());
}

TEST_CASE("trailingDotIsNotPartOfTheNumber")
{
    using enum token_type;
    quiet q;
    const auto tokens = scan("1. .5", q.diag);
    REQUIRE_EQ(tokens.size(), 5U);
    CHECK_EQ(tokens[0], token {.type = number, .lexeme = "1", .literal = 1.0, .line = 1});
    CHECK_EQ(tokens[1].type, dot);
    CHECK_EQ(tokens[2].type, dot);
    CHECK_EQ(tokens[3], token {.type = number, .lexeme = "5", .literal = 5.0, .line = 1});
    CHECK_EQ(tokens[4].type, eof);
}

TEST_CASE("commentsAndWhitespace")
{
    using enum token_type;
    quiet q;
    const auto tokens = scan("1 // ignored + - \"\n\t2 / 3\r\n", q.diag);
    REQUIRE_EQ(tokens.size(), 5U);
    CHECK_EQ(tokens[0].line, 1U);
    CHECK_EQ(tokens[1], token {.type = number, .lexeme = "2", .literal = 2.0, .line = 2});
    CHECK_EQ(tokens[2], token {.type = slash, .lexeme = "/", .line = 2});
    CHECK_EQ(tokens[3].line, 2U);
    CHECK_EQ(tokens[4], token {.type = eof, .lexeme = "", .line = 3});
    CHECK_FALSE(q.diag.had_error());
}

TEST_CASE("multiLineStringStartsOnItsFirstLine")
{
    quiet q;
    const auto tokens = scan("\"one\ntwo\" 3", q.diag);
    REQUIRE_EQ(tokens.size(), 3U);
    CHECK_EQ(tokens[0].line, 1U);
    CHECK_EQ(std::get<std::string>(tokens[0].literal), "one\ntwo");
    CHECK_EQ(tokens[1].line, 2U);
}

TEST_CASE("unterminatedString")
{
    quiet q;
    const auto tokens = scan(R"("abc)", q.diag);
    REQUIRE_EQ(tokens.size(), 2U);
    CHECK_EQ(tokens[0].type, token_type::string);
    CHECK_EQ(std::get<std::string>(tokens[0].literal), "abc");
    CHECK_EQ(tokens[1].type, token_type::eof);
    CHECK(q.diag.had_error());
    REQUIRE_EQ(q.diag.messages().size(), 1U);
    CHECK_EQ(q.diag.messages()[0], "[line 1] Error: unterminated string");
}

TEST_CASE("unexpectedCharacterIsSkipped")
{
    using enum token_type;
    quiet q;
    const auto tokens = scan("1 @ 2 # 3", q.diag);
    REQUIRE_EQ(tokens.size(), 4U);
    CHECK_EQ(tokens[0].type, number);
    CHECK_EQ(tokens[1].type, number);
    CHECK_EQ(tokens[2].type, number);
    CHECK_EQ(tokens[3].type, eof);
    REQUIRE_EQ(q.diag.messages().size(), 2U);
    CHECK_EQ(q.diag.messages()[0], "[line 1] Error: unexpected character '@'");
    CHECK_EQ(q.diag.messages()[1], "[line 1] Error: unexpected character '#'");
}

TEST_CASE("multibyteCharacterIsReportedOnce")
{
    using enum token_type;
    quiet q;
    const auto tokens = scan("1 + \xC3\xA9 2 \xE2\x82\xAC", q.diag);
    REQUIRE_EQ(tokens.size(), 4U);
    CHECK_EQ(tokens[0].type, number);
    CHECK_EQ(tokens[1].type, plus);
    CHECK_EQ(tokens[2], token {.type = number, .lexeme = "2", .literal = 2.0, .line = 1});
    CHECK_EQ(tokens[3].type, eof);
    REQUIRE_EQ(q.diag.messages().size(), 2U);
    CHECK_EQ(q.diag.messages()[0], "[line 1] Error: unexpected character '\xC3\xA9'");
    CHECK_EQ(q.diag.messages()[1], "[line 1] Error: unexpected character '\xE2\x82\xAC'");
}

TEST_CASE("emptyInput")
{
    quiet q;
    const auto tokens = scan("", q.diag);
    REQUIRE_EQ(tokens.size(), 1U);
    CHECK_EQ(tokens[0], token {.type = token_type::eof, .lexeme = "", .line = 1});
}

TEST_SUITE_END();
// NOLINTEND(*)
}  // namespace
