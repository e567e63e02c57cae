#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "parser.hpp"

#include <ast/binary_expression.hpp>
#include <ast/expression.hpp>
#include <ast/grouping_expression.hpp>
#include <ast/literal_expression.hpp>
#include <ast/unary_expression.hpp>
#include <diagnostics/diagnostics.hpp>
#include <doctest/doctest.h>
#include <fmt/format.h>
#include <lexer/literal.hpp>
#include <lexer/scanner.hpp>
#include <lexer/token.hpp>
#include <lexer/token_type.hpp>

parser::parser(std::vector<token> tokens, diagnostics& diag)
    : m_tokens {std::move(tokens)}
    , m_diag {diag}
{
    if (m_tokens.empty() || m_tokens.back().type != token_type::eof) {
        throw std::invalid_argument("token sequence must end with eof");
    }
}

auto parser::parse() -> expression_ptr
{
    m_error.reset();
    m_depth = 0;
    m_height = 0;
    auto expr = parse_expression();
    if (expr == nullptr) {
        m_diag.report(m_error.value());
        synchronise();
        return {};
    }
    return expr;
}

auto parser::current_token() const -> const token&
{
    return m_tokens.at(m_current);
}

auto parser::parse_expression() -> expression_ptr
{
    return parse_equality();
}

auto parser::parse_equality() -> expression_ptr
{
    using enum token_type;
    return parse_binary_expression(&parser::parse_comparison, {not_equals, equals});
}

auto parser::parse_comparison() -> expression_ptr
{
    using enum token_type;
    return parse_binary_expression(&parser::parse_term, {greater_than, greater_equal, less_than, less_equal});
}

auto parser::parse_term() -> expression_ptr
{
    using enum token_type;
    return parse_binary_expression(&parser::parse_factor, {plus, minus});
}

auto parser::parse_factor() -> expression_ptr
{
    using enum token_type;
    return parse_binary_expression(&parser::parse_unary_expression, {slash, asterisk});
}

auto parser::parse_binary_expression(operand_parser operand, std::initializer_list<token_type> operators)
    -> expression_ptr
{
    auto left = (this->*operand)();
    if (left == nullptr) {
        return {};
    }
    while (get(operators)) {
        auto op = previous_token();
        const auto left_height = m_height;
        auto right = (this->*operand)();
        if (right == nullptr) {
            return {};
        }
        m_height = std::max(left_height, m_height) + 1;
        if (m_height > max_nesting_depth) {
            return new_error(op, "expression nested too deeply");
        }
        left = std::make_unique<binary_expression>(std::move(left), std::move(op), std::move(right));
    }
    return left;
}

auto parser::parse_unary_expression() -> expression_ptr
{
    using enum token_type;
    if (get({exclamation, minus})) {
        auto op = previous_token();
        if (m_depth >= max_nesting_depth) {
            return new_error(op, "expression nested too deeply");
        }
        m_depth++;
        auto right = parse_unary_expression();
        m_depth--;
        if (right == nullptr) {
            return {};
        }
        if (++m_height > max_nesting_depth) {
            return new_error(op, "expression nested too deeply");
        }
        return std::make_unique<unary_expression>(std::move(op), std::move(right));
    }
    return parse_primary();
}

auto parser::parse_primary() -> expression_ptr
{
    using enum token_type;
    const auto& tok = current_token();
    switch (tok.type) {
        case number:
        case string:
        case tru:
        case fals:
        case nil:
            next_token();
            return parse_literal(tok);
        case lparen:
            next_token();
            return parse_grouped_expression();
        default:
            return new_error(tok, "expected expression");
    }
}

auto parser::parse_grouped_expression() -> expression_ptr
{
    const auto paren = previous_token();
    if (m_depth >= max_nesting_depth) {
        return new_error(paren, "expression nested too deeply");
    }
    m_depth++;
    auto expr = parse_expression();
    m_depth--;
    if (expr == nullptr) {
        return {};
    }
    if (!get({token_type::rparen})) {
        return new_error(current_token(), "expected ')' after expression");
    }
    if (++m_height > max_nesting_depth) {
        return new_error(paren, "expression nested too deeply");
    }
    return std::make_unique<grouping_expression>(std::move(expr));
}

auto parser::parse_literal(const token& tok) -> expression_ptr
{
    using enum token_type;
    const auto holds_expected_literal = [&tok]
    {
        switch (tok.type) {
            case number:
                return std::holds_alternative<double>(tok.literal);
            case string:
                return std::holds_alternative<std::string>(tok.literal);
            case tru:
            case fals:
                return std::holds_alternative<bool>(tok.literal);
            default:
                return std::holds_alternative<std::monostate>(tok.literal);
        }
    }();
    if (!holds_expected_literal) {
        throw std::logic_error(fmt::format("literal of {} does not match its token type", tok));
    }
    m_height = 1;
    return std::make_unique<literal_expression>(tok.literal);
}

// Discards tokens up to the next point where a statement could start, so that one
// erroneous region produces one diagnostic.
auto parser::synchronise() -> void
{
    using enum token_type;
    next_token();
    while (!is_at_end()) {
        if (previous_token().type == semicolon) {
            return;
        }
        switch (current_token().type) {
            case klass:
            case fun:
            case var:
            case fore:
            case eef:
            case hwile:
            case print:
            case ret:
                return;
            default:
                next_token();
        }
    }
}

auto parser::next_token() -> void
{
    if (!is_at_end()) {
        m_current++;
    }
}

auto parser::get(std::initializer_list<token_type> types) -> bool
{
    for (const auto type : types) {
        if (current_token_is(type)) {
            next_token();
            return true;
        }
    }
    return false;
}

auto parser::current_token_is(token_type type) const -> bool
{
    return current_token().type == type;
}

auto parser::previous_token() const -> const token&
{
    if (m_current == 0) {
        throw std::out_of_range("no token has been consumed yet");
    }
    return m_tokens.at(m_current - 1);
}

auto parser::is_at_end() const -> bool
{
    return current_token_is(token_type::eof);
}

auto parse(std::vector<token> tokens, diagnostics& diag) -> expression_ptr
{
    return parser {std::move(tokens), diag}.parse();
}

namespace
{
// NOLINTBEGIN(*)
struct parsed
{
    std::ostringstream err;
    diagnostics diag {err};
    expression_ptr expr;
};

auto check_expression(std::string_view input) -> std::unique_ptr<parsed>
{
    auto result = std::make_unique<parsed>();
    result->expr = parse(scan(input, result->diag), result->diag);
    INFO("while parsing: `", input, "` got errors: ", result->err.str());
    CHECK_FALSE(result->diag.had_error());
    REQUIRE(result->expr != nullptr);
    return result;
}

auto check_syntax_error(std::string_view input) -> std::unique_ptr<parsed>
{
    auto result = std::make_unique<parsed>();
    result->expr = parse(scan(input, result->diag), result->diag);
    INFO("while parsing: `", input, "`");
    CHECK(result->diag.had_error());
    CHECK(result->expr == nullptr);
    return result;
}

TEST_SUITE_BEGIN("parsing");

TEST_CASE("literalExpressions")
{
    struct pt
    {
        std::string_view input;
        literal_value expected;
    };

    const std::vector<pt> tests {
        pt {"5", 5.0},
        pt {"2.25", 2.25},
        pt {R"("hi there")", std::string {"hi there"}},
        pt {"true", true},
        pt {"false", false},
        pt {"nil", std::monostate {}},
    };
    for (const auto& [input, expected] : tests) {
        const auto result = check_expression(input);
        const auto* lit = dynamic_cast<const literal_expression*>(result->expr.get());
        INFO("expected literal_expression, got: ", result->expr->string());
        REQUIRE(lit);
        CHECK(lit->value == expected);
    }
}

TEST_CASE("unaryExpressions")
{
    const auto result = check_expression("!-5");
    const auto* outer = dynamic_cast<const unary_expression*>(result->expr.get());
    REQUIRE(outer);
    CHECK_EQ(outer->op.type, token_type::exclamation);
    const auto* inner = dynamic_cast<const unary_expression*>(outer->right.get());
    REQUIRE(inner);
    CHECK_EQ(inner->op.type, token_type::minus);
    CHECK_EQ(result->expr->string(), "(! (- 5))");
}

TEST_CASE("binaryExpressions")
{
    using enum token_type;
    struct pt
    {
        std::string_view input;
        token_type op;
    };

    const std::vector<pt> tests {
        pt {"5 + 6", plus},
        pt {"5 - 6", minus},
        pt {"5 * 6", asterisk},
        pt {"5 / 6", slash},
        pt {"5 > 6", greater_than},
        pt {"5 >= 6", greater_equal},
        pt {"5 < 6", less_than},
        pt {"5 <= 6", less_equal},
        pt {"5 == 6", equals},
        pt {"5 != 6", not_equals},
    };
    for (const auto& [input, op] : tests) {
        const auto result = check_expression(input);
        const auto* binary = dynamic_cast<const binary_expression*>(result->expr.get());
        INFO("expected binary_expression for ", input, " got: ", result->expr->string());
        REQUIRE(binary);
        CHECK_EQ(binary->op.type, op);
        const auto* left = dynamic_cast<const literal_expression*>(binary->left.get());
        const auto* right = dynamic_cast<const literal_expression*>(binary->right.get());
        REQUIRE(left);
        REQUIRE(right);
        CHECK(left->value == literal_value {5.0});
        CHECK(right->value == literal_value {6.0});
    }
}

TEST_CASE("operatorPrecedence")
{
    struct pt
    {
        std::string_view input;
        std::string_view expected;
    };

    const std::vector<pt> tests {
        pt {"1 + 2 * 3", "(+ 1 (* 2 3))"},
        pt {"1 * 2 + 3", "(+ (* 1 2) 3)"},
        pt {"1 - 2 - 3", "(- (- 1 2) 3)"},
        pt {"8 / 4 / 2", "(/ (/ 8 4) 2)"},
        pt {"- - 1", "(- (- 1))"},
        pt {"-1 * 2", "(* (- 1) 2)"},
        pt {"!true == false", "(== (! true) false)"},
        pt {"1 + 2 < 4 == true", "(== (< (+ 1 2) 4) true)"},
        pt {"1 < 2 != 3 >= 4", "(!= (< 1 2) (>= 3 4))"},
        pt {"(1 + 2) * 3", "(* (group (+ 1 2)) 3)"},
        pt {"((1))", "(group (group 1))"},
        pt {R"("a" + "b")", "(+ a b)"},
        pt {"1 == 2 == 3", "(== (== 1 2) 3)"},
    };
    for (const auto& [input, expected] : tests) {
        const auto result = check_expression(input);
        CHECK_EQ(result->expr->string(), expected);
    }
}

TEST_CASE("tokensAfterTheExpressionAreIgnored")
{
    const auto result = check_expression("1 2");
    CHECK_EQ(result->expr->string(), "1");
}

TEST_CASE("missingClosingParen")
{
    const auto result = check_syntax_error("(1 + 2");
    REQUIRE_EQ(result->diag.messages().size(), 1U);
    CHECK_EQ(result->diag.messages()[0], "[line 1] Error at end of input: expected ')' after expression");
}

TEST_CASE("missingClosingParenBeforeToken")
{
    const auto result = check_syntax_error("(1 + 2 3)");
    REQUIRE_EQ(result->diag.messages().size(), 1U);
    CHECK_EQ(result->diag.messages()[0], "[line 1] Error at '3': expected ')' after expression");
}

TEST_CASE("expectedExpression")
{
    struct pt
    {
        std::string_view input;
        std::string_view expected;
    };

    const std::vector<pt> tests {
        pt {"", "[line 1] Error at end of input: expected expression"},
        pt {"1 +", "[line 1] Error at end of input: expected expression"},
        pt {"foo", "[line 1] Error at 'foo': expected expression"},
        pt {"1 *\n)", "[line 2] Error at ')': expected expression"},
        pt {"-", "[line 1] Error at end of input: expected expression"},
        pt {"var", "[line 1] Error at 'var': expected expression"},
    };
    for (const auto& [input, expected] : tests) {
        const auto result = check_syntax_error(input);
        REQUIRE_EQ(result->diag.messages().size(), 1U);
        CHECK_EQ(result->diag.messages()[0], expected);
    }
}

TEST_CASE("synchroniseStopsAfterSemicolon")
{
    std::ostringstream err;
    diagnostics quiet {err};
    auto prsr = parser {scan("1 + ) 2 3; 4", quiet), quiet};
    CHECK(prsr.parse() == nullptr);
    CHECK(quiet.had_error());
    CHECK_EQ(prsr.current_token().lexeme, "4");
}

TEST_CASE("synchroniseStopsBeforeStatementKeyword")
{
    using enum token_type;
    for (const auto keyword : {"class", "fun", "var", "for", "if", "while", "print", "return"}) {
        std::ostringstream err;
        diagnostics quiet {err};
        const auto input = fmt::format("* 1 2 {} 3", keyword);
        auto prsr = parser {scan(input, quiet), quiet};
        CHECK(prsr.parse() == nullptr);
        INFO("keyword: ", keyword);
        CHECK_EQ(prsr.current_token().lexeme, keyword);
        REQUIRE_EQ(quiet.messages().size(), 1U);
    }
}

TEST_CASE("synchroniseRunsToEndOfInput")
{
    std::ostringstream err;
    diagnostics quiet {err};
    auto prsr = parser {scan("(1 + 2 3 4 5", quiet), quiet};
    CHECK(prsr.parse() == nullptr);
    CHECK_EQ(prsr.current_token().type, token_type::eof);
}

TEST_CASE("deepNestingIsASyntaxError")
{
    struct pt
    {
        std::string input;
        std::string_view expected;
    };

    constexpr auto levels = std::size_t {200000};
    auto chain = std::string {"1"};
    for (std::size_t idx = 0; idx < levels; ++idx) {
        chain += " + 1";
    }
    const std::vector<pt> tests {
        pt {std::string(levels, '(') + "1" + std::string(levels, ')'),
            "[line 1] Error at '(': expression nested too deeply"},
        pt {std::string(levels, '-') + "1", "[line 1] Error at '-': expression nested too deeply"},
        pt {std::string(levels, '!') + "true", "[line 1] Error at '!': expression nested too deeply"},
        pt {chain, "[line 1] Error at '+': expression nested too deeply"},
    };
    for (const auto& [input, expected] : tests) {
        const auto result = check_syntax_error(input);
        REQUIRE_EQ(result->diag.messages().size(), 1U);
        CHECK_EQ(result->diag.messages()[0], expected);
    }
}

TEST_CASE("nestingUpToTheLimitParses")
{
    constexpr auto groups = max_nesting_depth - 1;
    const auto grouped = std::string(groups, '(') + "1" + std::string(groups, ')');
    const auto result = check_expression(grouped);
    const auto* group = dynamic_cast<const grouping_expression*>(result->expr.get());
    CHECK(group != nullptr);

    auto chain = std::string {"1"};
    for (std::size_t idx = 0; idx + 1 < max_nesting_depth; ++idx) {
        chain += " * 1";
    }
    CHECK(check_expression(chain)->expr != nullptr);
    CHECK(check_expression(std::string(max_nesting_depth - 1, '-') + "1")->expr != nullptr);
}

TEST_CASE("tokensMustEndWithEof")
{
    std::ostringstream err;
    diagnostics quiet {err};
    CHECK_THROWS_AS(parser({}, quiet), std::invalid_argument);
    CHECK_THROWS_AS(parser({token {.type = token_type::plus, .lexeme = "+", .line = 1}}, quiet),
                    std::invalid_argument);
}

TEST_CASE("mismatchedLiteralIsAProgrammerError")
{
    std::ostringstream err;
    diagnostics quiet {err};
    auto prsr = parser {{
                            token {.type = token_type::number, .lexeme = "1", .literal = std::string {"one"}, .line = 1},
                            token {.type = token_type::eof, .lexeme = "", .line = 1},
                        },
                        quiet};
    CHECK_THROWS_AS(prsr.parse(), std::logic_error);
}

TEST_SUITE_END();
// NOLINTEND(*)
}  // namespace
