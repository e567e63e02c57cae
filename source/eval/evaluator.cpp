#include <cmath>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "evaluator.hpp"

#include <ast/binary_expression.hpp>
#include <ast/expression.hpp>
#include <ast/grouping_expression.hpp>
#include <ast/literal_expression.hpp>
#include <ast/unary_expression.hpp>
#include <diagnostics/diagnostics.hpp>
#include <doctest/doctest.h>
#include <fmt/format.h>
#include <lexer/scanner.hpp>
#include <lexer/token.hpp>
#include <lexer/token_type.hpp>
#include <overloaded.hpp>
#include <parser/parser.hpp>

#include "value.hpp"

auto evaluator::evaluate(const expression& expr) -> eval_result
{
    m_result = value {};
    m_error.reset();
    expr.accept(*this);
    if (m_error.has_value()) {
        return std::move(m_error).value();
    }
    return std::move(m_result);
}

auto evaluator::number_operands(const token& op, const value& left, const value& right)
    -> std::optional<std::pair<double, double>>
{
    using enum value::value_type;
    if (left.is(number) && right.is(number)) {
        return std::pair {left.as<double>(), right.as<double>()};
    }
    m_error = runtime_error {
        .op = op,
        .message = fmt::format(
            "operands '{}' and '{}' must both be numbers for operator '{}'", left.inspect(), right.inspect(), op.lexeme),
    };
    return std::nullopt;
}

void evaluator::visit(const binary_expression& expr)
{
    expr.left->accept(*this);
    if (m_error.has_value()) {
        return;
    }
    const auto left = std::move(m_result);
    expr.right->accept(*this);
    if (m_error.has_value()) {
        return;
    }
    const auto right = std::move(m_result);

    using enum token_type;
    switch (expr.op.type) {
        case equals:
            m_result = value {left == right};
            return;
        case not_equals:
            m_result = value {left != right};
            return;
        case plus:
            if (left.is(value::value_type::number) && right.is(value::value_type::number)) {
                m_result = value {left.as<double>() + right.as<double>()};
                return;
            }
            if (left.is(value::value_type::string) && right.is(value::value_type::string)) {
                m_result = value {left.as<std::string>() + right.as<std::string>()};
                return;
            }
            m_error = runtime_error {
                .op = expr.op,
                .message = fmt::format("operands '{}' and '{}' must both be numbers or strings for operator '+'",
                                       left.inspect(),
                                       right.inspect()),
            };
            return;
        default:
            break;
    }

    const auto operands = number_operands(expr.op, left, right);
    if (!operands.has_value()) {
        return;
    }
    const auto [lhs, rhs] = operands.value();
    switch (expr.op.type) {
        case minus:
            m_result = value {lhs - rhs};
            return;
        case asterisk:
            m_result = value {lhs * rhs};
            return;
        case slash:
            m_result = value {lhs / rhs};
            return;
        case greater_than:
            m_result = value {lhs > rhs};
            return;
        case greater_equal:
            m_result = value {lhs >= rhs};
            return;
        case less_than:
            m_result = value {lhs < rhs};
            return;
        case less_equal:
            m_result = value {lhs <= rhs};
            return;
        default:
            throw std::logic_error(fmt::format("unhandled binary operator {}", expr.op.type));
    }
}

void evaluator::visit(const grouping_expression& expr)
{
    expr.inner->accept(*this);
}

void evaluator::visit(const literal_expression& expr)
{
    m_result = value::from_literal(expr.value);
}

void evaluator::visit(const unary_expression& expr)
{
    expr.right->accept(*this);
    if (m_error.has_value()) {
        return;
    }
    using enum token_type;
    switch (expr.op.type) {
        case exclamation:
            m_result = value {!m_result.is_truthy()};
            return;
        case minus:
            if (m_result.is(value::value_type::number)) {
                m_result = value {-m_result.as<double>()};
                return;
            }
            m_error = runtime_error {
                .op = expr.op,
                .message = fmt::format("operand '{}' must be a number to apply operator '{}'",
                                       m_result.inspect(),
                                       expr.op.lexeme),
            };
            return;
        default:
            throw std::logic_error(fmt::format("unhandled unary operator {}", expr.op.type));
    }
}

auto interpret(const expression& expr, diagnostics& diag) -> std::optional<value>
{
    evaluator eval;
    auto result = eval.evaluate(expr);
    return std::visit(overloaded {
                          [](value& val) -> std::optional<value> { return std::move(val); },
                          [&diag](const runtime_error& err) -> std::optional<value>
                          {
                              diag.report(err);
                              return std::nullopt;
                          },
                      },
                      result);
}

namespace
{
// NOLINTBEGIN(*)
struct evaluated
{
    std::ostringstream err;
    diagnostics diag {err};
    eval_result result;
};

auto run(std::string_view input) -> std::unique_ptr<evaluated>
{
    auto out = std::make_unique<evaluated>();
    auto expr = parse(scan(input, out->diag), out->diag);
    INFO("while parsing: `", input, "` got: ", out->err.str());
    REQUIRE_FALSE(out->diag.had_error());
    REQUIRE(expr != nullptr);
    evaluator eval;
    out->result = eval.evaluate(*expr);
    return out;
}

auto require_value(std::string_view input) -> value
{
    const auto out = run(input);
    const auto* val = std::get_if<value>(&out->result);
    INFO(input, " expected a value, got runtime error: ",
         std::holds_alternative<runtime_error>(out->result) ? std::get<runtime_error>(out->result).message : "");
    REQUIRE(val != nullptr);
    return *val;
}

auto require_error(std::string_view input) -> runtime_error
{
    const auto out = run(input);
    const auto* err = std::get_if<runtime_error>(&out->result);
    INFO(input, " expected a runtime error");
    REQUIRE(err != nullptr);
    return *err;
}

TEST_SUITE_BEGIN("eval");

TEST_CASE("numberExpression")
{
    struct et
    {
        std::string_view input;
        double expected;
    };

    const std::vector<et> tests {
        et {"5", 5},
        et {"10.5", 10.5},
        et {"-5", -5},
        et {"--5", 5},
        et {"1 + 2", 3},
        et {"5 + 5 + 5 + 5 - 10", 10},
        et {"2 * 2 * 2 * 2 * 2", 32},
        et {"-50 + 100 + -50", 0},
        et {"5 * 2 + 10", 20},
        et {"5 + 2 * 10", 25},
        et {"20 + 2 * -10", 0},
        et {"50 / 2 * 2 + 10", 60},
        et {"2 * (5 + 10)", 30},
        et {"3 * 3 * 3 + 10", 37},
        et {"3 * (3 * 3) + 10", 37},
        et {"(5 + 10 * 2 + 15 / 3) * 2 + -10", 50},
        et {"(1 + 2) * 3", 9},
        et {"7 / 2", 3.5},
        et {"0.1 + 0.2", 0.1 + 0.2},
    };
    for (const auto& [input, expected] : tests) {
        const auto val = require_value(input);
        INFO(input, " got: ", val);
        REQUIRE(val.is(value::value_type::number));
        CHECK_EQ(val.as<double>(), expected);
    }
}

TEST_CASE("divisionByZeroFollowsFloatingPoint")
{
    CHECK_EQ(require_value("1 / 0").inspect(), "inf");
    CHECK_EQ(require_value("-1 / 0").inspect(), "-inf");
    const auto nan = require_value("0 / 0");
    REQUIRE(nan.is(value::value_type::number));
    CHECK(std::isnan(nan.as<double>()));
    CHECK_EQ(require_value("0 / 0 == 0 / 0"), value {false});
}

TEST_CASE("booleanExpression")
{
    struct et
    {
        std::string_view input;
        bool expected;
    };

    const std::vector<et> tests {
        et {"true", true},
        et {"false", false},
        et {"1 < 2", true},
        et {"1 > 2", false},
        et {"1 < 1", false},
        et {"1 <= 1", true},
        et {"1 >= 2", false},
        et {"2 >= 2", true},
        et {"1 == 1", true},
        et {"1 != 1", false},
        et {"1 == 2", false},
        et {"1 != 2", true},
        et {"1 == 1.0", true},
        et {R"(1 == "1")", false},
        et {R"("a" == "a")", true},
        et {R"("a" != "b")", true},
        et {"nil == nil", true},
        et {"nil == false", false},
        et {"0 == false", false},
        et {"true == true", true},
        et {"false == false", true},
        et {"true == false", false},
        et {"(1 < 2) == true", true},
        et {"(1 > 2) == false", true},
    };
    for (const auto& [input, expected] : tests) {
        const auto val = require_value(input);
        INFO(input, " got: ", val);
        CHECK_EQ(val, value {expected});
    }
}

TEST_CASE("bangOperator")
{
    struct et
    {
        std::string_view input;
        bool expected;
    };

    const std::vector<et> tests {
        et {"!true", false},
        et {"!false", true},
        et {"!nil", true},
        et {"!0", false},
        et {"!5", false},
        et {R"(!"a")", false},
        et {R"(!"")", false},
        et {"!!true", true},
        et {"!!false", false},
        et {"!!5", true},
        et {"!!nil", false},
    };
    for (const auto& [input, expected] : tests) {
        CHECK_EQ(require_value(input), value {expected});
    }
}

TEST_CASE("stringExpressions")
{
    CHECK_EQ(require_value(R"("Hello World!")"), value {"Hello World!"});
    CHECK_EQ(require_value(R"("a" + "b")"), value {"ab"});
    CHECK_EQ(require_value(R"("Hello" + " " + "World!")"), value {"Hello World!"});
    CHECK_EQ(require_value(R"("" + "")"), value {""});
}

TEST_CASE("nilAndGrouping")
{
    CHECK_EQ(require_value("nil"), value {});
    CHECK_EQ(require_value("(nil)").inspect(), "nil");
    CHECK_EQ(require_value("((\"x\"))"), value {"x"});
}

TEST_CASE("errorHandling")
{
    struct et
    {
        std::string_view input;
        std::string_view expected;
    };

    const std::vector<et> tests {
        et {R"(-"abc")", "operand 'abc' must be a number to apply operator '-'"},
        et {"-true", "operand 'true' must be a number to apply operator '-'"},
        et {"-nil", "operand 'nil' must be a number to apply operator '-'"},
        et {R"("a" + 1)", "operands 'a' and '1' must both be numbers or strings for operator '+'"},
        et {R"(1 + "a")", "operands '1' and 'a' must both be numbers or strings for operator '+'"},
        et {"true + false", "operands 'true' and 'false' must both be numbers or strings for operator '+'"},
        et {R"("a" - "b")", "operands 'a' and 'b' must both be numbers for operator '-'"},
        et {"2 * nil", "operands '2' and 'nil' must both be numbers for operator '*'"},
        et {"true / 1", "operands 'true' and '1' must both be numbers for operator '/'"},
        et {R"("a" < "b")", "operands 'a' and 'b' must both be numbers for operator '<'"},
        et {"1 <= nil", "operands '1' and 'nil' must both be numbers for operator '<='"},
        et {"false > 1", "operands 'false' and '1' must both be numbers for operator '>'"},
        et {"1 >= true", "operands '1' and 'true' must both be numbers for operator '>='"},
        et {"(-true) + 1", "operand 'true' must be a number to apply operator '-'"},
        et {"1 + 2 * (3 - \"x\")", "operands '3' and 'x' must both be numbers for operator '-'"},
    };
    for (const auto& [input, expected] : tests) {
        const auto err = require_error(input);
        CHECK_EQ(err.message, expected);
    }
}

TEST_CASE("runtimeErrorCarriesOperatorLine")
{
    const auto err = require_error("1 +\n\n\"a\"\n* 2");
    CHECK_EQ(err.op.type, token_type::asterisk);
    CHECK_EQ(err.op.line, 4U);
}

TEST_CASE("interpretReportsRuntimeErrors")
{
    std::ostringstream err;
    diagnostics diag {err};
    const auto expr = parse(scan("-\"abc\"", diag), diag);
    REQUIRE(expr != nullptr);
    CHECK_FALSE(interpret(*expr, diag).has_value());
    CHECK(diag.had_runtime_error());
    CHECK_FALSE(diag.had_error());
    CHECK_EQ(err.str(), "[line 1] Error: operand 'abc' must be a number to apply operator '-'\n");

    const auto ok = parse(scan("1 + 2", diag), diag);
    REQUIRE(ok != nullptr);
    const auto val = interpret(*ok, diag);
    REQUIRE(val.has_value());
    CHECK_EQ(val.value(), value {3.0});
}

TEST_CASE("evaluatorIsReusable")
{
    std::ostringstream err;
    diagnostics diag {err};
    const auto bad = parse(scan("-nil", diag), diag);
    const auto good = parse(scan("2 * 21", diag), diag);
    REQUIRE(bad != nullptr);
    REQUIRE(good != nullptr);
    evaluator eval;
    CHECK(std::holds_alternative<runtime_error>(eval.evaluate(*bad)));
    const auto result = eval.evaluate(*good);
    REQUIRE(std::holds_alternative<value>(result));
    CHECK_EQ(std::get<value>(result), value {42.0});
}

TEST_SUITE_END();
// NOLINTEND(*)
}  // namespace
