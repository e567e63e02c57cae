#include <cstddef>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "diagnostics.hpp"

#include <doctest/doctest.h>
#include <fmt/format.h>
#include <fmt/ostream.h>
#include <lexer/token.hpp>
#include <lexer/token_type.hpp>

diagnostics::diagnostics(std::ostream& err)
    : m_err {err}
{
}

auto diagnostics::error(std::size_t line, std::string_view message) -> void
{
    m_had_error = true;
    emit(fmt::format("[line {}] Error: {}", line, message));
}

auto diagnostics::report(std::size_t line, std::string_view where, std::string_view message) -> void
{
    m_had_error = true;
    emit(fmt::format("[line {}] Error {}: {}", line, where, message));
}

auto diagnostics::report(const syntax_error& err) -> void
{
    if (err.tok.type == token_type::eof) {
        report(err.tok.line, "at end of input", err.message);
        return;
    }
    report(err.tok.line, fmt::format("at '{}'", err.tok.lexeme), err.message);
}

auto diagnostics::report(const runtime_error& err) -> void
{
    m_had_runtime_error = true;
    emit(fmt::format("[line {}] Error: {}", err.op.line, err.message));
}

auto diagnostics::had_error() const -> bool
{
    return m_had_error;
}

auto diagnostics::had_runtime_error() const -> bool
{
    return m_had_runtime_error;
}

auto diagnostics::messages() const -> const std::vector<std::string>&
{
    return m_messages;
}

auto diagnostics::reset() -> void
{
    m_had_error = false;
    m_messages.clear();
}

auto diagnostics::emit(std::string message) -> void
{
    fmt::print(m_err, "{}\n", message);
    m_messages.push_back(std::move(message));
}

namespace
{
// NOLINTBEGIN(*)
TEST_SUITE_BEGIN("diagnostics");

TEST_CASE("scannerErrorsSetTheErrorFlag")
{
    std::ostringstream err;
    diagnostics diag {err};
    REQUIRE_FALSE(diag.had_error());
    diag.error(3, "unexpected character '@'");
    CHECK(diag.had_error());
    CHECK_FALSE(diag.had_runtime_error());
    CHECK_EQ(err.str(), "[line 3] Error: unexpected character '@'\n");
}

TEST_CASE("syntaxErrorLocation")
{
    using enum token_type;
    std::ostringstream err;
    diagnostics diag {err};
    diag.report(syntax_error {.tok = {.type = rparen, .lexeme = ")", .line = 2}, .message = "expected expression"});
    diag.report(syntax_error {.tok = {.type = eof, .lexeme = "", .line = 4},
                              .message = "expected ')' after expression"});
    REQUIRE_EQ(diag.messages().size(), 2U);
    CHECK_EQ(diag.messages()[0], "[line 2] Error at ')': expected expression");
    CHECK_EQ(diag.messages()[1], "[line 4] Error at end of input: expected ')' after expression");
    CHECK(diag.had_error());
    CHECK_FALSE(diag.had_runtime_error());
}

TEST_CASE("runtimeErrorsSetOnlyTheRuntimeFlag")
{
    std::ostringstream err;
    diagnostics diag {err};
    diag.report(runtime_error {.op = {.type = token_type::minus, .lexeme = "-", .line = 7},
                               .message = "operand 'abc' must be a number to apply operator '-'"});
    CHECK(diag.had_runtime_error());
    CHECK_FALSE(diag.had_error());
    CHECK_EQ(err.str(), "[line 7] Error: operand 'abc' must be a number to apply operator '-'\n");
}

TEST_CASE("resetClearsOnlyTheSyntaxFlag")
{
    std::ostringstream err;
    diagnostics diag {err};
    diag.error(1, "unterminated string");
    diag.report(runtime_error {.op = {.type = token_type::plus, .lexeme = "+", .line = 1}, .message = "boom"});
    REQUIRE_EQ(diag.messages().size(), 2U);
    diag.reset();
    CHECK_FALSE(diag.had_error());
    CHECK(diag.had_runtime_error());
    CHECK(diag.messages().empty());
}

TEST_CASE("messagesDoNotAccumulateAcrossResets")
{
    std::ostringstream err;
    diagnostics diag {err};
    for (int line = 1; line <= 3; ++line) {
        diag.error(static_cast<std::size_t>(line), "unexpected character '@'");
        diag.reset();
    }
    diag.error(4, "unterminated string");
    REQUIRE_EQ(diag.messages().size(), 1U);
    CHECK_EQ(diag.messages()[0], "[line 4] Error: unterminated string");
}

TEST_SUITE_END();
// NOLINTEND(*)
}  // namespace
