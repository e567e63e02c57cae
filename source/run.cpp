#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#include "run.hpp"

#include <diagnostics/diagnostics.hpp>
#include <doctest/doctest.h>
#include <eval/evaluator.hpp>
#include <fmt/ostream.h>
#include <lexer/scanner.hpp>
#include <parser/parser.hpp>

auto run(std::string_view source, diagnostics& diag, std::ostream& out, std::ostream* trace) -> void
{
    auto tokens = scan(source, diag);
    const auto expr = parse(std::move(tokens), diag);
    if (diag.had_error() || expr == nullptr) {
        return;
    }
    if (trace != nullptr) {
        fmt::print(*trace, "{}\n", expr->string());
    }
    if (const auto result = interpret(*expr, diag); result.has_value()) {
        fmt::print(out, "{}\n", result->inspect());
    }
}

namespace
{
// NOLINTBEGIN(*)
TEST_SUITE_BEGIN("run");

TEST_CASE("printsTheValue")
{
    std::ostringstream err;
    std::ostringstream out;
    diagnostics diag {err};
    run("(1 + 2) * 3", diag, out);
    run(R"("a" + "b")", diag, out);
    run("1 == \"1\"", diag, out);
    run("nil", diag, out);
    CHECK_EQ(out.str(), "9\nab\nfalse\nnil\n");
    CHECK(err.str().empty());
}

TEST_CASE("scanErrorSkipsEvaluation")
{
    std::ostringstream err;
    std::ostringstream out;
    diagnostics diag {err};
    run("1 + 2 @", diag, out);
    CHECK(diag.had_error());
    CHECK(out.str().empty());
    CHECK_EQ(err.str(), "[line 1] Error: unexpected character '@'\n");
}

TEST_CASE("unterminatedStringReportsOnce")
{
    std::ostringstream err;
    std::ostringstream out;
    diagnostics diag {err};
    run(R"("abc)", diag, out);
    CHECK(diag.had_error());
    CHECK_EQ(diag.messages().size(), 1U);
    CHECK(out.str().empty());
}

TEST_CASE("syntaxErrorDoesNotLeakIntoTheNextLine")
{
    std::ostringstream err;
    std::ostringstream out;
    diagnostics diag {err};
    run("(1 +", diag, out);
    CHECK(diag.had_error());
    diag.reset();
    run("1 + 1", diag, out);
    CHECK_FALSE(diag.had_error());
    CHECK(diag.messages().empty());
    CHECK_EQ(out.str(), "2\n");
}

TEST_CASE("runtimeErrorIsReported")
{
    std::ostringstream err;
    std::ostringstream out;
    diagnostics diag {err};
    run("-\"abc\"", diag, out);
    CHECK(diag.had_runtime_error());
    CHECK_FALSE(diag.had_error());
    CHECK(out.str().empty());
    CHECK_EQ(err.str(), "[line 1] Error: operand 'abc' must be a number to apply operator '-'\n");
}

TEST_CASE("deeplyNestedInputIsReportedNotEvaluated")
{
    std::ostringstream err;
    std::ostringstream out;
    diagnostics diag {err};
    run(std::string(200000, '(') + "1" + std::string(200000, ')'), diag, out);
    CHECK(diag.had_error());
    CHECK(out.str().empty());
    CHECK_EQ(err.str(), "[line 1] Error at '(': expression nested too deeply\n");
}

TEST_CASE("largeAndSmallNumbersPrintInDecimal")
{
    std::ostringstream err;
    std::ostringstream out;
    diagnostics diag {err};
    run("10000000000000000", diag, out);
    run("0.0000001", diag, out);
    run("1000000000000000000000 * 10", diag, out);
    CHECK_EQ(out.str(), "10000000000000000\n0.0000001\n10000000000000000000000\n");
}

TEST_CASE("traceShowsTheTree")
{
    std::ostringstream err;
    std::ostringstream out;
    std::ostringstream trace;
    diagnostics diag {err};
    run("1 + 2 * 3", diag, out, &trace);
    CHECK_EQ(trace.str(), "(+ 1 (* 2 3))\n");
    CHECK_EQ(out.str(), "7\n");
}

TEST_SUITE_END();
// NOLINTEND(*)
}  // namespace
