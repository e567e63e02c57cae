#include <cmath>
#include <limits>
#include <ostream>
#include <stdexcept>
#include <string>
#include <variant>

#include "value.hpp"

#include <doctest/doctest.h>
#include <lexer/literal.hpp>
#include <overloaded.hpp>
#include <util.hpp>

auto value::from_literal(const literal_value& literal) -> value
{
    return std::visit(overloaded {
                          [](const std::monostate& /*none*/) { return value {}; },
                          [](const std::string& val) { return value {val}; },
                          [](double val) { return value {val}; },
                          [](bool val) { return value {val}; },
                      },
                      literal);
}

auto value::type() const -> value_type
{
    return std::visit(overloaded {
                          [](const nil_value& /*nil*/) { return value_type::nil; },
                          [](bool /*val*/) { return value_type::boolean; },
                          [](double /*val*/) { return value_type::number; },
                          [](const std::string& /*val*/) { return value_type::string; },
                      },
                      data);
}

auto value::is_truthy() const -> bool
{
    return std::visit(overloaded {
                          [](const nil_value& /*nil*/) { return false; },
                          [](bool val) { return val; },
                          [](double /*val*/) { return true; },
                          [](const std::string& /*val*/) { return true; },
                      },
                      data);
}

auto value::inspect() const -> std::string
{
    return std::visit(overloaded {
                          [](const nil_value& /*nil*/) -> std::string { return "nil"; },
                          [](bool val) -> std::string { return val ? "true" : "false"; },
                          [](double val) -> std::string { return decimal_to_string(val); },
                          [](const std::string& val) -> std::string { return val; },
                      },
                      data);
}

auto operator<<(std::ostream& ostrm, value::value_type type) -> std::ostream&
{
    using enum value::value_type;
    switch (type) {
        case nil:
            return ostrm << "nil";
        case boolean:
            return ostrm << "boolean";
        case number:
            return ostrm << "number";
        case string:
            return ostrm << "string";
    }
    throw std::invalid_argument("invalid value_type");
}

auto operator<<(std::ostream& ostrm, const value& val) -> std::ostream&
{
    return ostrm << val.type() << "{" << val.inspect() << "}";
}

namespace
{
// NOLINTBEGIN(*)
TEST_SUITE_BEGIN("value");

TEST_CASE("inspect")
{
    CHECK_EQ(value {}.inspect(), "nil");
    CHECK_EQ(value {true}.inspect(), "true");
    CHECK_EQ(value {false}.inspect(), "false");
    CHECK_EQ(value {3.0}.inspect(), "3");
    CHECK_EQ(value {2.5}.inspect(), "2.5");
    CHECK_EQ(value {-0.125}.inspect(), "-0.125");
    CHECK_EQ(value {std::numeric_limits<double>::infinity()}.inspect(), "inf");
    CHECK_EQ(value {-0.0}.inspect(), "-0");
    CHECK_EQ(value {1e16}.inspect(), "10000000000000000");
    CHECK_EQ(value {1e21}.inspect(), "1000000000000000000000");
    CHECK_EQ(value {1.5e17}.inspect(), "150000000000000000");
    CHECK_EQ(value {1e-7}.inspect(), "0.0000001");
    CHECK_EQ(value {-2.5e-5}.inspect(), "-0.000025");
    CHECK_EQ(value {"raw text"}.inspect(), "raw text");
    CHECK_EQ(value {""}.inspect(), "");
}

TEST_CASE("truthiness")
{
    CHECK_FALSE(value {}.is_truthy());
    CHECK_FALSE(value {false}.is_truthy());
    CHECK(value {true}.is_truthy());
    CHECK(value {0.0}.is_truthy());
    CHECK(value {std::nan("")}.is_truthy());
    CHECK(value {""}.is_truthy());
    CHECK(value {"false"}.is_truthy());
}

TEST_CASE("structuralEquality")
{
    CHECK_EQ(value {}, value {});
    CHECK_EQ(value {1.0}, value {1.0});
    CHECK_EQ(value {"a"}, value {"a"});
    CHECK_NE(value {1.0}, value {"1"});
    CHECK_NE(value {}, value {false});
    CHECK_NE(value {0.0}, value {false});
    CHECK_NE(value {std::nan("")}, value {std::nan("")});
}

TEST_CASE("fromLiteral")
{
    using enum value::value_type;
    CHECK(value::from_literal(literal_value {}).is(nil));
    CHECK_EQ(value::from_literal(literal_value {4.5}).as<double>(), 4.5);
    CHECK_EQ(value::from_literal(literal_value {true}).as<bool>(), true);
    CHECK_EQ(value::from_literal(literal_value {std::string {"s"}}).as<std::string>(), "s");
    CHECK_THROWS_AS((void)value {1.0}.as<std::string>(), std::bad_variant_access);
}

TEST_SUITE_END();
// NOLINTEND(*)
}  // namespace
