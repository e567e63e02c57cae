#include <ostream>
#include <string>
#include <variant>

#include "literal.hpp"

#include <overloaded.hpp>
#include <util.hpp>

auto operator<<(std::ostream& ostream, const literal_value& literal) -> std::ostream&
{
    std::visit(overloaded {
                   [&](const std::monostate& /*none*/) { ostream << "none"; },
                   [&](const std::string& val) { ostream << '"' << val << '"'; },
                   [&](double val) { ostream << decimal_to_string(val); },
                   [&](bool val) { ostream << (val ? "true" : "false"); },
               },
               literal);
    return ostream;
}
