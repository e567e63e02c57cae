#pragma once

#include <cstddef>
#include <ostream>
#include <string>

#include <fmt/ostream.h>

#include "literal.hpp"
#include "token_type.hpp"

struct token final
{
    token_type type {token_type::eof};
    std::string lexeme;
    literal_value literal;
    std::size_t line {1};

    auto operator==(const token& other) const -> bool = default;
};

auto operator<<(std::ostream& ostream, const token& tok) -> std::ostream&;

template<>
struct fmt::formatter<token> : ostream_formatter
{
};
