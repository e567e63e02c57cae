#pragma once

#include <cstdint>
#include <ostream>

#include <fmt/ostream.h>

enum class token_type : std::uint8_t
{
    // single character tokens
    lparen,
    rparen,
    lsquirly,
    rsquirly,
    comma,
    dot,
    minus,
    plus,
    semicolon,
    slash,
    asterisk,

    // one or two character tokens
    exclamation,
    not_equals,
    assign,
    equals,
    greater_than,
    greater_equal,
    less_than,
    less_equal,

    // multi character tokens
    ident,
    string,
    number,

    // keywords
    logical_and,
    klass,
    elze,
    fals,
    fun,
    fore,
    eef,
    nil,
    logical_or,
    print,
    ret,
    super,
    thiz,
    tru,
    var,
    hwile,

    eof,
};

auto operator<<(std::ostream& ostream, token_type type) -> std::ostream&;

template<>
struct fmt::formatter<token_type> : ostream_formatter
{
};
