#pragma once

#include <string>

#include <lexer/token.hpp>

// the input does not match the grammar, tok is where the parser gave up
struct syntax_error final
{
    token tok;
    std::string message;
};

// a well formed expression applied an operator to operands of the wrong type
struct runtime_error final
{
    token op;
    std::string message;
};
