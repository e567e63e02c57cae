#include <ostream>

#include "token.hpp"

auto operator<<(std::ostream& ostream, const token& tok) -> std::ostream&
{
    return ostream << "token{" << tok.type << ", `" << tok.lexeme << "´ " << tok.literal << " line " << tok.line << "}";
}
