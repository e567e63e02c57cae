#pragma once

#include <ostream>
#include <string>
#include <variant>

// the value a string, number, true or false token carries, monostate for all others
using literal_value = std::variant<std::monostate, std::string, double, bool>;

auto operator<<(std::ostream& ostream, const literal_value& literal) -> std::ostream&;
