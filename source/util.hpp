#pragma once

#include <cstddef>
#include <string>

#include <fmt/format.h>

// shortest digits that read back as the same double, always in plain decimal
// notation: 3, 2.5, 10000000000000000, 0.0000001; inf and nan as is
inline auto decimal_to_string(double d) -> std::string
{
    auto text = fmt::format("{}", d);
    const auto exp_pos = text.find('e');
    if (exp_pos == std::string::npos) {
        return text;
    }
    const auto exponent = std::stoi(text.substr(exp_pos + 1));
    auto mantissa = text.substr(0, exp_pos);
    auto sign = std::string {};
    if (mantissa.front() == '-') {
        sign = "-";
        mantissa.erase(0, 1);
    }
    const auto dot = mantissa.find('.');
    const auto integral_digits = static_cast<int>(dot == std::string::npos ? mantissa.size() : dot);
    if (dot != std::string::npos) {
        mantissa.erase(dot, 1);
    }
    const auto digits = static_cast<int>(mantissa.size());
    const auto point = integral_digits + exponent;
    if (point >= digits) {
        return sign + mantissa + std::string(static_cast<std::size_t>(point - digits), '0');
    }
    if (point <= 0) {
        return sign + "0." + std::string(static_cast<std::size_t>(-point), '0') + mantissa;
    }
    const auto split = static_cast<std::size_t>(point);
    return sign + mantissa.substr(0, split) + "." + mantissa.substr(split);
}
