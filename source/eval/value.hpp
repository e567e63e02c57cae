#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <utility>
#include <variant>

#include <lexer/literal.hpp>

struct nil_value
{
    auto operator==(const nil_value& /*other*/) const -> bool = default;
};

struct value final
{
    enum class value_type : std::uint8_t
    {
        nil,
        boolean,
        number,
        string,
    };

    using storage = std::variant<nil_value, bool, double, std::string>;

    value() = default;

    explicit value(bool val)
        : data {val}
    {
    }

    explicit value(double val)
        : data {val}
    {
    }

    explicit value(std::string val)
        : data {std::move(val)}
    {
    }

    explicit value(const char* val)
        : data {std::string {val}}
    {
    }

    static auto from_literal(const literal_value& literal) -> value;

    [[nodiscard]] auto type() const -> value_type;

    [[nodiscard]] auto is(value_type val_type) const -> bool { return type() == val_type; }

    // throws std::bad_variant_access when the value holds another type
    template<typename T>
    [[nodiscard]] auto as() const -> const T&
    {
        return std::get<T>(data);
    }

    // only nil and false are falsy
    [[nodiscard]] auto is_truthy() const -> bool;

    [[nodiscard]] auto inspect() const -> std::string;

    auto operator==(const value& other) const -> bool = default;

    storage data;
};

auto operator<<(std::ostream& ostrm, value::value_type type) -> std::ostream&;
auto operator<<(std::ostream& ostrm, const value& val) -> std::ostream&;
