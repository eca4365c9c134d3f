#pragma once

#include "upgrade.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace vetted
{
    using Number = std::variant<std::int64_t, double>;

    // `low..high` or `low..=high`.
    struct Interval
    {
        Number low;
        Number high;
        bool inclusive;
    };

    using Literal = std::variant<std::int64_t, double, std::string, Interval>;

    // One step of a declaration: either a call `name(arguments...)`, where a bare `name` is
    // a call without arguments, or a literal argument.
    struct Expression
    {
        std::string name;
        std::vector<Expression> arguments;
        std::optional<Literal> literal;

        bool is_literal() const { return literal.has_value(); }
    };

    // The parsed text of a newtype declaration, e.g.
    // `upgrades(display), sanitize(trim), validate(alphanumeric, length_chars(within(5..=20)))`.
    struct Declaration
    {
        std::vector<Expression> sanitizers;
        std::vector<Expression> validators;
        Upgrades upgrades;
    };

    // Throws DeclarationError on malformed text, unknown or repeated clauses and unknown upgrades.
    Declaration parse_declaration(std::string_view text);

    // Renders an expression back in declaration syntax.
    std::string to_string(const Expression& expression);
    std::string to_string(const Number& number);
}    // namespace vetted
