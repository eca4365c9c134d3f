#pragma once

#include "vetted/builtins/unicode.hpp"
#include "vetted/validator.hpp"

// Checks over a single character. A `char` is one UTF-8 code unit, so its classes are
// ASCII and bytes above 0x7f belong to none of them. A `char32_t` is a code point and
// takes its Unicode properties.
namespace vetted::character
{
    constexpr bool is_ascii(char c) { return static_cast<unsigned char>(c) < 0x80; }
    constexpr bool is_lower(char c) { return c >= 'a' && c <= 'z'; }
    constexpr bool is_upper(char c) { return c >= 'A' && c <= 'Z'; }
    constexpr bool is_alpha(char c) { return is_lower(c) || is_upper(c); }
    constexpr bool is_digit(char c) { return c >= '0' && c <= '9'; }
    constexpr bool is_alnum(char c) { return is_alpha(c) || is_digit(c); }
    constexpr bool is_space(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r'; }

    namespace detail
    {
        constexpr bool alphabetic(char c) { return is_alpha(c); }
        constexpr bool alphanumeric(char c) { return is_alnum(c); }
        constexpr bool ascii(char c) { return is_ascii(c); }
        constexpr bool lowercase(char c) { return is_lower(c); }
        constexpr bool uppercase(char c) { return is_upper(c); }
        constexpr bool digit(char c) { return is_digit(c); }

        inline bool alphabetic(char32_t c) { return unicode::is_alphabetic(c); }
        inline bool alphanumeric(char32_t c) { return unicode::is_alphanumeric(c); }
        constexpr bool ascii(char32_t c) { return c < 0x80; }
        inline bool lowercase(char32_t c) { return unicode::is_lowercase(c); }
        inline bool uppercase(char32_t c) { return unicode::is_uppercase(c); }
        constexpr bool digit(char32_t c) { return c >= U'0' && c <= U'9'; }
    }    // namespace detail

    template<typename C = char>
    ValidationNode<C> alphabetic()
    {
        return node::Predicate<C>{"alphabetic", [](const C& c) { return detail::alphabetic(c); }};
    }

    template<typename C = char>
    ValidationNode<C> alphanumeric()
    {
        return node::Predicate<C>{"alphanumeric", [](const C& c) { return detail::alphanumeric(c); }};
    }

    template<typename C = char>
    ValidationNode<C> ascii()
    {
        return node::Predicate<C>{"ascii", [](const C& c) { return detail::ascii(c); }};
    }

    template<typename C = char>
    ValidationNode<C> lowercase()
    {
        return node::Predicate<C>{"lowercase", [](const C& c) { return detail::lowercase(c); }};
    }

    template<typename C = char>
    ValidationNode<C> uppercase()
    {
        return node::Predicate<C>{"uppercase", [](const C& c) { return detail::uppercase(c); }};
    }

    // ASCII '0' to '9'.
    template<typename C = char>
    ValidationNode<C> digit()
    {
        return node::Predicate<C>{"digit", [](const C& c) { return detail::digit(c); }};
    }
}    // namespace vetted::character
