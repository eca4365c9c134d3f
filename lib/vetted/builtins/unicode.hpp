#pragma once

#include <optional>
#include <string>
#include <string_view>

// Unicode properties of code points and UTF-8 text, backed by ICU. Ill-formed UTF-8
// belongs to no class.
namespace vetted::unicode
{
    bool is_alphabetic(char32_t c);
    bool is_numeric(char32_t c);
    bool is_alphanumeric(char32_t c);
    bool is_lowercase(char32_t c);
    bool is_uppercase(char32_t c);
    bool is_whitespace(char32_t c);

    // True if `text` is well-formed UTF-8 and every code point satisfies `predicate`.
    bool all_of(std::string_view text, bool (*predicate)(char32_t));

    // The code point `text` encodes, if it is exactly one well-formed code point.
    std::optional<char32_t> single_code_point(std::string_view text);

    std::string_view trim_start(std::string_view text);
    std::string_view trim_end(std::string_view text);

    // Full, context-sensitive case mapping of the root locale: "ß" uppercases to "SS" and
    // a final sigma lowercases to "ς".
    std::string to_lowercase(std::string_view text);
    std::string to_uppercase(std::string_view text);

    // UTS #46 ToASCII of a host name as URLs use it: non-transitional, with the hyphen
    // and DNS length rules relaxed. std::nullopt if the name is rejected.
    std::optional<std::string> domain_to_ascii(std::string_view domain);
}    // namespace vetted::unicode
