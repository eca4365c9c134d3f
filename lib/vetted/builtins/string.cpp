#include "vetted/builtins/string.hpp"

#include "vetted/builtins/character.hpp"
#include "vetted/builtins/unicode.hpp"
#include "vetted/error.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <regex>
#include <utility>

namespace vetted::string
{
    namespace
    {
        ValidationNode<std::string> every_code_point(const char* name, bool (*predicate)(char32_t))
        {
            return node::Predicate<std::string>{name, [predicate](const std::string& target) {
                                                    return unicode::all_of(target, predicate);
                                                }};
        }
    }    // namespace

    std::string_view trimmed_left(std::string_view text) { return unicode::trim_start(text); }

    std::string_view trimmed_right(std::string_view text) { return unicode::trim_end(text); }

    std::string_view trimmed(std::string_view text) { return trimmed_right(trimmed_left(text)); }

    size_t count_chars(std::string_view text)
    {
        // Every code point has exactly one byte that is not a continuation byte (10xxxxxx).
        return static_cast<size_t>(std::count_if(text.begin(), text.end(), [](char c) {
            return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
        }));
    }

    Sanitizer<std::string> trim()
    {
        return [](std::string target) { return std::string(trimmed(target)); };
    }

    Sanitizer<std::string> trim_left()
    {
        return [](std::string target) { return std::string(trimmed_left(target)); };
    }

    Sanitizer<std::string> trim_right()
    {
        return [](std::string target) { return std::string(trimmed_right(target)); };
    }

    Sanitizer<std::string> to_lowercase()
    {
        return [](std::string target) { return unicode::to_lowercase(target); };
    }

    Sanitizer<std::string> to_uppercase()
    {
        return [](std::string target) { return unicode::to_uppercase(target); };
    }

    ValidationNode<std::string> alphabetic() { return every_code_point("alphabetic", unicode::is_alphabetic); }

    ValidationNode<std::string> alphanumeric() { return every_code_point("alphanumeric", unicode::is_alphanumeric); }

    ValidationNode<std::string> ascii()
    {
        return node::Predicate<std::string>{"ascii", [](const std::string& target) {
                                                return std::all_of(target.begin(), target.end(), character::is_ascii);
                                            }};
    }

    ValidationNode<std::string> lowercase() { return every_code_point("lowercase", unicode::is_lowercase); }

    ValidationNode<std::string> uppercase() { return every_code_point("uppercase", unicode::is_uppercase); }

    ValidationNode<std::string> not_empty()
    {
        return node::Predicate<std::string>{"not_empty", [](const std::string& target) { return !target.empty(); }};
    }

    ValidationNode<std::string> length_chars(ValidationNode<std::size_t> check)
    {
        return project<std::string>(
            "length_chars", [](const std::string& target) { return count_chars(target); }, std::move(check));
    }

    ValidationNode<std::string> length_bytes(ValidationNode<std::size_t> check)
    {
        return project<std::string>(
            "length_bytes", [](const std::string& target) { return target.size(); }, std::move(check));
    }

    ValidationNode<std::string> matches(const std::string& pattern)
    {
        std::regex compiled;
        try
        {
            compiled = std::regex(pattern, std::regex::ECMAScript);
        }
        catch (const std::regex_error& error)
        {
            throw DeclarationError(fmt::format("invalid pattern '{}': {}", pattern, error.what()));
        }
        return node::Predicate<std::string>{fmt::format("matches('{}')", pattern),
                                            [compiled = std::move(compiled)](const std::string& target) {
                                                return std::regex_search(target, compiled);
                                            }};
    }
}    // namespace vetted::string
