#pragma once

#include "vetted/sanitizer.hpp"
#include "vetted/validator.hpp"

#include <cstddef>
#include <string>
#include <string_view>

// Steps over UTF-8 `std::string` values. Whitespace, case and character classes follow
// the Unicode properties of each code point; ill-formed UTF-8 fails every class check.
namespace vetted::string
{
    std::string_view trimmed(std::string_view text);
    std::string_view trimmed_left(std::string_view text);
    std::string_view trimmed_right(std::string_view text);

    // Number of UTF-8 code points.
    size_t count_chars(std::string_view text);

    Sanitizer<std::string> trim();
    Sanitizer<std::string> trim_left();
    Sanitizer<std::string> trim_right();
    Sanitizer<std::string> to_lowercase();
    Sanitizer<std::string> to_uppercase();

    ValidationNode<std::string> alphabetic();
    ValidationNode<std::string> alphanumeric();
    ValidationNode<std::string> ascii();
    ValidationNode<std::string> lowercase();
    ValidationNode<std::string> uppercase();
    ValidationNode<std::string> not_empty();

    ValidationNode<std::string> length_chars(ValidationNode<std::size_t> check);
    ValidationNode<std::string> length_bytes(ValidationNode<std::size_t> check);

    // Accepts targets containing a match of the ECMAScript pattern. Throws
    // DeclarationError for a malformed pattern.
    ValidationNode<std::string> matches(const std::string& pattern);
}    // namespace vetted::string
