#include "vetted/registry.hpp"

#include "vetted/builtins/character.hpp"
#include "vetted/builtins/domain.hpp"
#include "vetted/builtins/string.hpp"

#include <string>

namespace vetted
{
    template<>
    Registry<std::string> make_default_registry<std::string>()
    {
        Registry<std::string> registry;
        registry.add_sanitizer("trim", string::trim())
            .add_sanitizer("trim_left", string::trim_left())
            .add_sanitizer("trim_right", string::trim_right())
            .add_sanitizer("lowercase", string::to_lowercase())
            .add_sanitizer("to_lowercase", string::to_lowercase())
            .add_sanitizer("uppercase", string::to_uppercase())
            .add_sanitizer("to_uppercase", string::to_uppercase());

        registry.add_check("alphabetic", string::alphabetic())
            .add_check("alphanumeric", string::alphanumeric())
            .add_check("ascii", string::ascii())
            .add_check("lowercase", string::lowercase())
            .add_check("uppercase", string::uppercase())
            .add_check("not_empty", string::not_empty())
            .add_check("email", domain::email())
            .add_check("url", domain::url())
            .add_check("credit_card_number", domain::credit_card_number());

        auto matches = [](const Registry<std::string>&, const Expression& call) {
            expect_arity(call, 1);
            return string::matches(argument_as<std::string>(call, 0));
        };
        registry.add_check_factory("matches", matches).add_check_factory("regex", matches);

        auto chars = [](const std::string& target) { return string::count_chars(target); };
        auto bytes = [](const std::string& target) { return target.size(); };
        registry.add_measure("length_chars", chars)
            .add_measure("length::chars", chars)
            .add_measure("length_bytes", bytes)
            .add_measure("length::bytes", bytes);
        return registry;
    }

    template<>
    Registry<char> make_default_registry<char>()
    {
        Registry<char> registry;
        registry.add_check("alphabetic", character::alphabetic())
            .add_check("alphanumeric", character::alphanumeric())
            .add_check("ascii", character::ascii())
            .add_check("lowercase", character::lowercase())
            .add_check("uppercase", character::uppercase())
            .add_check("digit", character::digit());
        return registry;
    }

    template<>
    Registry<char32_t> make_default_registry<char32_t>()
    {
        Registry<char32_t> registry;
        registry.add_check("alphabetic", character::alphabetic<char32_t>())
            .add_check("alphanumeric", character::alphanumeric<char32_t>())
            .add_check("ascii", character::ascii<char32_t>())
            .add_check("lowercase", character::lowercase<char32_t>())
            .add_check("uppercase", character::uppercase<char32_t>())
            .add_check("digit", character::digit<char32_t>());
        return registry;
    }
}    // namespace vetted
