#include "vetted/builtins/domain.hpp"

#include <regex>

namespace vetted::domain
{
    namespace
    {
        // Address grammar of RFC 5322 (https://stackoverflow.com/a/201378).
        const std::regex& email_pattern()
        {
            static const std::regex pattern(
                R"re((?:[a-z0-9!#$%&'*+/=?^_`{|}~-]+(?:\.[a-z0-9!#$%&'*+/=?^_`{|}~-]+)*|"(?:[\x01-\x08\x0b\x0c\x0e-\x1f\x21\x23-\x5b\x5d-\x7f]|\\[\x01-\x09\x0b\x0c\x0e-\x7f])*")@(?:(?:[a-z0-9](?:[a-z0-9-]*[a-z0-9])?\.)+[a-z0-9](?:[a-z0-9-]*[a-z0-9])?|\[(?:(?:(2(5[0-5]|[0-4][0-9])|1[0-9][0-9]|[1-9]?[0-9]))\.){3}(?:(2(5[0-5]|[0-4][0-9])|1[0-9][0-9]|[1-9]?[0-9])|[a-z0-9-]*[a-z0-9]:(?:[\x01-\x08\x0b\x0c\x0e-\x1f\x21-\x5a\x53-\x7f]|\\[\x01-\x09\x0b\x0c\x0e-\x7f])+)\]))re",
                std::regex::ECMAScript);
            return pattern;
        }
    }    // namespace

    bool is_email(std::string_view text)
    {
        return std::regex_search(text.begin(), text.end(), email_pattern());
    }

    ValidationNode<std::string> email()
    {
        return node::Predicate<std::string>{"email", [](const std::string& target) { return is_email(target); }};
    }
}    // namespace vetted::domain
