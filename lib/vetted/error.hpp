#pragma once

#include <stdexcept>

namespace vetted
{
    // Thrown while a declaration is parsed or resolved: malformed directive text, unknown
    // step identifiers, wrong argument counts or types. Never thrown by construction.
    struct DeclarationError : std::runtime_error
    {
        using std::runtime_error::runtime_error;
    };
}    // namespace vetted
