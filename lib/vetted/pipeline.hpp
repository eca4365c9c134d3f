#pragma once

#include "sanitizer.hpp"
#include "untrusted.hpp"
#include "validator.hpp"

#include <optional>
#include <utility>

namespace vetted
{
    // Sanitize-then-validate configuration of one newtype kind.
    template<typename T>
    struct Pipeline
    {
        SanitizationChain<T> sanitizers;
        ValidationTree<T> validators;

        // The sanitized value if it passes every check, std::nullopt otherwise.
        std::optional<T> run(Untrusted<T> raw) const { return std::move(raw).sanitize(sanitizers).verify(validators); }
    };
}    // namespace vetted
