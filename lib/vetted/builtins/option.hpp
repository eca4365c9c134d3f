#pragma once

#include "vetted/sanitizer.hpp"
#include "vetted/validator.hpp"

#include <optional>
#include <utility>

// Steps over std::optional inner values.
namespace vetted::option
{
    template<typename U>
    ValidationNode<std::optional<U>> some()
    {
        return node::Predicate<std::optional<U>>{"some", [](const std::optional<U>& target) {
                                                     return target.has_value();
                                                 }};
    }

    // Sanitizes the contained value, if there is one.
    template<typename U>
    Sanitizer<std::optional<U>> some_then(Sanitizer<U> step)
    {
        return [step = std::move(step)](std::optional<U> target) {
            if (target)
            {
                target = step(std::move(*target));
            }
            return target;
        };
    }

    // Checks the contained value, if there is one. An empty optional is accepted.
    template<typename U>
    ValidationNode<std::optional<U>> some_then(ValidationNode<U> check)
    {
        return project_if<std::optional<U>>(
            "some_then", [](const std::optional<U>& target) { return target ? &*target : nullptr; }, std::move(check),
            true);
    }

    // Checks the contained value. An empty optional is rejected.
    template<typename U>
    ValidationNode<std::optional<U>> unwrap_then(ValidationNode<U> check)
    {
        return project_if<std::optional<U>>(
            "unwrap_then", [](const std::optional<U>& target) { return target ? &*target : nullptr; },
            std::move(check), false);
    }
}    // namespace vetted::option
