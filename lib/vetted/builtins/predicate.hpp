#pragma once

#include "vetted/builtins/ops.hpp"
#include "vetted/sanitizer.hpp"
#include "vetted/validator.hpp"

#include <string>
#include <utility>
#include <vector>

namespace vetted::predicate
{
    template<typename T, typename F>
    ValidationNode<T> satisfies(F predicate, std::string name = "satisfies")
    {
        return node::Predicate<T>{std::move(name), std::move(predicate)};
    }

    // Runs `step` only on targets that satisfy `predicate`.
    template<typename T, typename F>
    Sanitizer<T> satisfies_then(F predicate, Sanitizer<T> step)
    {
        return [predicate = std::move(predicate), step = std::move(step)](T target) {
            if (predicate(target))
            {
                return step(std::move(target));
            }
            return target;
        };
    }

    // Applies `check` only to targets that satisfy `predicate`; everything else is accepted.
    template<typename T, typename F>
    ValidationNode<T> satisfies_then(F predicate, ValidationNode<T> check)
    {
        return ops::either(ops::negate(satisfies<T>(std::move(predicate))), std::move(check));
    }
}    // namespace vetted::predicate
