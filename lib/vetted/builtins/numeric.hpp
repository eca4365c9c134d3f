#pragma once

#include "vetted/sanitizer.hpp"
#include "vetted/validator.hpp"

#include <cmath>
#include <type_traits>

namespace vetted::numeric
{
    // Restricts the target to [min, max].
    template<typename T>
    Sanitizer<T> clamp(T min, T max)
    {
        return [min, max](T target) {
            if (target < min)
            {
                target = min;
            }
            if (target > max)
            {
                target = max;
            }
            return target;
        };
    }

    template<typename T>
    Sanitizer<T> clamp_min(T min)
    {
        return [min](T target) { return target < min ? min : target; };
    }

    template<typename T>
    Sanitizer<T> clamp_max(T max)
    {
        return [max](T target) { return target > max ? max : target; };
    }

    // Rejects infinities and NaN.
    template<typename T>
    ValidationNode<T> finite()
    {
        static_assert(std::is_floating_point_v<T>);
        return node::Predicate<T>{"finite", [](const T& target) { return std::isfinite(target); }};
    }
}    // namespace vetted::numeric
