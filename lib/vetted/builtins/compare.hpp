#pragma once

#include "vetted/error.hpp"
#include "vetted/validator.hpp"

#include <fmt/format.h>

#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

// Comparison checks. The builders keep their bound untyped until they are converted to
// the ValidationNode<T> they are used as, so `within(5, 20)` serves a std::size_t length
// as well as an int.
namespace vetted::compare
{
    namespace detail
    {
        template<typename B>
        std::string label(const B& bound)
        {
            if constexpr (std::is_same_v<B, char>)
            {
                return fmt::format("'{}'", bound);
            }
            else if constexpr (std::is_same_v<B, char32_t>)
            {
                return fmt::format("U+{:04X}", static_cast<std::uint32_t>(bound));
            }
            else if constexpr (std::is_convertible_v<const B&, std::string_view>)
            {
                return fmt::format("'{}'", std::string_view(bound));
            }
            else if constexpr (fmt::is_formattable<B>::value)
            {
                return fmt::format("{}", bound);
            }
            else
            {
                return "?";
            }
        }

        template<typename B, typename T>
        inline constexpr bool convertible_bound_v =
            (std::is_arithmetic_v<B> && std::is_arithmetic_v<T>) || std::is_constructible_v<T, const B&>;

        // Converts a bound to the checked type. A bound an integer type cannot represent
        // exactly is a declaration error rather than a wrap-around or truncation.
        template<typename T, typename B>
        T convert_bound(const B& bound)
        {
            if constexpr (std::is_integral_v<T> && std::is_integral_v<B>)
            {
                T converted = static_cast<T>(bound);
                if (static_cast<B>(converted) != bound || ((converted < T{}) != (bound < B{})))
                {
                    throw DeclarationError(fmt::format("bound {} does not fit the checked type", label(bound)));
                }
                return converted;
            }
            else if constexpr (std::is_integral_v<T> && std::is_floating_point_v<B>)
            {
                // min() is zero or minus a power of two, so both limits are exact in B.
                const B low  = static_cast<B>(std::numeric_limits<T>::min());
                const B high = std::ldexp(B{1}, std::numeric_limits<T>::digits);
                if (!std::isfinite(bound) || std::trunc(bound) != bound || bound < low || bound >= high)
                {
                    throw DeclarationError(fmt::format("bound {} is not a value of the checked integer type", bound));
                }
                return static_cast<T>(bound);
            }
            else if constexpr (std::is_arithmetic_v<T> && std::is_arithmetic_v<B>)
            {
                return static_cast<T>(bound);
            }
            else
            {
                return T(bound);
            }
        }

        template<typename T, typename B>
        node::Bound<T> make_bound(const B& bound, bool inclusive)
        {
            T converted = convert_bound<T>(bound);
            return node::Bound<T>{label(bound), inclusive, [converted](const T& target) {
                                      return vetted::order(target, converted);
                                  }};
        }
    }    // namespace detail

    template<typename B>
    struct Relational
    {
        Relation relation;
        B bound;

        template<typename T>
            requires detail::convertible_bound_v<B, T>
        operator ValidationNode<T>() const
        {
            T converted = detail::convert_bound<T>(bound);
            return node::Comparison<T>{relation, detail::label(bound), [converted](const T& target) {
                                           return vetted::order(target, converted);
                                       }};
        }
    };

    template<typename B>
    struct Bounded
    {
        std::optional<B> lower;
        std::optional<B> upper;
        bool lower_inclusive = true;
        bool upper_inclusive = true;

        template<typename T>
            requires detail::convertible_bound_v<B, T>
        operator ValidationNode<T>() const
        {
            node::Range<T> range;
            if (lower)
            {
                range.lower = detail::make_bound<T>(*lower, lower_inclusive);
            }
            if (upper)
            {
                range.upper = detail::make_bound<T>(*upper, upper_inclusive);
            }
            return range;
        }
    };

    template<typename B>
    Relational<B> lt(B bound)
    {
        return {Relation::lt, std::move(bound)};
    }

    template<typename B>
    Relational<B> le(B bound)
    {
        return {Relation::le, std::move(bound)};
    }

    template<typename B>
    Relational<B> gt(B bound)
    {
        return {Relation::gt, std::move(bound)};
    }

    template<typename B>
    Relational<B> ge(B bound)
    {
        return {Relation::ge, std::move(bound)};
    }

    template<typename B>
    Relational<B> eq(B bound)
    {
        return {Relation::eq, std::move(bound)};
    }

    template<typename B>
    Relational<B> ne(B bound)
    {
        return {Relation::ne, std::move(bound)};
    }

    // low <= target <= high
    template<typename B>
    Bounded<B> within(B low, B high)
    {
        return {std::move(low), std::move(high), true, true};
    }

    // low <= target < high
    template<typename B>
    Bounded<B> within_exclusive(B low, B high)
    {
        return {std::move(low), std::move(high), true, false};
    }

    template<typename B>
    Bounded<B> at_least(B low)
    {
        return {std::move(low), std::nullopt, true, true};
    }

    template<typename B>
    Bounded<B> at_most(B high)
    {
        return {std::nullopt, std::move(high), true, true};
    }
}    // namespace vetted::compare
