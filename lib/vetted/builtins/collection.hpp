#pragma once

#include "vetted/builtins/compare.hpp"
#include "vetted/sanitizer.hpp"
#include "vetted/validator.hpp"

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

namespace vetted::collection
{
    // Accepts targets equal to one of the listed values.
    template<typename T>
    ValidationNode<T> among(std::vector<T> values)
    {
        std::string name = "among(";
        for (size_t i = 0; i < values.size(); ++i)
        {
            name += (i > 0 ? ", " : "") + compare::detail::label(values[i]);
        }
        name += ')';
        return node::Predicate<T>{std::move(name), [values = std::move(values)](const T& target) {
                                      return std::find(values.begin(), values.end(), target) != values.end();
                                  }};
    }

    template<typename T>
    ValidationNode<T> among(std::initializer_list<T> values)
    {
        return among(std::vector<T>(values));
    }

    // Sorts the elements of a container in ascending order.
    template<typename C>
    Sanitizer<C> sort()
    {
        return [](C target) {
            std::sort(std::begin(target), std::end(target));
            return target;
        };
    }

    // Checks the number of elements.
    template<typename C>
    ValidationNode<C> length(ValidationNode<std::size_t> check)
    {
        return project<C>("length", [](const C& target) -> std::size_t { return std::size(target); }, std::move(check));
    }
}    // namespace vetted::collection
