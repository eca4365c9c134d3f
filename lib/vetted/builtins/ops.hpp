#pragma once

#include "vetted/sanitizer.hpp"
#include "vetted/validator.hpp"

#include <initializer_list>
#include <memory>
#include <utility>
#include <vector>

// Logical combinators, assignment, and the constant checks.
namespace vetted::ops
{
    // Children are evaluated left to right; the first rejection stops evaluation.
    template<typename T>
    ValidationNode<T> all_of(std::initializer_list<ValidationNode<T>> checks)
    {
        return node::AllOf<T>{std::vector<ValidationNode<T>>(checks)};
    }

    // Children are evaluated left to right; the first acceptance stops evaluation.
    template<typename T>
    ValidationNode<T> any_of(std::initializer_list<ValidationNode<T>> checks)
    {
        return node::AnyOf<T>{std::vector<ValidationNode<T>>(checks)};
    }

    template<typename T>
    ValidationNode<T> either(ValidationNode<T> first, ValidationNode<T> second)
    {
        std::vector<ValidationNode<T>> children;
        children.push_back(std::move(first));
        children.push_back(std::move(second));
        return node::AnyOf<T>{std::move(children)};
    }

    template<typename T>
    ValidationNode<T> negate(ValidationNode<T> check)
    {
        return node::Not<T>{std::make_shared<const ValidationNode<T>>(std::move(check))};
    }

    template<typename T>
    ValidationNode<T> valid()
    {
        return node::Predicate<T>{"valid", [](const T&) { return true; }};
    }

    template<typename T>
    ValidationNode<T> invalid()
    {
        return node::Predicate<T>{"invalid", [](const T&) { return false; }};
    }

    // Replaces the target with a fixed value.
    template<typename T>
    Sanitizer<T> assign(T value)
    {
        return [value = std::move(value)](T) { return value; };
    }
}    // namespace vetted::ops
