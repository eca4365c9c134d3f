#pragma once

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <utility>
#include <vector>

namespace vetted
{
    // A single transformation step. Steps are total: they cannot reject a value.
    template<typename T>
    using Sanitizer = std::function<T(T)>;

    template<typename T>
    struct SanitizationChain
    {
        SanitizationChain() = default;
        SanitizationChain(std::initializer_list<Sanitizer<T>> steps) : m_steps{steps} {}
        explicit SanitizationChain(std::vector<Sanitizer<T>> steps) : m_steps{std::move(steps)} {}

        SanitizationChain& then(Sanitizer<T> step)
        {
            m_steps.push_back(std::move(step));
            return *this;
        }

        // Feed the value through every step, left to right.
        T apply(T value) const
        {
            for (const auto& step : m_steps)
            {
                value = step(std::move(value));
            }
            return value;
        }

        bool empty() const { return m_steps.empty(); }
        size_t size() const { return m_steps.size(); }

    private:
        std::vector<Sanitizer<T>> m_steps;
    };
}    // namespace vetted
