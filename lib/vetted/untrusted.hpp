#pragma once

#include "sanitizer.hpp"
#include "validator.hpp"

#include <optional>
#include <utility>

namespace vetted
{
    // A raw input that has not passed validation yet. The wrapped value is owned, so
    // sanitization never aliases the caller's original.
    template<typename T>
    struct Untrusted
    {
        template<typename... Args>
        Untrusted(Args&&... args) : m_value(std::forward<Args>(args)...)
        {
        }

        // Run every step of the chain in order. The result is still untrusted.
        Untrusted& sanitize(const SanitizationChain<T>& chain) &
        {
            m_value = chain.apply(std::move(m_value));
            return *this;
        }

        Untrusted&& sanitize(const SanitizationChain<T>& chain) &&
        {
            m_value = chain.apply(std::move(m_value));
            return std::move(*this);
        }

        // Releases the value only if the whole tree accepts it.
        std::optional<T> verify(const ValidationTree<T>& tree) &&
        {
            return tree.evaluate(m_value) ? std::optional<T>{std::move(m_value)} : std::nullopt;
        }

        Untrusted(const Untrusted&) = default;
        Untrusted(Untrusted& other) : Untrusted{const_cast<const Untrusted&>(other)} {}
        Untrusted& operator=(const Untrusted&) = default;

        Untrusted(Untrusted&& other)      = default;
        Untrusted& operator=(Untrusted&&) = default;

    private:
        T m_value;
    };
}    // namespace vetted
