#pragma once

#include "pipeline.hpp"
#include "registry.hpp"
#include "untrusted.hpp"
#include "upgrade.hpp"

#include <fmt/format.h>

#include <compare>
#include <cstddef>
#include <functional>
#include <optional>
#include <string_view>
#include <utility>

namespace vetted
{
    namespace detail
    {
        // A kind configures its pipeline with a `pipeline()` function, or with `declaration`
        // text resolved against its own `registry()` or the default registry of its inner
        // type. A kind with neither accepts everything unchanged.
        template<typename Kind>
        Pipeline<typename Kind::Inner> build_pipeline()
        {
            using Inner = typename Kind::Inner;
            if constexpr (requires { Kind::pipeline(); })
            {
                return Kind::pipeline();
            }
            else if constexpr (requires { Kind::declaration; })
            {
                if constexpr (requires { Kind::registry(); })
                {
                    return Kind::registry().resolve(std::string_view{Kind::declaration});
                }
                else
                {
                    return default_registry<Inner>().resolve(std::string_view{Kind::declaration});
                }
            }
            else
            {
                return Pipeline<Inner>{};
            }
        }
    }    // namespace detail

    // A value of `Kind::Inner` that went through the kind's pipeline: sanitized, then
    // validated. The inner value cannot be changed afterwards unless the kind is
    // `bypassable`. Operators and formatting are only available for the upgrades the kind
    // selects.
    template<typename Kind>
    struct Newtype
    {
        using Inner = typename Kind::Inner;

        static constexpr Upgrades upgrades = upgrades_v<Kind>;

        template<Upgrade U>
        static constexpr bool has = upgrades.contains(U);

        // Sanitizes, then validates. std::nullopt if any check rejects the sanitized value.
        static std::optional<Newtype> try_new(Untrusted<Inner> raw)
        {
            return with_pipeline([&raw](const Pipeline<Inner>& steps) { return wrap(steps.run(std::move(raw))); });
        }

        // Wraps the value as given, running no step. The caller guarantees it would pass.
        static Newtype unchecked_new(Inner value) { return Newtype{std::move(value)}; }

        // Validates without sanitizing.
        static std::optional<Newtype> unsanitized_new(Inner value)
            requires(has<Upgrade::bypassable>)
        {
            return with_pipeline([&value](const Pipeline<Inner>& steps) {
                return wrap(Untrusted<Inner>{std::move(value)}.verify(steps.validators));
            });
        }

        // Sanitizes without validating.
        static Newtype unvalidated_new(Inner value)
            requires(has<Upgrade::bypassable>)
        {
            return with_pipeline([&value](const Pipeline<Inner>& steps) {
                return Newtype{steps.sanitizers.apply(std::move(value))};
            });
        }

        // The pipeline shared by every construction of this kind, resolved on first use.
        // Calling it early reports a malformed declaration before any input arrives.
        static const Pipeline<Inner>& pipeline()
            requires(!has<Upgrade::independent>)
        {
            static const Pipeline<Inner> shared = detail::build_pipeline<Kind>();
            return shared;
        }

        const Inner& to_inner() const& { return m_value; }
        Inner into_inner() && { return std::move(m_value); }

        Inner& inner_mut()
            requires(has<Upgrade::bypassable>)
        {
            return m_value;
        }

        const Inner& operator*() const
            requires(has<Upgrade::deref>)
        {
            return m_value;
        }

        const Inner* operator->() const
            requires(has<Upgrade::deref>)
        {
            return &m_value;
        }

        operator const Inner&() const
            requires(has<Upgrade::as_ref>)
        {
            return m_value;
        }

        bool operator==(const Newtype& other) const
            requires(has<Upgrade::equality>)
        {
            return m_value == other.m_value;
        }

        auto operator<=>(const Newtype& other) const
            requires(has<Upgrade::ordering>)
        {
            return std::compare_three_way{}(m_value, other.m_value);
        }

        // Unselected comparisons are deleted so the `as_ref` conversion cannot reach the
        // built-in operators of the inner type.
        bool operator==(const Newtype&) const
            requires(!has<Upgrade::equality>)
        = delete;

        auto operator<=>(const Newtype&) const
            requires(!has<Upgrade::ordering>)
        = delete;

    private:
        explicit Newtype(Inner value) : m_value{std::move(value)} {}

        static std::optional<Newtype> wrap(std::optional<Inner> value)
        {
            if (!value)
            {
                return std::nullopt;
            }
            return Newtype{std::move(*value)};
        }

        template<typename F>
        static auto with_pipeline(F&& f)
        {
            if constexpr (has<Upgrade::independent>)
            {
                const Pipeline<Inner> fresh = detail::build_pipeline<Kind>();
                return f(fresh);
            }
            else
            {
                return f(pipeline());
            }
        }

        Inner m_value;
    };
}    // namespace vetted

namespace std
{
    template<typename Kind>
        requires vetted::has_upgrade_v<Kind, vetted::Upgrade::hash>
    struct hash<vetted::Newtype<Kind>>
    {
        size_t operator()(const vetted::Newtype<Kind>& value) const
        {
            return hash<typename Kind::Inner>{}(value.to_inner());
        }
    };
}    // namespace std

namespace fmt
{
    template<typename Kind>
        requires vetted::has_upgrade_v<Kind, vetted::Upgrade::display>
    struct formatter<vetted::Newtype<Kind>> : formatter<typename Kind::Inner>
    {
        template<typename FormatContext>
        auto format(const vetted::Newtype<Kind>& value, FormatContext& ctx) const
        {
            return formatter<typename Kind::Inner>::format(value.to_inner(), ctx);
        }
    };
}    // namespace fmt
