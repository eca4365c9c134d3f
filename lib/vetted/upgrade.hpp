#pragma once

#include "error.hpp"

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string_view>

namespace vetted
{
    // Opt-in capabilities of a newtype kind. See Newtype for what each one attaches.
    enum class Upgrade : std::uint32_t
    {
        display     = 1u << 0,
        deref       = 1u << 1,
        as_ref      = 1u << 2,
        equality    = 1u << 3,
        ordering    = 1u << 4,
        hash        = 1u << 5,
        bypassable  = 1u << 6,
        independent = 1u << 7,
    };

    struct Upgrades
    {
        constexpr Upgrades() = default;
        constexpr Upgrades(std::initializer_list<Upgrade> upgrades)
        {
            for (auto upgrade : upgrades)
            {
                m_bits |= static_cast<std::uint32_t>(upgrade);
            }
        }

        constexpr bool contains(Upgrade upgrade) const { return (m_bits & static_cast<std::uint32_t>(upgrade)) != 0; }
        constexpr bool empty() const { return m_bits == 0; }

        constexpr Upgrades with(Upgrade upgrade) const
        {
            Upgrades result = *this;
            result.m_bits |= static_cast<std::uint32_t>(upgrade);
            return result;
        }

        constexpr Upgrades operator|(Upgrades other) const
        {
            Upgrades result = *this;
            result.m_bits |= other.m_bits;
            return result;
        }

        friend constexpr bool operator==(Upgrades, Upgrades) = default;

    private:
        std::uint32_t m_bits = 0;
    };

    // Throws DeclarationError for an unrecognized tag, which makes a constant
    // evaluation fail to compile.
    constexpr Upgrade upgrade_from_name(std::string_view name)
    {
        if (name == "display")
            return Upgrade::display;
        if (name == "deref")
            return Upgrade::deref;
        if (name == "as_ref")
            return Upgrade::as_ref;
        if (name == "equality")
            return Upgrade::equality;
        if (name == "ordering")
            return Upgrade::ordering;
        if (name == "hash")
            return Upgrade::hash;
        if (name == "bypassable")
            return Upgrade::bypassable;
        if (name == "independent")
            return Upgrade::independent;
        throw DeclarationError("unrecognized upgrade");
    }

    namespace detail
    {
        constexpr bool is_identifier_char(char c)
        {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == ':';
        }

        constexpr bool is_space(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }

        constexpr size_t skip_space(std::string_view text, size_t pos)
        {
            while (pos < text.size() && is_space(text[pos]))
            {
                ++pos;
            }
            return pos;
        }

        // Skips a quoted literal starting at `pos`, returning the position after the closing quote.
        constexpr size_t skip_quoted(std::string_view text, size_t pos)
        {
            char quote = text[pos++];
            while (pos < text.size() && text[pos] != quote)
            {
                if (quote == '"' && text[pos] == '\\')
                {
                    ++pos;
                }
                ++pos;
            }
            return pos + 1;
        }
    }    // namespace detail

    // Extracts the `upgrades(...)` clause of a declaration at compile time. Other clauses
    // are skipped here; they are parsed when the declaration is resolved.
    constexpr Upgrades parse_upgrades(std::string_view declaration)
    {
        Upgrades upgrades;
        size_t depth = 0;
        size_t pos   = 0;
        while (pos < declaration.size())
        {
            char c = declaration[pos];
            if (c == '"' || c == '\'')
            {
                pos = detail::skip_quoted(declaration, pos);
            }
            else if (c == '(')
            {
                ++depth;
                ++pos;
            }
            else if (c == ')')
            {
                if (depth == 0)
                {
                    throw DeclarationError("unmatched ')' in declaration");
                }
                --depth;
                ++pos;
            }
            else if (depth == 0 && detail::is_identifier_char(c))
            {
                size_t begin = pos;
                while (pos < declaration.size() && detail::is_identifier_char(declaration[pos]))
                {
                    ++pos;
                }
                if (declaration.substr(begin, pos - begin) != "upgrades")
                {
                    continue;
                }
                pos = detail::skip_space(declaration, pos);
                if (pos >= declaration.size() || declaration[pos] != '(')
                {
                    throw DeclarationError("expected '(' after upgrades");
                }
                ++pos;
                while (true)
                {
                    pos = detail::skip_space(declaration, pos);
                    if (pos < declaration.size() && declaration[pos] == ')')
                    {
                        ++pos;
                        break;
                    }
                    size_t name_begin = pos;
                    while (pos < declaration.size() && detail::is_identifier_char(declaration[pos]))
                    {
                        ++pos;
                    }
                    upgrades = upgrades.with(upgrade_from_name(declaration.substr(name_begin, pos - name_begin)));
                    pos      = detail::skip_space(declaration, pos);
                    if (pos < declaration.size() && declaration[pos] == ',')
                    {
                        ++pos;
                    }
                    else if (pos >= declaration.size() || declaration[pos] != ')')
                    {
                        throw DeclarationError("expected ',' or ')' in upgrades");
                    }
                }
            }
            else
            {
                ++pos;
            }
        }
        return upgrades;
    }

    // The upgrade set of a kind: its `upgrades` member merged with the `upgrades(...)`
    // clause of its `declaration`, if it has either.
    template<typename Kind>
    constexpr Upgrades upgrades_of()
    {
        Upgrades upgrades;
        if constexpr (requires { Kind::upgrades; })
        {
            upgrades = upgrades | Kind::upgrades;
        }
        if constexpr (requires { Kind::declaration; })
        {
            upgrades = upgrades | parse_upgrades(Kind::declaration);
        }
        return upgrades;
    }

    template<typename Kind>
    inline constexpr Upgrades upgrades_v = upgrades_of<Kind>();

    template<typename Kind, Upgrade U>
    inline constexpr bool has_upgrade_v = upgrades_v<Kind>.contains(U);
}    // namespace vetted
