#include "vetted/declaration.hpp"

#include "vetted/error.hpp"

#include <fmt/format.h>

#include <charconv>
#include <type_traits>
#include <utility>
#include <variant>

namespace vetted
{
    namespace
    {
        bool is_identifier_start(char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_'; }
        bool is_digit(char c) { return c >= '0' && c <= '9'; }

        struct Parser
        {
            explicit Parser(std::string_view text) : m_text{text} {}

            Declaration parse()
            {
                Declaration declaration;
                bool seen_upgrades = false;
                bool seen_sanitize = false;
                bool seen_validate = false;

                skip_space();
                if (at_end())
                {
                    return declaration;
                }
                while (true)
                {
                    size_t clause_pos  = m_pos;
                    std::string clause = identifier();
                    if (clause == "upgrades")
                    {
                        once(seen_upgrades, clause, clause_pos);
                        declaration.upgrades = upgrade_list();
                    }
                    else if (clause == "sanitize")
                    {
                        once(seen_sanitize, clause, clause_pos);
                        declaration.sanitizers = expression_list();
                    }
                    else if (clause == "validate")
                    {
                        once(seen_validate, clause, clause_pos);
                        declaration.validators = expression_list();
                    }
                    else
                    {
                        m_pos = clause_pos;
                        fail(fmt::format("unknown clause '{}'", clause));
                    }

                    skip_space();
                    if (at_end())
                    {
                        return declaration;
                    }
                    expect(',');
                    skip_space();
                    if (at_end())
                    {
                        return declaration;
                    }
                }
            }

        private:
            [[noreturn]] void fail(const std::string& message) const
            {
                throw DeclarationError(fmt::format("{} at offset {} of declaration \"{}\"", message, m_pos, m_text));
            }

            bool at_end() const { return m_pos >= m_text.size(); }
            char peek() const { return at_end() ? '\0' : m_text[m_pos]; }

            void skip_space() { m_pos = detail::skip_space(m_text, m_pos); }

            void expect(char c)
            {
                skip_space();
                if (peek() != c)
                {
                    fail(at_end() ? fmt::format("expected '{}', found end of text", c)
                                  : fmt::format("expected '{}', found '{}'", c, peek()));
                }
                ++m_pos;
            }

            bool accept(char c)
            {
                skip_space();
                if (peek() == c)
                {
                    ++m_pos;
                    return true;
                }
                return false;
            }

            void once(bool& seen, const std::string& clause, size_t clause_pos)
            {
                if (seen)
                {
                    m_pos = clause_pos;
                    fail(fmt::format("clause '{}' appears more than once", clause));
                }
                seen = true;
            }

            std::string identifier()
            {
                skip_space();
                if (!is_identifier_start(peek()))
                {
                    fail("expected an identifier");
                }
                size_t begin = m_pos;
                while (!at_end() && detail::is_identifier_char(m_text[m_pos]))
                {
                    ++m_pos;
                }
                return std::string(m_text.substr(begin, m_pos - begin));
            }

            Upgrades upgrade_list()
            {
                Upgrades upgrades;
                expect('(');
                if (accept(')'))
                {
                    return upgrades;
                }
                do
                {
                    size_t name_pos  = m_pos;
                    std::string name = identifier();
                    try
                    {
                        upgrades = upgrades.with(upgrade_from_name(name));
                    }
                    catch (const DeclarationError&)
                    {
                        m_pos = name_pos;
                        fail(fmt::format("unrecognized upgrade '{}'", name));
                    }
                } while (accept(','));
                expect(')');
                return upgrades;
            }

            std::vector<Expression> expression_list()
            {
                std::vector<Expression> expressions;
                expect('(');
                if (accept(')'))
                {
                    return expressions;
                }
                do
                {
                    expressions.push_back(expression());
                } while (accept(','));
                expect(')');
                return expressions;
            }

            Expression expression()
            {
                skip_space();
                char c = peek();
                if (c == '"' || c == '\'')
                {
                    return Expression{{}, {}, Literal{quoted()}};
                }
                if (is_digit(c) || c == '-' || c == '+')
                {
                    Number low = number();
                    skip_space();
                    if (m_text.substr(m_pos, 2) != "..")
                    {
                        return Expression{{}, {}, std::visit([](auto n) { return Literal{n}; }, low)};
                    }
                    m_pos += 2;
                    bool inclusive = peek() == '=';
                    if (inclusive)
                    {
                        ++m_pos;
                    }
                    skip_space();
                    Number high = number();
                    return Expression{{}, {}, Literal{Interval{low, high, inclusive}}};
                }

                Expression call;
                call.name = identifier();
                skip_space();
                if (peek() == '(')
                {
                    call.arguments = expression_list();
                }
                return call;
            }

            Number number()
            {
                size_t begin = m_pos;
                bool floating = false;
                if (peek() == '-' || peek() == '+')
                {
                    ++m_pos;
                }
                if (!is_digit(peek()))
                {
                    fail("expected a number");
                }
                while (is_digit(peek()))
                {
                    ++m_pos;
                }
                // A '.' only starts a fraction when a digit follows; `5..20` is a range.
                if (peek() == '.' && m_pos + 1 < m_text.size() && is_digit(m_text[m_pos + 1]))
                {
                    floating = true;
                    ++m_pos;
                    while (is_digit(peek()))
                    {
                        ++m_pos;
                    }
                }
                if (peek() == 'e' || peek() == 'E')
                {
                    floating = true;
                    ++m_pos;
                    if (peek() == '-' || peek() == '+')
                    {
                        ++m_pos;
                    }
                    if (!is_digit(peek()))
                    {
                        fail("expected an exponent");
                    }
                    while (is_digit(peek()))
                    {
                        ++m_pos;
                    }
                }

                std::string_view text = m_text.substr(begin, m_pos - begin);
                if (text.front() == '+')
                {
                    text.remove_prefix(1);
                }
                if (floating)
                {
                    double value = 0;
                    auto result  = std::from_chars(text.data(), text.data() + text.size(), value);
                    if (result.ec != std::errc{})
                    {
                        m_pos = begin;
                        fail(fmt::format("number {} is out of range", text));
                    }
                    return value;
                }
                std::int64_t value = 0;
                auto result        = std::from_chars(text.data(), text.data() + text.size(), value);
                if (result.ec != std::errc{})
                {
                    m_pos = begin;
                    fail(fmt::format("integer {} is out of range", text));
                }
                return value;
            }

            // "..." understands \\, \", \n and \t escapes; '...' is taken verbatim.
            std::string quoted()
            {
                char quote = m_text[m_pos++];
                std::string value;
                while (true)
                {
                    if (at_end())
                    {
                        fail("unterminated string");
                    }
                    char c = m_text[m_pos++];
                    if (c == quote)
                    {
                        return value;
                    }
                    if (c == '\\' && quote == '"')
                    {
                        if (at_end())
                        {
                            fail("unterminated string");
                        }
                        char escaped = m_text[m_pos++];
                        switch (escaped)
                        {
                            case 'n':
                                value += '\n';
                                break;
                            case 't':
                                value += '\t';
                                break;
                            case '\\':
                            case '"':
                                value += escaped;
                                break;
                            default:
                                --m_pos;
                                fail(fmt::format("unknown escape '\\{}'", escaped));
                        }
                        continue;
                    }
                    value += c;
                }
            }

            std::string_view m_text;
            size_t m_pos = 0;
        };
    }    // namespace

    Declaration parse_declaration(std::string_view text) { return Parser{text}.parse(); }

    std::string to_string(const Number& number)
    {
        return std::visit([](auto n) { return fmt::format("{}", n); }, number);
    }

    std::string to_string(const Expression& expression)
    {
        if (expression.literal)
        {
            return std::visit(
                [](const auto& literal) -> std::string {
                    using L = std::decay_t<decltype(literal)>;
                    if constexpr (std::is_same_v<L, std::string>)
                    {
                        return fmt::format("'{}'", literal);
                    }
                    else if constexpr (std::is_same_v<L, Interval>)
                    {
                        return to_string(literal.low) + (literal.inclusive ? "..=" : "..") + to_string(literal.high);
                    }
                    else
                    {
                        return fmt::format("{}", literal);
                    }
                },
                *expression.literal);
        }
        if (expression.arguments.empty())
        {
            return expression.name;
        }
        std::string text = expression.name + "(";
        for (size_t i = 0; i < expression.arguments.size(); ++i)
        {
            if (i > 0)
            {
                text += ", ";
            }
            text += to_string(expression.arguments[i]);
        }
        return text + ")";
    }
}    // namespace vetted
