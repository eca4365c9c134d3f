#pragma once

#include "builtins/collection.hpp"
#include "builtins/compare.hpp"
#include "builtins/numeric.hpp"
#include "builtins/ops.hpp"
#include "builtins/unicode.hpp"
#include "declaration.hpp"
#include "error.hpp"
#include "pipeline.hpp"

#include <fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace vetted
{
    template<typename T>
    struct Registry;

    // The catalog registry of `T`, built on first use and shared afterwards.
    template<typename T>
    const Registry<T>& default_registry();

    namespace detail
    {
        template<typename T>
        inline constexpr bool orderable_v = requires(const T& a, const T& b) {
            a < b;
            a == b;
        };

        template<typename T>
        inline constexpr bool equality_comparable_v = requires(const T& a, const T& b) { a == b; };

        constexpr std::optional<Relation> relation_from_name(std::string_view name)
        {
            for (auto relation : {Relation::lt, Relation::le, Relation::gt, Relation::ge, Relation::eq, Relation::ne})
            {
                if (name == relation_name(relation))
                {
                    return relation;
                }
            }
            return std::nullopt;
        }

        template<typename V>
        V number_as(const Number& number, const Expression& call)
        {
            return std::visit(
                [&call](auto n) -> V {
                    using N = decltype(n);
                    if constexpr (std::is_arithmetic_v<V> && !std::is_same_v<V, char> && !std::is_same_v<V, bool>)
                    {
                        if constexpr (std::is_integral_v<V> && std::is_floating_point_v<N>)
                        {
                            throw DeclarationError(
                                fmt::format("{}: expected an integer, found {}", to_string(call), n));
                        }
                        else
                        {
                            return compare::detail::convert_bound<V>(n);
                        }
                    }
                    else
                    {
                        throw DeclarationError(fmt::format("{}: a number does not fit the checked type", to_string(call)));
                    }
                },
                number);
        }
    }    // namespace detail

    // Throws DeclarationError unless `call` has exactly `count` arguments.
    inline void expect_arity(const Expression& call, size_t count)
    {
        if (call.arguments.size() != count)
        {
            throw DeclarationError(fmt::format("{} takes {} argument{}, found {}",
                                               call.name,
                                               count,
                                               count == 1 ? "" : "s",
                                               call.arguments.size()));
        }
    }

    // The literal argument at `index` of `call`, converted to `V`. Numbers convert to
    // arithmetic types, strings to string types, to `char` when one byte long and to
    // `char32_t` when one code point long.
    template<typename V>
    V argument_as(const Expression& call, size_t index)
    {
        const Expression& argument = call.arguments.at(index);
        if (!argument.is_literal())
        {
            throw DeclarationError(
                fmt::format("{}: argument {} must be a literal, found {}", call.name, index + 1, to_string(argument)));
        }
        return std::visit(
            [&](const auto& literal) -> V {
                using L = std::decay_t<decltype(literal)>;
                if constexpr (std::is_same_v<L, std::int64_t> || std::is_same_v<L, double>)
                {
                    return detail::number_as<V>(Number{literal}, call);
                }
                else if constexpr (std::is_same_v<L, std::string> && std::is_same_v<V, char>)
                {
                    if (literal.size() != 1)
                    {
                        throw DeclarationError(
                            fmt::format("{}: expected a single character, found '{}'", call.name, literal));
                    }
                    return literal.front();
                }
                else if constexpr (std::is_same_v<L, std::string> && std::is_same_v<V, char32_t>)
                {
                    auto code_point = unicode::single_code_point(literal);
                    if (!code_point)
                    {
                        throw DeclarationError(
                            fmt::format("{}: expected a single code point, found '{}'", call.name, literal));
                    }
                    return *code_point;
                }
                else if constexpr (std::is_same_v<L, std::string> && std::is_constructible_v<V, const std::string&>)
                {
                    return V(literal);
                }
                else
                {
                    throw DeclarationError(
                        fmt::format("{}: argument {} has the wrong type", call.name, to_string(argument)));
                }
            },
            *argument.literal);
    }

    inline Interval interval_argument(const Expression& call, size_t index)
    {
        const Expression& argument = call.arguments.at(index);
        if (!argument.is_literal() || !std::holds_alternative<Interval>(*argument.literal))
        {
            throw DeclarationError(fmt::format("{}: argument {} must be a range like 5..=20, found {}",
                                               call.name,
                                               index + 1,
                                               to_string(argument)));
        }
        return std::get<Interval>(*argument.literal);
    }

    // Identifier table a declaration is resolved against. Besides what is added to it,
    // every registry knows the combinators `all`, `any`, `either`, `not`, the constants
    // `valid` and `invalid`, and for comparable types `lt`, `le`, `gt`, `ge`, `eq`, `ne`,
    // `within` and `among`.
    template<typename T>
    struct Registry
    {
        using SanitizerFactory = std::function<Sanitizer<T>(const Expression&)>;
        using CheckFactory     = std::function<ValidationNode<T>(const Registry&, const Expression&)>;
        using Measure          = std::function<std::size_t(const T&)>;

        Registry& add_sanitizer(std::string name, Sanitizer<T> step)
        {
            return add_sanitizer_factory(std::move(name), [step = std::move(step)](const Expression& call) {
                expect_arity(call, 0);
                return step;
            });
        }

        Registry& add_sanitizer_factory(std::string name, SanitizerFactory factory)
        {
            m_sanitizers.insert_or_assign(std::move(name), std::move(factory));
            return *this;
        }

        Registry& add_check(std::string name, ValidationNode<T> check)
        {
            return add_check_factory(std::move(name), [check = std::move(check)](const Registry&, const Expression& call) {
                expect_arity(call, 0);
                return check;
            });
        }

        Registry& add_check(std::string name, std::function<bool(const T&)> check)
        {
            std::string label = name;
            return add_check(std::move(name), ValidationNode<T>{node::Predicate<T>{std::move(label), std::move(check)}});
        }

        Registry& add_check_factory(std::string name, CheckFactory factory)
        {
            m_checks.insert_or_assign(std::move(name), std::move(factory));
            return *this;
        }

        // `name(check)` then evaluates `check` over the measured size.
        Registry& add_measure(std::string name, Measure measure)
        {
            m_measures.insert_or_assign(std::move(name), std::move(measure));
            return *this;
        }

        Sanitizer<T> resolve_sanitizer(const Expression& step) const
        {
            if (step.is_literal())
            {
                throw DeclarationError(fmt::format("expected a sanitizer, found {}", to_string(step)));
            }
            auto it = m_sanitizers.find(step.name);
            if (it == m_sanitizers.end())
            {
                throw DeclarationError(fmt::format("unknown sanitizer '{}'", step.name));
            }
            return it->second(step);
        }

        ValidationNode<T> resolve_check(const Expression& check) const
        {
            if (check.is_literal())
            {
                throw DeclarationError(fmt::format("expected a check, found {}", to_string(check)));
            }
            if (auto it = m_checks.find(check.name); it != m_checks.end())
            {
                return it->second(*this, check);
            }
            if (auto it = m_measures.find(check.name); it != m_measures.end())
            {
                expect_arity(check, 1);
                return project<T>(check.name, it->second, default_registry<std::size_t>().resolve_check(check.arguments[0]));
            }
            return resolve_builtin(check);
        }

        Pipeline<T> resolve(const Declaration& declaration) const
        {
            std::vector<Sanitizer<T>> steps;
            for (const auto& step : declaration.sanitizers)
            {
                steps.push_back(resolve_sanitizer(step));
            }

            Pipeline<T> pipeline{SanitizationChain<T>(std::move(steps)), {}};
            if (declaration.validators.size() == 1)
            {
                pipeline.validators = ValidationTree<T>(resolve_check(declaration.validators.front()));
            }
            else if (declaration.validators.size() > 1)
            {
                pipeline.validators = ValidationTree<T>(ValidationNode<T>(node::AllOf<T>{resolve_all(declaration.validators)}));
            }
            return pipeline;
        }

        Pipeline<T> resolve(std::string_view declaration) const { return resolve(parse_declaration(declaration)); }

    private:
        std::vector<ValidationNode<T>> resolve_all(const std::vector<Expression>& checks) const
        {
            std::vector<ValidationNode<T>> nodes;
            nodes.reserve(checks.size());
            for (const auto& check : checks)
            {
                nodes.push_back(resolve_check(check));
            }
            return nodes;
        }

        ValidationNode<T> resolve_builtin(const Expression& check) const
        {
            const std::string& name = check.name;
            if (name == "all" || name == "any")
            {
                if (check.arguments.empty())
                {
                    throw DeclarationError(fmt::format("{} needs at least one check", name));
                }
                if (name == "all")
                {
                    return node::AllOf<T>{resolve_all(check.arguments)};
                }
                return node::AnyOf<T>{resolve_all(check.arguments)};
            }
            if (name == "either")
            {
                expect_arity(check, 2);
                return ops::either(resolve_check(check.arguments[0]), resolve_check(check.arguments[1]));
            }
            if (name == "not")
            {
                expect_arity(check, 1);
                return ops::negate(resolve_check(check.arguments[0]));
            }
            if (name == "valid" || name == "invalid")
            {
                expect_arity(check, 0);
                return name == "valid" ? ops::valid<T>() : ops::invalid<T>();
            }

            if constexpr (detail::orderable_v<T>)
            {
                if (auto relation = detail::relation_from_name(name))
                {
                    expect_arity(check, 1);
                    return compare::Relational<T>{*relation, argument_as<T>(check, 0)};
                }
                if (name == "within")
                {
                    expect_arity(check, 1);
                    Interval interval = interval_argument(check, 0);
                    return compare::Bounded<T>{detail::number_as<T>(interval.low, check),
                                               detail::number_as<T>(interval.high, check),
                                               true,
                                               interval.inclusive};
                }
            }
            if constexpr (detail::equality_comparable_v<T>)
            {
                if (name == "among")
                {
                    if (check.arguments.empty())
                    {
                        throw DeclarationError("among needs at least one value");
                    }
                    std::vector<T> values;
                    for (size_t i = 0; i < check.arguments.size(); ++i)
                    {
                        values.push_back(argument_as<T>(check, i));
                    }
                    return collection::among(std::move(values));
                }
            }
            throw DeclarationError(fmt::format("unknown check '{}'", name));
        }

        std::map<std::string, SanitizerFactory, std::less<>> m_sanitizers;
        std::map<std::string, CheckFactory, std::less<>> m_checks;
        std::map<std::string, Measure, std::less<>> m_measures;
    };

    // Arithmetic types get the clamp sanitizers, floating types also `finite`.
    template<typename T>
    Registry<T> make_default_registry()
    {
        Registry<T> registry;
        if constexpr (std::is_arithmetic_v<T> && !std::is_same_v<T, bool>)
        {
            registry
                .add_sanitizer_factory("clamp",
                                       [](const Expression& call) {
                                           expect_arity(call, 2);
                                           return numeric::clamp<T>(argument_as<T>(call, 0), argument_as<T>(call, 1));
                                       })
                .add_sanitizer_factory("clamp_min",
                                       [](const Expression& call) {
                                           expect_arity(call, 1);
                                           return numeric::clamp_min<T>(argument_as<T>(call, 0));
                                       })
                .add_sanitizer_factory("clamp_max", [](const Expression& call) {
                    expect_arity(call, 1);
                    return numeric::clamp_max<T>(argument_as<T>(call, 0));
                });
        }
        if constexpr (std::is_floating_point_v<T>)
        {
            registry.add_check("finite", numeric::finite<T>());
        }
        return registry;
    }

    template<>
    Registry<std::string> make_default_registry<std::string>();

    template<>
    Registry<char> make_default_registry<char>();

    template<>
    Registry<char32_t> make_default_registry<char32_t>();

    template<typename T>
    const Registry<T>& default_registry()
    {
        static const Registry<T> registry = make_default_registry<T>();
        return registry;
    }
}    // namespace vetted
