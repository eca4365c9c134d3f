#pragma once

#include <compare>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace vetted
{
    enum class Relation
    {
        lt,
        le,
        gt,
        ge,
        eq,
        ne
    };

    constexpr const char* relation_name(Relation relation)
    {
        switch (relation)
        {
            case Relation::lt:
                return "lt";
            case Relation::le:
                return "le";
            case Relation::gt:
                return "gt";
            case Relation::ge:
                return "ge";
            case Relation::eq:
                return "eq";
            case Relation::ne:
                return "ne";
        }
        return "?";
    }

    // Whether an ordering of target against bound satisfies the relation.
    // Unordered results (NaN) only satisfy `ne`.
    constexpr bool satisfies(std::partial_ordering ordering, Relation relation)
    {
        switch (relation)
        {
            case Relation::lt:
                return std::is_lt(ordering);
            case Relation::le:
                return std::is_lteq(ordering);
            case Relation::gt:
                return std::is_gt(ordering);
            case Relation::ge:
                return std::is_gteq(ordering);
            case Relation::eq:
                return std::is_eq(ordering);
            case Relation::ne:
                return std::is_neq(ordering);
        }
        return false;
    }

    // Three-way ordering built from `<` and `==` only, so that types without
    // `operator<=>` can still be bounded.
    template<typename A, typename B>
    std::partial_ordering order(const A& a, const B& b)
    {
        if (a < b)
        {
            return std::partial_ordering::less;
        }
        if (b < a)
        {
            return std::partial_ordering::greater;
        }
        if (a == b)
        {
            return std::partial_ordering::equivalent;
        }
        return std::partial_ordering::unordered;
    }

    template<typename T>
    struct ValidationNode;

    namespace node
    {
        // Orders a target (or a scalar derived from it) against a fixed bound.
        template<typename T>
        using Ordering = std::function<std::partial_ordering(const T&)>;

        template<typename T>
        struct Predicate
        {
            std::string name;
            std::function<bool(const T&)> check;

            bool evaluate(const T& target) const { return check(target); }
        };

        template<typename T>
        struct AllOf
        {
            std::vector<ValidationNode<T>> children;

            bool evaluate(const T& target) const
            {
                for (const auto& child : children)
                {
                    if (!child.evaluate(target))
                    {
                        return false;
                    }
                }
                return true;
            }
        };

        template<typename T>
        struct AnyOf
        {
            std::vector<ValidationNode<T>> children;

            bool evaluate(const T& target) const
            {
                for (const auto& child : children)
                {
                    if (child.evaluate(target))
                    {
                        return true;
                    }
                }
                return false;
            }
        };

        template<typename T>
        struct Not
        {
            std::shared_ptr<const ValidationNode<T>> child;

            bool evaluate(const T& target) const { return !child->evaluate(target); }
        };

        template<typename T>
        struct Comparison
        {
            Relation relation;
            std::string bound;
            Ordering<T> order;

            bool evaluate(const T& target) const { return satisfies(order(target), relation); }
        };

        template<typename T>
        struct Bound
        {
            std::string label;
            bool inclusive;
            Ordering<T> order;
        };

        template<typename T>
        struct Range
        {
            std::optional<Bound<T>> lower;
            std::optional<Bound<T>> upper;

            bool evaluate(const T& target) const
            {
                if (lower)
                {
                    auto ordering = lower->order(target);
                    if (!(lower->inclusive ? std::is_gteq(ordering) : std::is_gt(ordering)))
                    {
                        return false;
                    }
                }
                if (upper)
                {
                    auto ordering = upper->order(target);
                    if (!(upper->inclusive ? std::is_lteq(ordering) : std::is_lt(ordering)))
                    {
                        return false;
                    }
                }
                return true;
            }
        };

        // A sub-tree evaluated over a value derived from the target. The sub-tree's
        // type is erased into `evaluate`; `inner` keeps its description.
        template<typename T>
        struct Projection
        {
            std::string name;
            std::string inner;
            std::function<bool(const T&)> evaluate_projected;

            bool evaluate(const T& target) const { return evaluate_projected(target); }
        };
    }    // namespace node

    template<typename T>
    struct ValidationNode
    {
        using Variant = std::variant<node::Predicate<T>,
                                  node::AllOf<T>,
                                  node::AnyOf<T>,
                                  node::Not<T>,
                                  node::Comparison<T>,
                                  node::Range<T>,
                                  node::Projection<T>>;

        ValidationNode(node::Predicate<T> n) : kind{std::move(n)} {}
        ValidationNode(node::AllOf<T> n) : kind{std::move(n)} {}
        ValidationNode(node::AnyOf<T> n) : kind{std::move(n)} {}
        ValidationNode(node::Not<T> n) : kind{std::move(n)} {}
        ValidationNode(node::Comparison<T> n) : kind{std::move(n)} {}
        ValidationNode(node::Range<T> n) : kind{std::move(n)} {}
        ValidationNode(node::Projection<T> n) : kind{std::move(n)} {}

        bool evaluate(const T& target) const
        {
            return std::visit([&target](const auto& n) { return n.evaluate(target); }, kind);
        }

        Variant kind;
    };

    // The checks of one newtype kind. An empty tree accepts every value; several
    // top-level checks are implicitly combined with AND.
    template<typename T>
    struct ValidationTree
    {
        ValidationTree() = default;
        ValidationTree(ValidationNode<T> root) : m_root{std::move(root)} {}
        ValidationTree(std::initializer_list<ValidationNode<T>> checks)
        {
            if (checks.size() == 1)
            {
                m_root.emplace(*checks.begin());
            }
            else if (checks.size() > 1)
            {
                m_root.emplace(node::AllOf<T>{std::vector<ValidationNode<T>>(checks)});
            }
        }

        bool evaluate(const T& target) const { return !m_root || m_root->evaluate(target); }

        bool empty() const { return !m_root.has_value(); }
        const std::optional<ValidationNode<T>>& root() const { return m_root; }

    private:
        std::optional<ValidationNode<T>> m_root;
    };

    // Renders a node in declaration syntax, e.g. `all(alphanumeric, length_chars(within(5..=20)))`.
    template<typename T>
    std::string describe(const ValidationNode<T>& check);

    namespace detail
    {
        template<typename T>
        std::string describe_children(const char* name, const std::vector<ValidationNode<T>>& children)
        {
            std::string text = name;
            text += '(';
            for (size_t i = 0; i < children.size(); ++i)
            {
                if (i > 0)
                {
                    text += ", ";
                }
                text += describe(children[i]);
            }
            text += ')';
            return text;
        }

        template<typename T>
        std::string describe_range(const node::Range<T>& range)
        {
            const auto& lower = range.lower;
            const auto& upper = range.upper;
            if (lower && upper && lower->inclusive)
            {
                return "within(" + lower->label + (upper->inclusive ? "..=" : "..") + upper->label + ")";
            }
            std::string lower_text;
            std::string upper_text;
            if (lower)
            {
                lower_text = std::string(lower->inclusive ? "ge(" : "gt(") + lower->label + ")";
            }
            if (upper)
            {
                upper_text = std::string(upper->inclusive ? "le(" : "lt(") + upper->label + ")";
            }
            if (lower && upper)
            {
                return "all(" + lower_text + ", " + upper_text + ")";
            }
            if (lower)
            {
                return lower_text;
            }
            if (upper)
            {
                return upper_text;
            }
            return "valid";
        }
    }    // namespace detail

    template<typename T>
    std::string describe(const ValidationNode<T>& check)
    {
        return std::visit(
            [](const auto& n) -> std::string {
                using Node = std::decay_t<decltype(n)>;
                if constexpr (std::is_same_v<Node, node::Predicate<T>>)
                {
                    return n.name;
                }
                else if constexpr (std::is_same_v<Node, node::AllOf<T>>)
                {
                    return detail::describe_children("all", n.children);
                }
                else if constexpr (std::is_same_v<Node, node::AnyOf<T>>)
                {
                    return detail::describe_children("any", n.children);
                }
                else if constexpr (std::is_same_v<Node, node::Not<T>>)
                {
                    return "not(" + describe(*n.child) + ")";
                }
                else if constexpr (std::is_same_v<Node, node::Comparison<T>>)
                {
                    return std::string(relation_name(n.relation)) + "(" + n.bound + ")";
                }
                else if constexpr (std::is_same_v<Node, node::Range<T>>)
                {
                    return detail::describe_range(n);
                }
                else
                {
                    return n.name + "(" + n.inner + ")";
                }
            },
            check.kind);
    }

    template<typename T>
    std::string describe(const ValidationTree<T>& tree)
    {
        return tree.root() ? describe(*tree.root()) : std::string{};
    }

    // Evaluates `inner` over the scalar `derive` computes from the target.
    template<typename T, typename U, typename Derive>
    ValidationNode<T> project(std::string name, Derive derive, ValidationNode<U> inner)
    {
        std::string text = describe(inner);
        return node::Projection<T>{std::move(name),
                                   std::move(text),
                                   [derive = std::move(derive), inner = std::move(inner)](const T& target) {
                                       return inner.evaluate(derive(target));
                                   }};
    }

    // Like project, for derivations that may not exist: `derive` returns an optional or a
    // pointer, and an absent result evaluates to `when_absent` without consulting `inner`.
    template<typename T, typename U, typename Derive>
    ValidationNode<T> project_if(std::string name, Derive derive, ValidationNode<U> inner, bool when_absent)
    {
        std::string text = describe(inner);
        return node::Projection<T>{std::move(name),
                                   std::move(text),
                                   [derive = std::move(derive), inner = std::move(inner), when_absent](const T& target) {
                                       if (auto derived = derive(target))
                                       {
                                           return inner.evaluate(*derived);
                                       }
                                       return when_absent;
                                   }};
    }
}    // namespace vetted
