#include "vetted/vetted.hpp"

#include "register_example.hpp"

#include <fmt/core.h>
#include <fmt/format.h>

#include <optional>
#include <string>
#include <unordered_set>

namespace fmt
{
    template<typename T>
    struct formatter<std::optional<T>> : fmt::formatter<T>
    {
        template<typename FormatContext>
        auto format(const std::optional<T>& opt, FormatContext& ctx)
        {
            if (opt)
            {
                return fmt::format_to(ctx.out(), "Some({})", *opt);
            }
            return fmt::format_to(ctx.out(), "None");
        }
    };
}    // namespace fmt

using namespace vetted;

struct UsernameKind
{
    using Inner = std::string;
    static constexpr Upgrades upgrades{Upgrade::display, Upgrade::equality, Upgrade::hash};

    static Pipeline<std::string> pipeline()
    {
        return {{string::trim()}, {string::alphanumeric(), string::length_chars(compare::within(5, 20))}};
    }
};
using Username = Newtype<UsernameKind>;

struct PercentKind
{
    using Inner = int;
    static constexpr std::string_view declaration = "upgrades(display, ordering), sanitize(clamp(0, 100))";
};
using Percent = Newtype<PercentKind>;

struct CardKind
{
    using Inner = std::string;
    static constexpr std::string_view declaration = "upgrades(display), sanitize(trim), validate(credit_card_number)";
};
using Card = Newtype<CardKind>;

void demo_untrusted()
{
    fmt::print("### {} ###\n", __func__);
    SanitizationChain<int> chain{numeric::clamp_max(40)};
    ValidationTree<int> tree{compare::gt(30)};
    for (auto input : {5, 42})
    {
        Untrusted<int> untrusted{input};
        auto verified = std::move(untrusted.sanitize(chain)).verify(tree);

        fmt::print("raw:      {}\n", input);
        fmt::print("checks:   {}\n", describe(tree));
        fmt::print("verified: {}\n\n", verified);
    }
}

void demo_username()
{
    fmt::print("### {} ###\n", __func__);
    fmt::print("checks: {}\n", describe(Username::pipeline().validators));
    for (auto input : {"   username   ", "   u$ername   ", "user", "username_that_is_far_too_long"})
    {
        fmt::print("{:<32} -> {}\n", fmt::format("\"{}\"", input), Username::try_new(input));
    }

    std::unordered_set<Username> taken;
    taken.insert(Username::unchecked_new("seventy"));
    auto candidate = Username::try_new("  seventy ");
    fmt::print("\"seventy\" taken: {}\n", candidate && taken.count(*candidate) > 0);
}

void demo_declaration()
{
    fmt::print("### {} ###\n", __func__);
    for (auto input : {-5, 42, 250})
    {
        fmt::print("percent {:>4} -> {}\n", input, Percent::try_new(input));
    }
    fmt::print("50% < 75%: {}\n", *Percent::try_new(50) < *Percent::try_new(75));

    for (auto input : {" 4111111111111111 ", "4111111111111112", "378282246310005"})
    {
        auto issuer = domain::credit_card_issuer(string::trimmed(input));
        fmt::print("card \"{}\" -> {} ({})\n", input, Card::try_new(input), issuer ? domain::issuer_name(*issuer) : "none");
    }

    try
    {
        default_registry<std::string>().resolve("sanitize(trim), validate(alphanumerical)");
    }
    catch (const DeclarationError& error)
    {
        fmt::print("declaration error: {}\n", error.what());
    }
}

int main()
{
    demo_untrusted();
    fmt::print("\n");
    demo_username();
    fmt::print("\n");
    demo_declaration();
    fmt::print("\n");
    register_example();
}
