#include "vetted/newtype.hpp"
#include "vetted/registry.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace vetted;

namespace
{
    struct UsernameKind
    {
        using Inner = std::string;
        static constexpr std::string_view declaration =
            "upgrades(display), sanitize(trim), validate(alphanumeric, length::chars(within(5..=20)))";
    };
    using Username = Newtype<UsernameKind>;

    struct SlugKind
    {
        using Inner = std::string;
        static constexpr std::string_view declaration =
            "sanitize(trim, slugify), validate(not_empty, not(matches('--')))";

        static Registry<std::string> registry()
        {
            Registry<std::string> registry = default_registry<std::string>();
            registry.add_sanitizer("slugify", [](std::string target) {
                for (auto& c : target)
                {
                    if (c == ' ')
                    {
                        c = '-';
                    }
                }
                return target;
            });
            return registry;
        }
    };
    using Slug = Newtype<SlugKind>;

    struct LetterKind
    {
        using Inner = char;
        static constexpr std::string_view declaration = "validate(alphabetic, lowercase, ne('x'))";
    };
    using Letter = Newtype<LetterKind>;

    struct GlyphKind
    {
        using Inner = char32_t;
        static constexpr std::string_view declaration = "validate(alphabetic, uppercase, ne('\xCE\xA3'))";
    };
    using Glyph = Newtype<GlyphKind>;

    struct RatioKind
    {
        using Inner = double;
        static constexpr std::string_view declaration = "sanitize(clamp_max(1.0)), validate(finite, ge(0))";
    };
    using Ratio = Newtype<RatioKind>;
}    // namespace

TEST(Registry, DeclaredUsername)
{
    auto accepted = Username::try_new("   username   ");

    ASSERT_TRUE(accepted.has_value());
    EXPECT_EQ(accepted->to_inner(), "username");
    EXPECT_FALSE(Username::try_new("   u$ername   ").has_value());
    EXPECT_FALSE(Username::try_new("user").has_value());
    EXPECT_EQ(describe(Username::pipeline().validators), "all(alphanumeric, length::chars(within(5..=20)))");
}

TEST(Registry, KindRegistryAddsSteps)
{
    auto slug = Slug::try_new("  hello big world ");

    ASSERT_TRUE(slug.has_value());
    EXPECT_EQ(slug->to_inner(), "hello-big-world");
    EXPECT_FALSE(Slug::try_new("a  b").has_value());
    EXPECT_FALSE(Slug::try_new("   ").has_value());
}

TEST(Registry, CharKind)
{
    EXPECT_TRUE(Letter::try_new('q').has_value());
    EXPECT_FALSE(Letter::try_new('Q').has_value());
    EXPECT_FALSE(Letter::try_new('x').has_value());
    EXPECT_FALSE(Letter::try_new('7').has_value());
}

TEST(Registry, CodePointKind)
{
    EXPECT_TRUE(Glyph::try_new(U'\u00C9').has_value());
    EXPECT_TRUE(Glyph::try_new(U'\u0394').has_value());
    EXPECT_FALSE(Glyph::try_new(U'\u03A3').has_value());
    EXPECT_FALSE(Glyph::try_new(U'\u00E9').has_value());
    EXPECT_EQ(describe(Glyph::pipeline().validators), "all(alphabetic, uppercase, ne(U+03A3))");
    EXPECT_THROW(default_registry<char32_t>().resolve("validate(eq('ab'))"), DeclarationError);
}

TEST(Registry, FloatingKind)
{
    auto ratio = Ratio::try_new(3.5);

    ASSERT_TRUE(ratio.has_value());
    EXPECT_DOUBLE_EQ(ratio->to_inner(), 1.0);
    EXPECT_FALSE(Ratio::try_new(-0.5).has_value());
}

TEST(Registry, Combinators)
{
    const auto& registry = default_registry<int>();
    auto pipeline        = registry.resolve("validate(any(lt(0), all(ge(10), le(20))), not(eq(15)), among(-1, 12, 15))");

    EXPECT_TRUE(pipeline.validators.evaluate(-1));
    EXPECT_TRUE(pipeline.validators.evaluate(12));
    EXPECT_FALSE(pipeline.validators.evaluate(15));
    EXPECT_FALSE(pipeline.validators.evaluate(-2));
    EXPECT_EQ(describe(pipeline.validators), "all(any(lt(0), all(ge(10), le(20))), not(eq(15)), among(-1, 12, 15))");
}

TEST(Registry, EitherAndConstants)
{
    const auto& registry = default_registry<int>();

    EXPECT_TRUE(registry.resolve("validate(either(invalid, valid))").validators.evaluate(0));
    EXPECT_FALSE(registry.resolve("validate(invalid)").validators.evaluate(0));
}

TEST(Registry, ExclusiveRange)
{
    auto pipeline = default_registry<int>().resolve("validate(within(0..10))");

    EXPECT_TRUE(pipeline.validators.evaluate(9));
    EXPECT_FALSE(pipeline.validators.evaluate(10));
}

TEST(Registry, StringComparisonsAndEmail)
{
    auto pipeline = default_registry<std::string>().resolve("sanitize(trim, lowercase), validate(email, ne('admin@example.com'))");

    EXPECT_TRUE(pipeline.run(Untrusted<std::string>{"  Seventy70@Example.com "}).has_value());
    EXPECT_FALSE(pipeline.run(Untrusted<std::string>{"ADMIN@example.com"}).has_value());
    EXPECT_FALSE(pipeline.run(Untrusted<std::string>{"not an email"}).has_value());
}

TEST(Registry, UnknownIdentifiersAreDeclarationErrors)
{
    const auto& registry = default_registry<std::string>();

    EXPECT_THROW(registry.resolve("sanitize(shout)"), DeclarationError);
    EXPECT_THROW(registry.resolve("validate(alphanumerical)"), DeclarationError);
    EXPECT_THROW(registry.resolve("validate(length::chars(within(5..=20), 3))"), DeclarationError);
    EXPECT_THROW(registry.resolve("validate(length::chars(shorter))"), DeclarationError);
}

TEST(Registry, WrongArgumentsAreDeclarationErrors)
{
    EXPECT_THROW(default_registry<std::string>().resolve("sanitize(trim(1))"), DeclarationError);
    EXPECT_THROW(default_registry<std::string>().resolve("validate(matches(1))"), DeclarationError);
    EXPECT_THROW(default_registry<std::string>().resolve("validate(matches('(unclosed'))"), DeclarationError);
    EXPECT_THROW(default_registry<std::string>().resolve("validate(length::chars(gt(-1)))"), DeclarationError);
    EXPECT_THROW(default_registry<int>().resolve("sanitize(clamp(0))"), DeclarationError);
    EXPECT_THROW(default_registry<int>().resolve("validate(lt(2.5))"), DeclarationError);
    EXPECT_THROW(default_registry<int>().resolve("validate(within(0, 10))"), DeclarationError);
    EXPECT_THROW(default_registry<int>().resolve("validate(not(1))"), DeclarationError);
    EXPECT_THROW(default_registry<char>().resolve("validate(eq('ab'))"), DeclarationError);
}

TEST(Registry, CustomChecks)
{
    Registry<int> registry;
    registry.add_check("even", [](const int& x) { return x % 2 == 0; })
        .add_check_factory("multiple_of", [](const Registry<int>&, const Expression& call) {
            expect_arity(call, 1);
            int divisor = argument_as<int>(call, 0);
            return ValidationNode<int>{node::Predicate<int>{to_string(call), [divisor](const int& x) {
                                                                return x % divisor == 0;
                                                            }}};
        });

    auto pipeline = registry.resolve("validate(either(even, multiple_of(5)))");

    EXPECT_TRUE(pipeline.validators.evaluate(4));
    EXPECT_TRUE(pipeline.validators.evaluate(15));
    EXPECT_FALSE(pipeline.validators.evaluate(7));
    EXPECT_EQ(describe(pipeline.validators), "any(even, multiple_of(5))");
}
