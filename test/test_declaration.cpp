#include "vetted/declaration.hpp"
#include "vetted/error.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <variant>

using namespace vetted;

TEST(Declaration, EmptyTextDeclaresNothing)
{
    auto declaration = parse_declaration("   ");

    EXPECT_TRUE(declaration.sanitizers.empty());
    EXPECT_TRUE(declaration.validators.empty());
    EXPECT_TRUE(declaration.upgrades.empty());
}

TEST(Declaration, ParsesClauses)
{
    auto declaration = parse_declaration(
        "upgrades(display, hash), sanitize(trim), validate(alphanumeric, length::chars(within(5..=20))),");

    EXPECT_EQ(declaration.upgrades, (Upgrades{Upgrade::display, Upgrade::hash}));
    ASSERT_EQ(declaration.sanitizers.size(), 1u);
    EXPECT_EQ(declaration.sanitizers[0].name, "trim");
    ASSERT_EQ(declaration.validators.size(), 2u);
    EXPECT_EQ(declaration.validators[0].name, "alphanumeric");
    EXPECT_EQ(to_string(declaration.validators[1]), "length::chars(within(5..=20))");
}

TEST(Declaration, ClausesMayAppearInAnyOrder)
{
    auto declaration = parse_declaration("validate(not_empty) , sanitize( trim_left , trim_right )");

    EXPECT_EQ(declaration.sanitizers.size(), 2u);
    EXPECT_EQ(declaration.validators.size(), 1u);
}

TEST(Declaration, ParsesLiterals)
{
    auto declaration = parse_declaration(R"(validate(f(-3, 2.5, 1e3, "a \"quoted\" \\ string", 'raw \n', 1..10, 0..=255)))");
    const auto& arguments = declaration.validators.at(0).arguments;

    ASSERT_EQ(arguments.size(), 7u);
    EXPECT_EQ(std::get<std::int64_t>(*arguments[0].literal), -3);
    EXPECT_DOUBLE_EQ(std::get<double>(*arguments[1].literal), 2.5);
    EXPECT_DOUBLE_EQ(std::get<double>(*arguments[2].literal), 1000.0);
    EXPECT_EQ(std::get<std::string>(*arguments[3].literal), "a \"quoted\" \\ string");
    EXPECT_EQ(std::get<std::string>(*arguments[4].literal), "raw \\n");

    auto exclusive = std::get<Interval>(*arguments[5].literal);
    EXPECT_EQ(std::get<std::int64_t>(exclusive.low), 1);
    EXPECT_EQ(std::get<std::int64_t>(exclusive.high), 10);
    EXPECT_FALSE(exclusive.inclusive);

    auto inclusive = std::get<Interval>(*arguments[6].literal);
    EXPECT_TRUE(inclusive.inclusive);
    EXPECT_EQ(std::get<std::int64_t>(inclusive.high), 255);
}

TEST(Declaration, NestedCalls)
{
    auto declaration = parse_declaration("validate(any(all(a, b), not(c)))");

    EXPECT_EQ(to_string(declaration.validators.at(0)), "any(all(a, b), not(c))");
}

TEST(Declaration, MalformedTextIsDeclarationError)
{
    EXPECT_THROW(parse_declaration("validate(alphanumeric"), DeclarationError);
    EXPECT_THROW(parse_declaration("validate(alphanumeric))"), DeclarationError);
    EXPECT_THROW(parse_declaration("sanitize trim"), DeclarationError);
    EXPECT_THROW(parse_declaration("validate(matches('unterminated))"), DeclarationError);
    EXPECT_THROW(parse_declaration("validate(within(5..))"), DeclarationError);
    EXPECT_THROW(parse_declaration("validate(lt(99999999999999999999))"), DeclarationError);
}

TEST(Declaration, UnknownClauseIsDeclarationError)
{
    EXPECT_THROW(parse_declaration("transform(trim)"), DeclarationError);
}

TEST(Declaration, RepeatedClauseIsDeclarationError)
{
    EXPECT_THROW(parse_declaration("sanitize(trim), sanitize(trim)"), DeclarationError);
}

TEST(Declaration, UnknownUpgradeIsDeclarationError)
{
    try
    {
        parse_declaration("upgrades(display, serializable)");
        FAIL() << "expected DeclarationError";
    }
    catch (const DeclarationError& error)
    {
        EXPECT_NE(std::string(error.what()).find("serializable"), std::string::npos);
    }
}
