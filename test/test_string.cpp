#include "vetted/builtins/character.hpp"
#include "vetted/builtins/compare.hpp"
#include "vetted/builtins/string.hpp"
#include "vetted/error.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace vetted;

TEST(String, TrimVariants)
{
    EXPECT_EQ(string::trim()(" \t both \n"), "both");
    EXPECT_EQ(string::trim_left()("  left  "), "left  ");
    EXPECT_EQ(string::trim_right()("  right  "), "  right");
    EXPECT_EQ(string::trim()("   "), "");
}

TEST(String, TrimUnicodeWhitespace)
{
    EXPECT_EQ(string::trim()("\xE3\x80\x80name\xC2\xA0"), "name");
    EXPECT_EQ(string::trim_left()("\xE2\x80\x83left"), "left");
    EXPECT_EQ(string::trim()("\xE2\x80\x8Bname"), "\xE2\x80\x8Bname");
}

TEST(String, CaseConversionIsUnicode)
{
    EXPECT_EQ(string::to_lowercase()("MiXeD 123"), "mixed 123");
    EXPECT_EQ(string::to_uppercase()("MiXeD 123"), "MIXED 123");
    EXPECT_EQ(string::to_lowercase()("\xC3\x89" "COLE"), "\xC3\xA9" "cole");
    EXPECT_EQ(string::to_uppercase()("stra\xC3\x9F" "e"), "STRASSE");
    EXPECT_EQ(string::to_lowercase()("\xCE\x9F\xCE\x94\xCE\x9F\xCE\xA3"), "\xCE\xBF\xCE\xB4\xCE\xBF\xCF\x82");
}

TEST(String, CharacterClasses)
{
    EXPECT_TRUE(string::alphabetic().evaluate("Seventy"));
    EXPECT_FALSE(string::alphabetic().evaluate("Seventy70"));
    EXPECT_TRUE(string::alphanumeric().evaluate("Seventy70"));
    EXPECT_FALSE(string::alphanumeric().evaluate("u$ername"));
    EXPECT_TRUE(string::ascii().evaluate("p455w0rd70!"));
    EXPECT_FALSE(string::ascii().evaluate("p455w0rd\xE7\x81\xB0!"));
    EXPECT_TRUE(string::lowercase().evaluate("lower"));
    EXPECT_FALSE(string::lowercase().evaluate("Lower"));
    EXPECT_TRUE(string::uppercase().evaluate("UPPER"));
    EXPECT_FALSE(string::uppercase().evaluate("UPPEr"));
}

TEST(String, ClassesFollowUnicodeProperties)
{
    EXPECT_TRUE(string::alphabetic().evaluate("caf\xC3\xA9"));
    EXPECT_TRUE(string::alphanumeric().evaluate("Zo\xC3\xAB" "1"));
    EXPECT_TRUE(string::alphanumeric().evaluate("\xD9\xA3\xC2\xBD"));
    EXPECT_FALSE(string::alphabetic().evaluate("\xD9\xA3"));
    EXPECT_TRUE(string::lowercase().evaluate("\xC3\xA9" "cole"));
    EXPECT_TRUE(string::uppercase().evaluate("\xC3\x89" "COLE"));
    EXPECT_FALSE(string::uppercase().evaluate("\xC3\xA9" "COLE"));
}

TEST(String, IllFormedUtf8FailsClasses)
{
    EXPECT_FALSE(string::alphabetic().evaluate("ab\xFF"));
    EXPECT_FALSE(string::alphanumeric().evaluate("\xC3"));
    EXPECT_FALSE(string::ascii().evaluate("\xFF"));
}

TEST(String, NotEmpty)
{
    EXPECT_TRUE(string::not_empty().evaluate(" "));
    EXPECT_FALSE(string::not_empty().evaluate(""));
}

TEST(String, LengthCountsCodePointsOrBytes)
{
    auto chars = string::length_chars(compare::eq(4));
    auto bytes = string::length_bytes(compare::eq(4));

    EXPECT_EQ(string::count_chars("caf\xC3\xA9"), 4u);
    EXPECT_TRUE(chars.evaluate("caf\xC3\xA9"));
    EXPECT_FALSE(bytes.evaluate("caf\xC3\xA9"));
    EXPECT_TRUE(bytes.evaluate("cafe"));
    EXPECT_EQ(describe(chars), "length_chars(eq(4))");
}

TEST(String, MatchesSearchesPattern)
{
    auto check = string::matches("^[A-Z]{3}-[0-9]{4}$");

    EXPECT_TRUE(check.evaluate("ABC-1234"));
    EXPECT_FALSE(check.evaluate("abc-1234"));
    EXPECT_TRUE(string::matches("[0-9]").evaluate("contains 7 somewhere"));
    EXPECT_EQ(describe(check), "matches('^[A-Z]{3}-[0-9]{4}$')");
}

TEST(String, MalformedPatternIsDeclarationError)
{
    EXPECT_THROW(string::matches("(unclosed"), DeclarationError);
}

TEST(Character, Classes)
{
    EXPECT_TRUE(character::alphabetic().evaluate('q'));
    EXPECT_FALSE(character::alphabetic().evaluate('7'));
    EXPECT_TRUE(character::alphanumeric().evaluate('7'));
    EXPECT_TRUE(character::ascii().evaluate('~'));
    EXPECT_FALSE(character::ascii().evaluate('\xE9'));
    EXPECT_TRUE(character::lowercase().evaluate('q'));
    EXPECT_FALSE(character::lowercase().evaluate('Q'));
    EXPECT_TRUE(character::uppercase().evaluate('Q'));
    EXPECT_TRUE(character::digit().evaluate('0'));
    EXPECT_FALSE(character::digit().evaluate('a'));
}

TEST(Character, CodePointClasses)
{
    EXPECT_TRUE(character::alphabetic<char32_t>().evaluate(U'é'));
    EXPECT_FALSE(character::alphabetic<char32_t>().evaluate(U'7'));
    EXPECT_TRUE(character::alphanumeric<char32_t>().evaluate(U'٣'));
    EXPECT_FALSE(character::ascii<char32_t>().evaluate(U'灰'));
    EXPECT_TRUE(character::ascii<char32_t>().evaluate(U'$'));
    EXPECT_TRUE(character::lowercase<char32_t>().evaluate(U'ß'));
    EXPECT_TRUE(character::uppercase<char32_t>().evaluate(U'Σ'));
    EXPECT_FALSE(character::digit<char32_t>().evaluate(U'٣'));
    EXPECT_TRUE(character::digit<char32_t>().evaluate(U'9'));
}
