#include "vetted/builtins/compare.hpp"
#include "vetted/error.hpp"
#include "vetted/validator.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>

using namespace vetted;

TEST(Compare, Relations)
{
    ValidationNode<int> lt = compare::lt(5);
    ValidationNode<int> le = compare::le(5);
    ValidationNode<int> gt = compare::gt(5);
    ValidationNode<int> ge = compare::ge(5);
    ValidationNode<int> eq = compare::eq(5);
    ValidationNode<int> ne = compare::ne(5);

    EXPECT_TRUE(lt.evaluate(4));
    EXPECT_FALSE(lt.evaluate(5));
    EXPECT_TRUE(le.evaluate(5));
    EXPECT_FALSE(le.evaluate(6));
    EXPECT_TRUE(gt.evaluate(6));
    EXPECT_FALSE(gt.evaluate(5));
    EXPECT_TRUE(ge.evaluate(5));
    EXPECT_FALSE(ge.evaluate(4));
    EXPECT_TRUE(eq.evaluate(5));
    EXPECT_FALSE(eq.evaluate(4));
    EXPECT_TRUE(ne.evaluate(4));
    EXPECT_FALSE(ne.evaluate(5));
}

TEST(Compare, WithinIsInclusive)
{
    ValidationNode<int> check = compare::within(5, 20);

    EXPECT_FALSE(check.evaluate(4));
    EXPECT_TRUE(check.evaluate(5));
    EXPECT_TRUE(check.evaluate(20));
    EXPECT_FALSE(check.evaluate(21));
    EXPECT_EQ(describe(check), "within(5..=20)");
}

TEST(Compare, WithinExclusiveExcludesUpperBound)
{
    ValidationNode<int> check = compare::within_exclusive(5, 20);

    EXPECT_TRUE(check.evaluate(5));
    EXPECT_TRUE(check.evaluate(19));
    EXPECT_FALSE(check.evaluate(20));
    EXPECT_EQ(describe(check), "within(5..20)");
}

TEST(Compare, OpenEndedBounds)
{
    ValidationNode<int> at_least = compare::at_least(3);
    ValidationNode<int> at_most  = compare::at_most(3);

    EXPECT_TRUE(at_least.evaluate(3));
    EXPECT_FALSE(at_least.evaluate(2));
    EXPECT_TRUE(at_most.evaluate(3));
    EXPECT_FALSE(at_most.evaluate(4));
    EXPECT_EQ(describe(at_least), "ge(3)");
    EXPECT_EQ(describe(at_most), "le(3)");
}

TEST(Compare, NanOnlySatisfiesNotEqual)
{
    double nan = std::numeric_limits<double>::quiet_NaN();

    EXPECT_FALSE(ValidationNode<double>(compare::lt(1.0)).evaluate(nan));
    EXPECT_FALSE(ValidationNode<double>(compare::le(1.0)).evaluate(nan));
    EXPECT_FALSE(ValidationNode<double>(compare::gt(1.0)).evaluate(nan));
    EXPECT_FALSE(ValidationNode<double>(compare::ge(1.0)).evaluate(nan));
    EXPECT_FALSE(ValidationNode<double>(compare::eq(1.0)).evaluate(nan));
    EXPECT_TRUE(ValidationNode<double>(compare::ne(1.0)).evaluate(nan));
    EXPECT_FALSE(ValidationNode<double>(compare::within(0.0, 2.0)).evaluate(nan));
}

TEST(Compare, BoundConvertsToCheckedType)
{
    ValidationNode<std::size_t> check = compare::within(5, 20);

    EXPECT_TRUE(check.evaluate(std::size_t{5}));
    EXPECT_FALSE(check.evaluate(std::size_t{21}));
}

TEST(Compare, UnrepresentableBoundIsDeclarationError)
{
    EXPECT_THROW((void)ValidationNode<std::size_t>(compare::gt(-1)), DeclarationError);
    EXPECT_THROW((void)ValidationNode<std::uint8_t>(compare::lt(300)), DeclarationError);
}

TEST(Compare, FractionalBoundIsRejectedForIntegers)
{
    EXPECT_THROW((void)ValidationNode<int>(compare::lt(5.5)), DeclarationError);
    EXPECT_THROW((void)ValidationNode<int>(compare::within(0.5, 2.5)), DeclarationError);
    EXPECT_THROW((void)ValidationNode<int>(compare::lt(1e20)), DeclarationError);
    EXPECT_THROW((void)ValidationNode<unsigned>(compare::ge(-1.0)), DeclarationError);
    EXPECT_THROW((void)ValidationNode<int>(compare::eq(std::numeric_limits<double>::quiet_NaN())), DeclarationError);
}

TEST(Compare, WholeFloatingBoundServesIntegers)
{
    ValidationNode<int> check = compare::lt(5.0);

    EXPECT_TRUE(check.evaluate(4));
    EXPECT_FALSE(check.evaluate(5));
}

TEST(Compare, StringBoundsAreQuoted)
{
    ValidationNode<std::string> check = compare::eq(std::string("admin"));

    EXPECT_TRUE(check.evaluate("admin"));
    EXPECT_FALSE(check.evaluate("Admin"));
    EXPECT_EQ(describe(check), "eq('admin')");
}

TEST(Compare, CharBoundsAreQuoted)
{
    ValidationNode<char> check = compare::within('a', 'f');

    EXPECT_TRUE(check.evaluate('c'));
    EXPECT_FALSE(check.evaluate('g'));
    EXPECT_EQ(describe(check), "within('a'..='f')");
}
