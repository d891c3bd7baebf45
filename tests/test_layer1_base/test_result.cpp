/**
 * @file test_result.cpp
 * @brief Layer 1 tests for Result<T, E> and Unit.
 */
#include "dgt_base.hpp"
#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>

using docgate::Result;
using docgate::Unit;

namespace
{

enum class ParseError
{
    Empty,
    NotANumber,
};

Result<int, ParseError> parse_int(const std::string &s)
{
    if (s.empty())
        return Result<int, ParseError>::error(ParseError::Empty);
    try
    {
        return Result<int, ParseError>::ok(std::stoi(s));
    }
    catch (const std::invalid_argument &)
    {
        return Result<int, ParseError>::error(ParseError::NotANumber);
    }
}

} // namespace

TEST(ResultTest, OkHoldsValue)
{
    auto r = parse_int("42");
    ASSERT_TRUE(r.is_ok());
    EXPECT_FALSE(r.is_error());
    EXPECT_EQ(r.content(), 42);
    EXPECT_THROW((void)r.error(), std::logic_error);
}

TEST(ResultTest, ErrorHoldsError)
{
    auto r = parse_int("abc");
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error(), ParseError::NotANumber);
    EXPECT_THROW((void)r.content(), std::logic_error);
    EXPECT_EQ(parse_int("").error(), ParseError::Empty);
}

TEST(ResultTest, DefaultConstructedIsError)
{
    Result<std::string, int> r;
    EXPECT_TRUE(r.is_error());
    EXPECT_EQ(r.error(), 0);
}

TEST(ResultTest, ValueOrFallsBackOnError)
{
    EXPECT_EQ(parse_int("7").value_or(-1), 7);
    EXPECT_EQ(parse_int("x").value_or(-1), -1);
}

TEST(ResultTest, SameTypeForValueAndError)
{
    auto ok = Result<std::string, std::string>::ok("value");
    auto err = Result<std::string, std::string>::error("boom");
    EXPECT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.content(), "value");
    EXPECT_TRUE(err.is_error());
    EXPECT_EQ(err.error(), "boom");
}

TEST(ResultTest, MoveOnlyValueCanBeMovedOut)
{
    auto r = Result<std::unique_ptr<int>, int>::ok(std::make_unique<int>(5));
    std::unique_ptr<int> p = std::move(r).content();
    ASSERT_NE(p, nullptr);
    EXPECT_EQ(*p, 5);
}

TEST(ResultTest, CloneIsIndependentCopy)
{
    auto original = Result<std::string, int>::ok("abc");
    auto copy = original.clone();
    copy.content() += "def";
    EXPECT_EQ(original.content(), "abc");
    EXPECT_EQ(copy.content(), "abcdef");

    auto err = Result<std::string, int>::error(3);
    EXPECT_EQ(err.clone().error(), 3);
}

TEST(ResultTest, UnitCompareEqual)
{
    auto r = Result<Unit, int>::ok(Unit{});
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(r.content() == Unit{});
}
