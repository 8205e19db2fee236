#include <gtest/gtest.h>

#include <string>
#include <variant>

#include "tradecli/errors.hpp"
#include "tradecli/validators.hpp"

TEST(PositiveIntTest, AcceptsPositiveIntegers) {
    EXPECT_EQ(tradecli::positiveInt("5"), 5);
    EXPECT_EQ(tradecli::positiveInt("1"), 1);
    EXPECT_EQ(tradecli::positiveInt("42"), 42);
}

TEST(PositiveIntTest, RejectsZeroNegativeAndGarbage) {
    EXPECT_THROW(tradecli::positiveInt("0"), tradecli::ValidationError);
    EXPECT_THROW(tradecli::positiveInt("-3"), tradecli::ValidationError);
    EXPECT_THROW(tradecli::positiveInt("abc"), tradecli::ValidationError);
    EXPECT_THROW(tradecli::positiveInt(""), tradecli::ValidationError);
    EXPECT_THROW(tradecli::positiveInt("1.5"), tradecli::ValidationError);
    EXPECT_THROW(tradecli::positiveInt("99999999999"), tradecli::ValidationError);
}

TEST(PositiveIntTest, MessageNamesTheValue) {
    try {
        tradecli::positiveInt("-3");
        FAIL() << "expected ValidationError";
    } catch (const tradecli::ValidationError& e) {
        EXPECT_EQ(std::string(e.what()), "-3 is invalid for this parameter, should be a positive integer value");
    }
}

TEST(ConvertersTest, IntegerAndFloating) {
    EXPECT_EQ(std::get<int>(tradecli::converters::integer()("-1")), -1);
    EXPECT_DOUBLE_EQ(std::get<double>(tradecli::converters::floating()("0.05")), 0.05);
    EXPECT_EQ(std::get<std::string>(tradecli::converters::string()("abc")), "abc");
    EXPECT_THROW(tradecli::converters::integer()("x1"), tradecli::ValidationError);
    EXPECT_THROW(tradecli::converters::floating()("1.0.0"), tradecli::ValidationError);
    EXPECT_THROW(tradecli::converters::positiveInteger()("0"), tradecli::ValidationError);
}
