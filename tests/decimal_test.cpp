#include <gtest/gtest.h>
#include <fmt/format.h>
#include <cmath>
#include <limits>
#include <stdexcept>

#include "money/decimal.hpp"

using prc::decimal;

TEST(DecimalTest, ParsesExactPrices) {
    EXPECT_EQ(decimal::parse("78.60").units(), 7860);
    EXPECT_EQ(decimal::parse("78.6").units(), 7860);
    EXPECT_EQ(decimal::parse("80").units(), 8000);
    EXPECT_EQ(decimal::parse("0.05").units(), 5);
    EXPECT_EQ(decimal::parse("-12.5").units(), -1250);
    EXPECT_EQ(decimal::parse("+3.10").units(), 310);
    EXPECT_EQ(decimal::parse(".5").units(), 50);

    // Trailing zeros past the scale do not change the value
    EXPECT_EQ(decimal::parse("205.600").units(), 20560);
}

TEST(DecimalTest, RejectsValuesThatNeedRounding) {
    EXPECT_FALSE(decimal::try_parse("134.445").has_value());
    EXPECT_THROW(decimal::parse("0.001"), std::invalid_argument);
}

TEST(DecimalTest, RejectsMalformedText) {
    EXPECT_FALSE(decimal::try_parse("").has_value());
    EXPECT_FALSE(decimal::try_parse("-").has_value());
    EXPECT_FALSE(decimal::try_parse(".").has_value());
    EXPECT_FALSE(decimal::try_parse("12a").has_value());
    EXPECT_FALSE(decimal::try_parse("1,000").has_value());
    EXPECT_FALSE(decimal::try_parse(" 5").has_value());
    EXPECT_FALSE(decimal::try_parse("99999999999999999999").has_value());
}

TEST(DecimalTest, FormatsWithTwoFractionDigits) {
    EXPECT_EQ(decimal::from_integer(80).to_string(), "80.00");
    EXPECT_EQ(decimal::from_units(-50).to_string(), "-0.50");
    EXPECT_EQ(decimal::from_units(5).to_string(), "0.05");
    EXPECT_EQ(fmt::format("{}", decimal::parse("418.6")), "418.60");
    EXPECT_EQ(fmt::format("[{:>8}]", decimal::parse("1.5")), "[    1.50]");
}

TEST(DecimalTest, FromDoubleRoundsHalfAwayFromZero) {
    EXPECT_EQ(decimal::from_double(78.6).units(), 7860);
    EXPECT_EQ(decimal::from_double(250.0).units(), 25000);
    EXPECT_EQ(decimal::from_double(0.125).units(), 13);
    EXPECT_EQ(decimal::from_double(-0.125).units(), -13);
}

TEST(DecimalTest, FromDoubleRejectsNonFinite) {
    EXPECT_THROW(decimal::from_double(std::numeric_limits<double>::infinity()), std::invalid_argument);
    EXPECT_THROW(decimal::from_double(std::nan("")), std::invalid_argument);
    EXPECT_THROW(decimal::from_double(1e300), std::invalid_argument);
}

TEST(DecimalTest, ArithmeticAndOrdering) {
    const decimal a = decimal::parse("32.29");
    const decimal b = decimal::parse("32.99");
    EXPECT_LT(a, b);
    EXPECT_EQ((a + b).to_string(), "65.28");
    EXPECT_EQ((a - b).to_string(), "-0.70");
    EXPECT_EQ(decimal{}, decimal::from_units(0));
    EXPECT_THROW(decimal::from_integer(std::numeric_limits<std::int64_t>::max()), std::invalid_argument);
}
