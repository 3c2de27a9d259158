#include <gtest/gtest.h>
#include <stdexcept>
#include "utils/decimal_utils.hpp"

using DecimalUtils::Decimal;

TEST(DecimalUtilsTest, parse_accepts_plain_and_exponent_notation) {
    EXPECT_EQ(DecimalUtils::parse_decimal("1234.5600"), Decimal("1234.56"));
    EXPECT_EQ(DecimalUtils::parse_decimal(" 0.001 "), Decimal("0.001"));
    EXPECT_EQ(DecimalUtils::parse_decimal("1e-8"), Decimal("0.00000001"));
    EXPECT_EQ(DecimalUtils::parse_decimal("-2.5"), Decimal("-2.5"));
}

TEST(DecimalUtilsTest, parse_rejects_garbage) {
    EXPECT_THROW(DecimalUtils::parse_decimal(""), std::runtime_error);
    EXPECT_THROW(DecimalUtils::parse_decimal("abc"), std::runtime_error);
    EXPECT_THROW(DecimalUtils::parse_decimal("1.2.3"), std::runtime_error);
    EXPECT_THROW(DecimalUtils::parse_decimal("1e"), std::runtime_error);
    EXPECT_FALSE(DecimalUtils::is_decimal_string("12abc"));
}

TEST(DecimalUtilsTest, format_trims_trailing_zeros) {
    EXPECT_EQ(DecimalUtils::format_decimal(Decimal("100.0000")), "100");
    EXPECT_EQ(DecimalUtils::format_decimal(Decimal("0.00012300")), "0.000123");
    EXPECT_EQ(DecimalUtils::format_decimal(Decimal("1300000")), "1300000");
    EXPECT_EQ(DecimalUtils::format_decimal(Decimal("-0")), "0");
}

TEST(DecimalUtilsTest, power_of_ten_is_exact_both_ways) {
    EXPECT_EQ(DecimalUtils::power_of_ten(3), Decimal(1000));
    EXPECT_EQ(DecimalUtils::power_of_ten(0), Decimal(1));
    EXPECT_EQ(DecimalUtils::power_of_ten(-8), Decimal("0.00000001"));
}

TEST(DecimalUtilsTest, decimal_places_counts_significant_fraction_digits) {
    EXPECT_EQ(DecimalUtils::decimal_places(Decimal("0.01")), 2);
    EXPECT_EQ(DecimalUtils::decimal_places(Decimal("5")), 0);
    EXPECT_EQ(DecimalUtils::decimal_places(Decimal("0.50")), 1);
}

TEST(DecimalUtilsTest, round_down_truncates_toward_negative_infinity) {
    EXPECT_EQ(DecimalUtils::round_down(Decimal("1.23999"), 2), Decimal("1.23"));
    EXPECT_EQ(DecimalUtils::round_down(Decimal("0.0000999"), 4), Decimal("0"));
    EXPECT_EQ(DecimalUtils::round_down(Decimal("-1.231"), 2), Decimal("-1.24"));
    EXPECT_THROW(DecimalUtils::round_down(Decimal("1"), -1), std::invalid_argument);
}

TEST(DecimalUtilsTest, round_to_tick_floors_to_tick_multiple) {
    EXPECT_EQ(DecimalUtils::round_to_tick(Decimal("1319923.99"), Decimal("1")), Decimal("1319923"));
    EXPECT_EQ(DecimalUtils::round_to_tick(Decimal("105.567"), Decimal("0.05")), Decimal("105.55"));
    EXPECT_EQ(DecimalUtils::round_to_tick(Decimal("105.55"), Decimal("0.05")), Decimal("105.55"));
    EXPECT_THROW(DecimalUtils::round_to_tick(Decimal("1"), Decimal("0")), std::invalid_argument);
}

TEST(DecimalUtilsTest, divide_round_down_never_overshoots_the_numerator) {
    Decimal quantity = DecimalUtils::divide_round_down(Decimal("100"), Decimal("1300000"), 8);
    EXPECT_EQ(quantity, Decimal("0.00007692"));
    EXPECT_LE(quantity * Decimal("1300000"), Decimal("100"));

    EXPECT_EQ(DecimalUtils::divide_round_down(Decimal("105"), Decimal("1.01"), 2), Decimal("103.96"));
    EXPECT_EQ(DecimalUtils::divide_round_down(Decimal("10"), Decimal("4"), 0), Decimal("2"));
    EXPECT_THROW(DecimalUtils::divide_round_down(Decimal("1"), Decimal("0"), 2), std::invalid_argument);
}

TEST(DecimalUtilsTest, percentage_helpers_use_percent_units) {
    EXPECT_EQ(DecimalUtils::percentage_of(Decimal("100"), Decimal("0.18")), Decimal("0.18"));
    EXPECT_EQ(DecimalUtils::apply_percentage_increase(Decimal("1000"), Decimal("1.5")), Decimal("1015"));
    EXPECT_EQ(DecimalUtils::apply_percentage_decrease(Decimal("1000"), Decimal("2")), Decimal("980"));
}
