#ifndef DECIMAL_UTILS_HPP
#define DECIMAL_UTILS_HPP

#include <string>
#include <boost/multiprecision/cpp_dec_float.hpp>

namespace DecimalUtils {

// Every price, quantity, balance and PnL value is a Decimal.
using Decimal = boost::multiprecision::cpp_dec_float_50;

constexpr int MAX_FORMAT_FRACTION_DIGITS = 20;

// Parsing and formatting (plain notation, trailing zeros trimmed)
Decimal parse_decimal(const std::string& text);
std::string format_decimal(const Decimal& value);
bool is_decimal_string(const std::string& text);

// 10^exponent, built from its decimal string so it is exact
Decimal power_of_ten(int exponent);

// Number of fraction digits needed to write the value exactly
int decimal_places(const Decimal& value);

// Rounding toward negative infinity
Decimal round_down(const Decimal& value, int decimals);
Decimal round_to_tick(const Decimal& value, const Decimal& tick_size);
Decimal divide_round_down(const Decimal& numerator, const Decimal& denominator, int decimals);

// Percentage helpers (percentage given as 1.5 for 1.5%)
Decimal percentage_of(const Decimal& value, const Decimal& percentage);
Decimal apply_percentage_increase(const Decimal& value, const Decimal& percentage);
Decimal apply_percentage_decrease(const Decimal& value, const Decimal& percentage);

} // namespace DecimalUtils

#endif // DECIMAL_UTILS_HPP
