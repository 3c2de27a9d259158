#include "decimal_utils.hpp"
#include <cctype>
#include <ios>
#include <stdexcept>

namespace DecimalUtils {

namespace {
    const Decimal& one_hundredth() {
        static const Decimal one_hundredth_value("0.01");
        return one_hundredth_value;
    }

    std::string trim_copy(const std::string& input_string) {
        const char* whitespace_chars = " \t\r\n";
        std::string::size_type begin_position = input_string.find_first_not_of(whitespace_chars);
        std::string::size_type end_position = input_string.find_last_not_of(whitespace_chars);
        if (begin_position == std::string::npos) return "";
        return input_string.substr(begin_position, end_position - begin_position + 1);
    }

    // Integer division for integral operands, corrected so the result is the exact floor.
    Decimal floor_integer_quotient(const Decimal& numerator_units, const Decimal& denominator_units) {
        Decimal quotient = boost::multiprecision::floor(numerator_units / denominator_units);
        while (quotient * denominator_units > numerator_units) {
            quotient -= 1;
        }
        while ((quotient + 1) * denominator_units <= numerator_units) {
            quotient += 1;
        }
        return quotient;
    }
}

bool is_decimal_string(const std::string& text) {
    std::string candidate = trim_copy(text);
    if (candidate.empty()) return false;

    std::string::size_type position = 0;
    if (candidate[position] == '+' || candidate[position] == '-') ++position;

    bool has_digits = false;
    bool has_point = false;
    for (; position < candidate.size(); ++position) {
        char current_char = candidate[position];
        if (std::isdigit(static_cast<unsigned char>(current_char))) {
            has_digits = true;
        } else if (current_char == '.' && !has_point) {
            has_point = true;
        } else {
            break;
        }
    }
    if (!has_digits) return false;
    if (position == candidate.size()) return true;

    // Optional exponent
    if (candidate[position] != 'e' && candidate[position] != 'E') return false;
    ++position;
    if (position < candidate.size() && (candidate[position] == '+' || candidate[position] == '-')) ++position;
    if (position == candidate.size()) return false;
    for (; position < candidate.size(); ++position) {
        if (!std::isdigit(static_cast<unsigned char>(candidate[position]))) return false;
    }
    return true;
}

Decimal parse_decimal(const std::string& text) {
    if (!is_decimal_string(text)) {
        throw std::runtime_error("Invalid decimal value: '" + text + "'");
    }
    return Decimal(trim_copy(text));
}

std::string format_decimal(const Decimal& value) {
    std::string formatted_value = value.str(MAX_FORMAT_FRACTION_DIGITS, std::ios_base::fixed);
    std::string::size_type point_position = formatted_value.find('.');
    if (point_position != std::string::npos) {
        std::string::size_type last_significant = formatted_value.find_last_not_of('0');
        if (last_significant == point_position) {
            formatted_value.erase(point_position);
        } else {
            formatted_value.erase(last_significant + 1);
        }
    }
    if (formatted_value == "-0" || formatted_value.empty()) {
        return "0";
    }
    return formatted_value;
}

Decimal power_of_ten(int exponent) {
    if (exponent >= 0) {
        return Decimal("1" + std::string(static_cast<std::string::size_type>(exponent), '0'));
    }
    return Decimal("0." + std::string(static_cast<std::string::size_type>(-exponent - 1), '0') + "1");
}

int decimal_places(const Decimal& value) {
    std::string formatted_value = format_decimal(value);
    std::string::size_type point_position = formatted_value.find('.');
    if (point_position == std::string::npos) {
        return 0;
    }
    return static_cast<int>(formatted_value.size() - point_position - 1);
}

Decimal round_down(const Decimal& value, int decimals) {
    if (decimals < 0) {
        throw std::invalid_argument("round_down requires non-negative decimals, got " + std::to_string(decimals));
    }
    Decimal scaled_value = boost::multiprecision::floor(value * power_of_ten(decimals));
    return scaled_value * power_of_ten(-decimals);
}

Decimal round_to_tick(const Decimal& value, const Decimal& tick_size) {
    if (tick_size <= 0) {
        throw std::invalid_argument("Tick size must be positive, got " + format_decimal(tick_size));
    }
    int tick_decimals = decimal_places(tick_size);
    Decimal scale = power_of_ten(tick_decimals);
    Decimal value_units = boost::multiprecision::floor(value * scale);
    Decimal tick_units = boost::multiprecision::floor(tick_size * scale + Decimal("0.5"));
    Decimal tick_count = floor_integer_quotient(value_units, tick_units);
    return tick_count * tick_units * power_of_ten(-tick_decimals);
}

Decimal divide_round_down(const Decimal& numerator, const Decimal& denominator, int decimals) {
    if (denominator <= 0) {
        throw std::invalid_argument("Division by non-positive value " + format_decimal(denominator));
    }
    Decimal step = power_of_ten(-decimals);
    Decimal quotient = round_down(numerator / denominator, decimals);
    while (quotient * denominator > numerator) {
        quotient -= step;
    }
    while ((quotient + step) * denominator <= numerator) {
        quotient += step;
    }
    return quotient;
}

Decimal percentage_of(const Decimal& value, const Decimal& percentage) {
    return value * percentage * one_hundredth();
}

Decimal apply_percentage_increase(const Decimal& value, const Decimal& percentage) {
    return value * (Decimal(1) + percentage * one_hundredth());
}

Decimal apply_percentage_decrease(const Decimal& value, const Decimal& percentage) {
    return value * (Decimal(1) - percentage * one_hundredth());
}

} // namespace DecimalUtils
