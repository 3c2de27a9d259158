#include "indicators.hpp"
#include <stdexcept>

namespace ValrTrader {
namespace Core {

std::optional<Decimal> calculate_rsi(const std::deque<Decimal>& prices, int period) {
    if (period <= 0) {
        throw std::runtime_error("RSI period must be positive, got " + std::to_string(period));
    }
    if (static_cast<int>(prices.size()) < period + 1) {
        return std::nullopt;
    }

    Decimal average_gain{0};
    Decimal average_loss{0};
    Decimal period_value(period);

    // Seed with the simple average of the first period changes
    for (size_t i = 1; i <= static_cast<size_t>(period); ++i) {
        Decimal change = prices[i] - prices[i - 1];
        if (change > 0) {
            average_gain += change;
        } else {
            average_loss -= change;
        }
    }
    average_gain /= period_value;
    average_loss /= period_value;

    // Wilder smoothing for the remainder
    for (size_t i = static_cast<size_t>(period) + 1; i < prices.size(); ++i) {
        Decimal change = prices[i] - prices[i - 1];
        Decimal gain = change > 0 ? change : Decimal(0);
        Decimal loss = change < 0 ? Decimal(-change) : Decimal(0);
        average_gain = (average_gain * (period_value - 1) + gain) / period_value;
        average_loss = (average_loss * (period_value - 1) + loss) / period_value;
    }

    if (average_loss == 0 && average_gain == 0) {
        return Decimal(50);
    }
    if (average_loss == 0) {
        return Decimal(100);
    }
    Decimal relative_strength = average_gain / average_loss;
    return Decimal(100) - Decimal(100) / (Decimal(1) + relative_strength);
}

} // namespace Core
} // namespace ValrTrader
