#ifndef INDICATORS_HPP
#define INDICATORS_HPP

#include <deque>
#include <optional>
#include "trader/data_structures/data_structures.hpp"

namespace ValrTrader {
namespace Core {

// Wilder RSI over closing prices. Empty until period + 1 prices are available.
std::optional<Decimal> calculate_rsi(const std::deque<Decimal>& prices, int period);

} // namespace Core
} // namespace ValrTrader

#endif // INDICATORS_HPP
