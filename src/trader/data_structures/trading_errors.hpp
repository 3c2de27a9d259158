#ifndef TRADING_ERRORS_HPP
#define TRADING_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace ValrTrader {
namespace Core {

// Protective-order placement failed; the filled quantity must be liquidated.
class TradingError : public std::runtime_error {
public:
    explicit TradingError(const std::string& message) : std::runtime_error(message) {}
};

// Order or position store could not be read or written.
class PersistenceError : public std::runtime_error {
public:
    explicit PersistenceError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace Core
} // namespace ValrTrader

#endif // TRADING_ERRORS_HPP
