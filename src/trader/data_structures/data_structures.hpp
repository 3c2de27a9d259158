#ifndef DATA_STRUCTURES_HPP
#define DATA_STRUCTURES_HPP

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "utils/decimal_utils.hpp"

namespace ValrTrader {
namespace Core {

using DecimalUtils::Decimal;
using TimePoint = std::chrono::system_clock::time_point;

// ========================================================================
// ENUMERATIONS
// ========================================================================

enum class OrderSide { BUY, SELL };

enum class OrderRole { ENTRY, TAKE_PROFIT, STOP_LOSS, LIQUIDATION };

enum class OrderRecordStatus { ACTIVE, FILLED, CANCELLED };

// Canonical exchange order status; every provider spelling maps onto one of these.
enum class OrderStatus { PENDING, FILLED, PARTIALLY_FILLED, CANCELLED };

enum class FillState { FILLED, PARTIALLY_FILLED, CANCELLED, TIMEOUT, SHUTDOWN };

enum class PositionStatus { OPEN, CLOSED };

enum class TradeSetupFailure {
    DAILY_LIMIT_REACHED,
    POSITION_ALREADY_OPEN,
    SHUTDOWN_REQUESTED,
    NO_MARKET_DATA,
    INVALID_ORDER_SIZE,
    INSUFFICIENT_BALANCE,
    ENTRY_NOT_FILLED,
    PROTECTION_FAILED,
    EXCHANGE_ERROR
};

// ========================================================================
// MARKET DATA
// ========================================================================

struct OrderBookLevel {
    Decimal price;
    Decimal quantity;
};

struct OrderBook {
    std::string pair;
    std::vector<OrderBookLevel> bids;    // Best (highest) first
    std::vector<OrderBookLevel> asks;    // Best (lowest) first

    bool has_best_bid() const { return !bids.empty() && bids.front().price > 0; }
    bool has_best_ask() const { return !asks.empty() && asks.front().price > 0; }
    const Decimal& best_bid() const { return bids.front().price; }
    const Decimal& best_ask() const { return asks.front().price; }
};

// ========================================================================
// ORDER REQUESTS AND REPORTS
// ========================================================================

struct LimitOrderRequest {
    std::string pair;
    OrderSide side = OrderSide::BUY;
    Decimal quantity;
    Decimal price;
    bool post_only = false;
    std::string time_in_force = "GTC";
};

// Exactly one of base_quantity / quote_amount is set.
struct MarketOrderRequest {
    std::string pair;
    OrderSide side = OrderSide::BUY;
    std::optional<Decimal> base_quantity;
    std::optional<Decimal> quote_amount;
};

struct StopLimitOrderRequest {
    std::string pair;
    OrderSide side = OrderSide::BUY;
    Decimal quantity;
    Decimal stop_price;
    Decimal limit_price;
};

struct OrderStatusReport {
    std::string order_id;
    OrderStatus status = OrderStatus::PENDING;
    std::string raw_status;
    std::optional<Decimal> filled_quantity;
    std::optional<Decimal> average_price;
    std::optional<Decimal> original_quantity;
};

struct OpenOrder {
    std::string order_id;
    std::string pair;
    OrderSide side = OrderSide::BUY;
    Decimal quantity;                    // Remaining quantity
    Decimal price;
    std::string created_at;
};

struct OrderFill {
    std::string order_id;
    Decimal price;
    Decimal quantity;
};

// Result of waiting on one order; consumed once by the caller.
struct FillOutcome {
    FillState state = FillState::TIMEOUT;
    Decimal filled_quantity{0};
    Decimal average_price{0};
};

// ========================================================================
// PERSISTED RECORDS
// ========================================================================

struct OrderRecord {
    std::string order_id;
    std::string pair;
    OrderSide side = OrderSide::BUY;
    Decimal quantity;
    Decimal price;
    OrderRole role = OrderRole::ENTRY;
    OrderRecordStatus status = OrderRecordStatus::ACTIVE;
    TimePoint created_at;
    TimePoint last_updated;
};

/**
 * @brief A held long exposure with its protective exit orders.
 * While open: quantity > 0, entry_price > 0, stop_loss_price < entry_price < take_profit_price.
 */
struct Position {
    std::string position_id;
    std::string pair;
    Decimal quantity;
    Decimal entry_price;
    Decimal stop_loss_price;
    Decimal take_profit_price;
    TimePoint created_at;
    TimePoint entry_filled_at;
    PositionStatus status = PositionStatus::OPEN;
    std::string entry_order_id;
    std::optional<std::string> take_profit_order_id;
    std::optional<std::string> stop_loss_order_id;
};

struct OrderStoreStatistics {
    size_t total_orders = 0;
    std::map<std::string, size_t> orders_by_role;
    std::map<std::string, size_t> orders_by_pair;
};

// ========================================================================
// ENGINE RESULTS AND COUNTERS
// ========================================================================

struct SignalDecision {
    bool should_buy = false;
    Decimal confidence{0};
    Decimal indicator_value{0};
};

struct TradeSetupRejection {
    TradeSetupFailure reason;
    std::string detail;
};

using TradeSetupResult = std::variant<Position, TradeSetupRejection>;

// Reset at UTC midnight.
struct DailyCounters {
    std::string date;
    int trades_today = 0;
    int wins_today = 0;
    int losses_today = 0;
    int failed_trades_today = 0;
    int forced_closes_today = 0;
    Decimal daily_pnl{0};
};

// ========================================================================
// STRING CONVERSIONS
// ========================================================================

std::string to_string(OrderSide side);
std::string to_string(OrderRole role);
std::string to_string(OrderRecordStatus status);
std::string to_string(OrderStatus status);
std::string to_string(FillState state);
std::string to_string(PositionStatus status);
std::string to_string(TradeSetupFailure failure);

OrderSide parse_order_side(const std::string& side_str);
OrderRole parse_order_role(const std::string& role_str);
OrderRecordStatus parse_order_record_status(const std::string& status_str);
PositionStatus parse_position_status(const std::string& status_str);

} // namespace Core
} // namespace ValrTrader

#endif // DATA_STRUCTURES_HPP
