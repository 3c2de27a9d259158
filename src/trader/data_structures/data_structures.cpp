#include "data_structures.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace ValrTrader {
namespace Core {

namespace {
    std::string to_lower_copy(const std::string& input_value) {
        std::string normalized_value = input_value;
        std::transform(normalized_value.begin(), normalized_value.end(), normalized_value.begin(),
                       [](unsigned char current_char) { return static_cast<char>(std::tolower(current_char)); });
        return normalized_value;
    }
}

std::string to_string(OrderSide side) {
    switch (side) {
        case OrderSide::BUY: return "buy";
        case OrderSide::SELL: return "sell";
    }
    throw std::runtime_error("Unknown order side");
}

std::string to_string(OrderRole role) {
    switch (role) {
        case OrderRole::ENTRY: return "entry";
        case OrderRole::TAKE_PROFIT: return "take_profit";
        case OrderRole::STOP_LOSS: return "stop_loss";
        case OrderRole::LIQUIDATION: return "liquidation";
    }
    throw std::runtime_error("Unknown order role");
}

std::string to_string(OrderRecordStatus status) {
    switch (status) {
        case OrderRecordStatus::ACTIVE: return "active";
        case OrderRecordStatus::FILLED: return "filled";
        case OrderRecordStatus::CANCELLED: return "cancelled";
    }
    throw std::runtime_error("Unknown order record status");
}

std::string to_string(OrderStatus status) {
    switch (status) {
        case OrderStatus::PENDING: return "PENDING";
        case OrderStatus::FILLED: return "FILLED";
        case OrderStatus::PARTIALLY_FILLED: return "PARTIALLY_FILLED";
        case OrderStatus::CANCELLED: return "CANCELLED";
    }
    throw std::runtime_error("Unknown order status");
}

std::string to_string(FillState state) {
    switch (state) {
        case FillState::FILLED: return "FILLED";
        case FillState::PARTIALLY_FILLED: return "PARTIALLY_FILLED";
        case FillState::CANCELLED: return "CANCELLED";
        case FillState::TIMEOUT: return "TIMEOUT";
        case FillState::SHUTDOWN: return "SHUTDOWN";
    }
    throw std::runtime_error("Unknown fill state");
}

std::string to_string(PositionStatus status) {
    switch (status) {
        case PositionStatus::OPEN: return "open";
        case PositionStatus::CLOSED: return "closed";
    }
    throw std::runtime_error("Unknown position status");
}

std::string to_string(TradeSetupFailure failure) {
    switch (failure) {
        case TradeSetupFailure::DAILY_LIMIT_REACHED: return "daily_limit_reached";
        case TradeSetupFailure::POSITION_ALREADY_OPEN: return "position_already_open";
        case TradeSetupFailure::SHUTDOWN_REQUESTED: return "shutdown_requested";
        case TradeSetupFailure::NO_MARKET_DATA: return "no_market_data";
        case TradeSetupFailure::INVALID_ORDER_SIZE: return "invalid_order_size";
        case TradeSetupFailure::INSUFFICIENT_BALANCE: return "insufficient_balance";
        case TradeSetupFailure::ENTRY_NOT_FILLED: return "entry_not_filled";
        case TradeSetupFailure::PROTECTION_FAILED: return "protection_failed";
        case TradeSetupFailure::EXCHANGE_ERROR: return "exchange_error";
    }
    throw std::runtime_error("Unknown trade setup failure");
}

OrderSide parse_order_side(const std::string& side_str) {
    std::string normalized_side = to_lower_copy(side_str);
    if (normalized_side == "buy") return OrderSide::BUY;
    if (normalized_side == "sell") return OrderSide::SELL;
    throw std::runtime_error("Invalid order side: " + side_str);
}

OrderRole parse_order_role(const std::string& role_str) {
    if (role_str == "entry") return OrderRole::ENTRY;
    if (role_str == "take_profit") return OrderRole::TAKE_PROFIT;
    if (role_str == "stop_loss") return OrderRole::STOP_LOSS;
    if (role_str == "liquidation") return OrderRole::LIQUIDATION;
    throw std::runtime_error("Invalid order role: " + role_str);
}

OrderRecordStatus parse_order_record_status(const std::string& status_str) {
    if (status_str == "active") return OrderRecordStatus::ACTIVE;
    if (status_str == "filled") return OrderRecordStatus::FILLED;
    if (status_str == "cancelled") return OrderRecordStatus::CANCELLED;
    throw std::runtime_error("Invalid order record status: " + status_str);
}

PositionStatus parse_position_status(const std::string& status_str) {
    if (status_str == "open") return PositionStatus::OPEN;
    if (status_str == "closed") return PositionStatus::CLOSED;
    throw std::runtime_error("Invalid position status: " + status_str);
}

} // namespace Core
} // namespace ValrTrader
