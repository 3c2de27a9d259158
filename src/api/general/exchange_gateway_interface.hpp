#ifndef EXCHANGE_GATEWAY_INTERFACE_HPP
#define EXCHANGE_GATEWAY_INTERFACE_HPP

#include "trader/data_structures/data_structures.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace ValrTrader {
namespace API {

/**
 * @brief Authenticated exchange operations used by the trading engine.
 * Failures surface as ExchangeError subclasses (see api_errors.hpp).
 */
class ExchangeGatewayInterface {
public:
    virtual ~ExchangeGatewayInterface() = default;

    virtual std::map<std::string, Core::Decimal> get_balances() = 0;
    virtual Core::OrderBook get_order_book(const std::string& pair) = 0;

    virtual std::string place_limit_order(const Core::LimitOrderRequest& order_request) = 0;
    virtual std::string place_market_order(const Core::MarketOrderRequest& order_request) = 0;
    virtual std::string place_stop_limit_order(const Core::StopLimitOrderRequest& order_request) = 0;
    virtual void cancel_order(const std::string& pair, const std::string& order_id) = 0;

    virtual Core::OrderStatusReport get_order_status(const std::string& pair, const std::string& order_id) = 0;
    virtual std::vector<Core::OpenOrder> get_open_orders() = 0;
    virtual std::vector<Core::OrderFill> get_order_fills(const std::string& pair, const std::string& order_id) = 0;

    virtual Core::Decimal get_last_traded_price(const std::string& pair) = 0;
    virtual long long get_server_time() = 0;
};

using ExchangeGatewayPtr = std::unique_ptr<ExchangeGatewayInterface>;

} // namespace API
} // namespace ValrTrader

#endif // EXCHANGE_GATEWAY_INTERFACE_HPP
