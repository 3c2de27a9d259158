#ifndef TRADING_ENGINE_STRUCTURES_HPP
#define TRADING_ENGINE_STRUCTURES_HPP

#include <atomic>
#include "api/general/exchange_gateway_interface.hpp"
#include "configs/system_config.hpp"
#include "trader/persistence/order_store.hpp"
#include "trader/persistence/position_store.hpp"
#include "utils/clock.hpp"

namespace ValrTrader {
namespace Core {

struct TradingEngineConstructionParams {
    const Config::SystemConfig& system_config;
    API::ExchangeGatewayInterface& gateway_ref;
    OrderStore& order_store_ref;
    PositionStore& position_store_ref;
    const ClockInterface& clock_ref;
    const std::atomic<bool>& shutdown_flag_ref;

    TradingEngineConstructionParams(const Config::SystemConfig& config, API::ExchangeGatewayInterface& gateway,
                                    OrderStore& order_store, PositionStore& position_store,
                                    const ClockInterface& clock, const std::atomic<bool>& shutdown_flag)
        : system_config(config), gateway_ref(gateway), order_store_ref(order_store),
          position_store_ref(position_store), clock_ref(clock), shutdown_flag_ref(shutdown_flag) {}
};

// Exit classification used when a position closes on a protective order.
struct ExitAttribution {
    OrderRole exit_role = OrderRole::TAKE_PROFIT;
    Decimal exit_price;
    std::string reason;
};

} // namespace Core
} // namespace ValrTrader

#endif // TRADING_ENGINE_STRUCTURES_HPP
