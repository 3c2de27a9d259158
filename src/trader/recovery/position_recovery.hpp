#ifndef POSITION_RECOVERY_HPP
#define POSITION_RECOVERY_HPP

#include <map>
#include <string>
#include <vector>
#include "api/general/exchange_gateway_interface.hpp"
#include "configs/system_config.hpp"
#include "trader/data_structures/data_structures.hpp"
#include "utils/clock.hpp"

namespace ValrTrader {
namespace Core {

/**
 * @brief Rebuilds open positions from resting exchange orders.
 * Two open sell orders of equal quantity on one pair are read as a
 * take-profit (higher price) and stop-loss (lower price) bracket. The entry
 * price is inferred from the take-profit price and the configured percentage.
 * Orders that cannot be paired are logged and never turned into positions.
 */
class PositionRecovery {
public:
    PositionRecovery(API::ExchangeGatewayInterface& gateway, const Config::SystemConfig& config, const ClockInterface& clock);

    std::vector<Position> recover_from_exchange();

    // Groups and matches an already fetched order list.
    std::vector<Position> reconstruct_positions(const std::vector<OpenOrder>& open_orders) const;

    Decimal infer_entry_price(const Decimal& take_profit_price, int price_decimals) const;

private:
    std::vector<Position> match_pair_orders(const std::string& pair, std::vector<OpenOrder> sell_orders) const;

    API::ExchangeGatewayInterface& gateway;
    const Config::SystemConfig& config;
    const ClockInterface& clock;
};

} // namespace Core
} // namespace ValrTrader

#endif // POSITION_RECOVERY_HPP
