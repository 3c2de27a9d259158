#include "position_recovery.hpp"
#include "logging/logs/trading_logs.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>

using ValrTrader::Logging::TradingLogs;

namespace ValrTrader {
namespace Core {

PositionRecovery::PositionRecovery(API::ExchangeGatewayInterface& gateway_ref, const Config::SystemConfig& config_ref,
                                   const ClockInterface& clock_ref)
    : gateway(gateway_ref), config(config_ref), clock(clock_ref) {}

std::vector<Position> PositionRecovery::recover_from_exchange() {
    std::vector<OpenOrder> open_orders = gateway.get_open_orders();
    return reconstruct_positions(open_orders);
}

Decimal PositionRecovery::infer_entry_price(const Decimal& take_profit_price, int price_decimals) const {
    Decimal take_profit_multiplier = Decimal(1) + config.strategy.take_profit_percentage * Decimal("0.01");
    return DecimalUtils::divide_round_down(take_profit_price, take_profit_multiplier, price_decimals);
}

std::vector<Position> PositionRecovery::reconstruct_positions(const std::vector<OpenOrder>& open_orders) const {
    std::map<std::string, std::vector<OpenOrder>> sell_orders_by_pair;
    for (const OpenOrder& open_order : open_orders) {
        if (open_order.side != OrderSide::SELL) {
            TradingLogs::log_recovery_unmatched(open_order.pair, "ignoring open buy order " + open_order.order_id);
            continue;
        }
        sell_orders_by_pair[open_order.pair].push_back(open_order);
    }

    std::vector<Position> recovered_positions;
    for (std::pair<const std::string, std::vector<OpenOrder>>& pair_entry : sell_orders_by_pair) {
        std::vector<Position> pair_positions = match_pair_orders(pair_entry.first, pair_entry.second);
        recovered_positions.insert(recovered_positions.end(), pair_positions.begin(), pair_positions.end());
    }
    return recovered_positions;
}

std::vector<Position> PositionRecovery::match_pair_orders(const std::string& pair, std::vector<OpenOrder> sell_orders) const {
    Config::PairSettings pair_settings = config.pairs.resolve(pair);
    Decimal quantity_tolerance = DecimalUtils::power_of_ten(-pair_settings.quantity_decimals);
    long long recovery_timestamp = TimeUtils::to_epoch_milliseconds(clock.now());

    // Deterministic pairing order
    std::sort(sell_orders.begin(), sell_orders.end(), [](const OpenOrder& left, const OpenOrder& right) {
        return left.order_id < right.order_id;
    });

    std::vector<bool> order_matched(sell_orders.size(), false);
    std::vector<Position> pair_positions;

    for (size_t first_index = 0; first_index < sell_orders.size(); ++first_index) {
        if (order_matched[first_index]) continue;

        for (size_t second_index = first_index + 1; second_index < sell_orders.size(); ++second_index) {
            if (order_matched[second_index]) continue;

            const OpenOrder& first_order = sell_orders[first_index];
            const OpenOrder& second_order = sell_orders[second_index];
            Decimal quantity_difference = first_order.quantity - second_order.quantity;
            if (quantity_difference < 0) {
                quantity_difference = -quantity_difference;
            }
            if (quantity_difference > quantity_tolerance || first_order.price == second_order.price) {
                continue;
            }

            const OpenOrder& take_profit_order = first_order.price > second_order.price ? first_order : second_order;
            const OpenOrder& stop_loss_order = first_order.price > second_order.price ? second_order : first_order;
            Decimal inferred_entry_price = infer_entry_price(take_profit_order.price, pair_settings.price_decimals);

            if (!(stop_loss_order.price < inferred_entry_price && inferred_entry_price < take_profit_order.price)) {
                TradingLogs::log_recovery_unmatched(pair, "orders " + take_profit_order.order_id + " and " +
                                                    stop_loss_order.order_id + " do not bracket inferred entry " +
                                                    DecimalUtils::format_decimal(inferred_entry_price));
                continue;
            }

            Position recovered_position;
            recovered_position.position_id = pair + "_recovered_" + std::to_string(recovery_timestamp);
            if (!pair_positions.empty()) {
                recovered_position.position_id += "_" + std::to_string(pair_positions.size());
            }
            recovered_position.pair = pair;
            recovered_position.quantity = std::min(take_profit_order.quantity, stop_loss_order.quantity);
            recovered_position.entry_price = inferred_entry_price;
            recovered_position.take_profit_price = take_profit_order.price;
            recovered_position.stop_loss_price = stop_loss_order.price;
            recovered_position.created_at = clock.now();
            recovered_position.entry_filled_at = recovered_position.created_at;
            recovered_position.status = PositionStatus::OPEN;
            recovered_position.entry_order_id = "recovered";
            recovered_position.take_profit_order_id = take_profit_order.order_id;
            recovered_position.stop_loss_order_id = stop_loss_order.order_id;

            order_matched[first_index] = true;
            order_matched[second_index] = true;
            TradingLogs::log_position_recovered(recovered_position);
            pair_positions.push_back(recovered_position);
            break;
        }
    }

    for (size_t order_index = 0; order_index < sell_orders.size(); ++order_index) {
        if (!order_matched[order_index]) {
            const OpenOrder& unmatched_order = sell_orders[order_index];
            TradingLogs::log_recovery_unmatched(pair, "unmatched sell order " + unmatched_order.order_id + " qty " +
                                                DecimalUtils::format_decimal(unmatched_order.quantity) + " @ " +
                                                DecimalUtils::format_decimal(unmatched_order.price));
        }
    }
    return pair_positions;
}

} // namespace Core
} // namespace ValrTrader
