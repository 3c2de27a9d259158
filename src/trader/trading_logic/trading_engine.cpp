#include "trading_engine.hpp"
#include "api/general/api_errors.hpp"
#include "logging/logs/trading_logs.hpp"
#include "logging/logs/persistence_logs.hpp"
#include "trader/recovery/position_recovery.hpp"
#include "utils/time_utils.hpp"

using ValrTrader::Logging::TradingLogs;
using ValrTrader::Logging::PersistenceLogs;

namespace ValrTrader {
namespace Core {

TradingEngine::TradingEngine(const TradingEngineConstructionParams& construction_params)
    : config(construction_params.system_config),
      gateway(construction_params.gateway_ref),
      order_store(construction_params.order_store_ref),
      position_store(construction_params.position_store_ref),
      clock(construction_params.clock_ref),
      shutdown_requested(construction_params.shutdown_flag_ref),
      fill_waiter(construction_params.gateway_ref, construction_params.clock_ref, construction_params.shutdown_flag_ref,
                  FillPollSchedule::from_timing_config(construction_params.system_config.timing)),
      entry_pricing_strategy(create_entry_pricing_strategy(construction_params.system_config.strategy.entry_pricing_mode)) {
    daily_counters.date = TimeUtils::format_utc_date(clock.now());
}

// ========================================================================
// TRADE SETUP
// ========================================================================

TradeSetupResult TradingEngine::execute_trade_setup(const std::string& pair, const SignalDecision& signal) {
    TradingLogs::log_trade_setup_start(pair, signal);

    {
        std::lock_guard<std::mutex> state_lock(engine_state_mutex);
        roll_daily_counters_unlocked(clock.now());
        if (daily_counters.trades_today >= config.strategy.max_daily_trades) {
            return make_rejection(pair, TradeSetupFailure::DAILY_LIMIT_REACHED,
                                  std::to_string(daily_counters.trades_today) + " of " +
                                  std::to_string(config.strategy.max_daily_trades) + " trades used");
        }
        if (!config.strategy.allow_multiple_positions_per_pair && has_open_position_for_pair_unlocked(pair)) {
            return make_rejection(pair, TradeSetupFailure::POSITION_ALREADY_OPEN, "position already open on " + pair);
        }
    }

    if (shutdown_requested.load()) {
        return make_rejection(pair, TradeSetupFailure::SHUTDOWN_REQUESTED, "shutdown in progress");
    }

    try {
        Config::PairSettings pair_settings = config.pairs.resolve(pair);

        OrderBook order_book = gateway.get_order_book(pair);
        if (!order_book.has_best_bid() || !order_book.has_best_ask()) {
            return make_rejection(pair, TradeSetupFailure::NO_MARKET_DATA, "order book has no usable best bid/ask");
        }

        EntryOrderPlan entry_plan = entry_pricing_strategy->plan_entry(order_book, pair_settings);
        if (entry_plan.price <= 0) {
            return make_rejection(pair, TradeSetupFailure::NO_MARKET_DATA, "entry price rounds to zero");
        }

        Decimal entry_quantity = DecimalUtils::divide_round_down(config.strategy.base_trade_amount, entry_plan.price,
                                                                 pair_settings.quantity_decimals);
        if (entry_quantity <= 0 || entry_quantity < pair_settings.minimum_quantity) {
            return make_rejection(pair, TradeSetupFailure::INVALID_ORDER_SIZE,
                                  "quantity " + DecimalUtils::format_decimal(entry_quantity) + " below minimum");
        }

        std::map<std::string, Decimal> balances = gateway.get_balances();
        Decimal available_balance{0};
        std::map<std::string, Decimal>::const_iterator balance_iterator = balances.find(pair_settings.quote_currency);
        if (balance_iterator != balances.end()) {
            available_balance = balance_iterator->second;
        }
        Decimal required_balance = required_quote_balance();
        if (available_balance < required_balance) {
            return make_rejection(pair, TradeSetupFailure::INSUFFICIENT_BALANCE,
                                  "need " + DecimalUtils::format_decimal(required_balance) + " " +
                                  pair_settings.quote_currency + ", have " + DecimalUtils::format_decimal(available_balance));
        }

        std::string entry_order_id = place_entry_order(pair, entry_plan, entry_quantity);
        FillOutcome entry_fill = confirm_entry_fill(pair, entry_order_id, entry_quantity, entry_plan.price);

        if (entry_fill.state != FillState::FILLED && entry_fill.state != FillState::PARTIALLY_FILLED) {
            TradeSetupFailure failure_reason = entry_fill.state == FillState::SHUTDOWN
                ? TradeSetupFailure::SHUTDOWN_REQUESTED : TradeSetupFailure::ENTRY_NOT_FILLED;
            return make_rejection(pair, failure_reason, "entry " + entry_order_id + " ended " + to_string(entry_fill.state));
        }

        Decimal filled_quantity = DecimalUtils::round_down(entry_fill.filled_quantity, pair_settings.quantity_decimals);
        Decimal entry_price = entry_fill.average_price > 0 ? entry_fill.average_price : entry_plan.price;
        if (filled_quantity <= 0) {
            return make_rejection(pair, TradeSetupFailure::ENTRY_NOT_FILLED,
                                  "filled quantity " + DecimalUtils::format_decimal(entry_fill.filled_quantity) +
                                  " below quantity precision");
        }

        Position position;
        position.pair = pair;
        position.quantity = filled_quantity;
        position.entry_order_id = entry_order_id;
        try {
            position = build_position(pair, entry_order_id, filled_quantity, entry_price, pair_settings);
            place_protective_orders(position);
        } catch (const TradingError& protection_exception_error) {
            handle_protection_failure(position, protection_exception_error.what());
            return make_rejection(pair, TradeSetupFailure::PROTECTION_FAILED, protection_exception_error.what());
        }

        register_open_position(position);
        TradingLogs::log_position_opened(position);
        return position;
    } catch (const API::ExchangeError& exchange_exception_error) {
        return make_rejection(pair, TradeSetupFailure::EXCHANGE_ERROR, exchange_exception_error.what());
    }
}

TradeSetupRejection TradingEngine::make_rejection(const std::string& pair, TradeSetupFailure reason,
                                                  const std::string& detail) const {
    TradeSetupRejection rejection{reason, detail};
    TradingLogs::log_trade_setup_rejected(pair, rejection);
    return rejection;
}

Decimal TradingEngine::required_quote_balance() const {
    const Decimal& trade_amount = config.strategy.base_trade_amount;
    return trade_amount + DecimalUtils::percentage_of(trade_amount, config.strategy.maker_fee_percentage) +
           DecimalUtils::percentage_of(trade_amount, config.strategy.balance_safety_margin_percentage);
}

std::string TradingEngine::place_entry_order(const std::string& pair, const EntryOrderPlan& entry_plan, const Decimal& quantity) {
    std::string entry_order_id;
    if (entry_plan.order_type == EntryOrderType::MARKET) {
        MarketOrderRequest market_request;
        market_request.pair = pair;
        market_request.side = OrderSide::BUY;
        market_request.quote_amount = config.strategy.base_trade_amount;
        entry_order_id = gateway.place_market_order(market_request);
    } else {
        LimitOrderRequest limit_request;
        limit_request.pair = pair;
        limit_request.side = OrderSide::BUY;
        limit_request.quantity = quantity;
        limit_request.price = entry_plan.price;
        limit_request.post_only = entry_plan.order_type == EntryOrderType::POST_ONLY_LIMIT;
        entry_order_id = gateway.place_limit_order(limit_request);
    }

    TradingLogs::log_order_placed(pair, OrderRole::ENTRY, to_string(entry_plan.order_type), entry_order_id, quantity, entry_plan.price);
    record_order(entry_order_id, pair, OrderSide::BUY, quantity, entry_plan.price, OrderRole::ENTRY);
    return entry_order_id;
}

FillOutcome TradingEngine::confirm_entry_fill(const std::string& pair, const std::string& entry_order_id,
                                              const Decimal& quantity, const Decimal& expected_price) {
    std::chrono::milliseconds entry_timeout = std::chrono::seconds(config.timing.entry_order_timeout_seconds);
    FillOutcome fill_outcome = fill_waiter.wait_for_fill(pair, entry_order_id, quantity, expected_price, entry_timeout);

    if (fill_outcome.state == FillState::FILLED || fill_outcome.state == FillState::PARTIALLY_FILLED) {
        order_store.update_order_status(entry_order_id, OrderRecordStatus::FILLED);
        return fill_outcome;
    }
    if (fill_outcome.state == FillState::CANCELLED) {
        order_store.update_order_status(entry_order_id, OrderRecordStatus::CANCELLED);
        return fill_outcome;
    }

    cancel_order_safely(pair, entry_order_id, "entry " + to_string(fill_outcome.state));

    // A fill can land between the last poll and the cancel
    try {
        OrderStatusReport final_report = gateway.get_order_status(pair, entry_order_id);
        bool has_filled_quantity = final_report.filled_quantity && *final_report.filled_quantity > 0;
        if (final_report.status == OrderStatus::FILLED || has_filled_quantity) {
            FillState late_fill_state = final_report.status == OrderStatus::FILLED ? FillState::FILLED : FillState::PARTIALLY_FILLED;
            FillOutcome late_fill = fill_waiter.resolve_filled_outcome(pair, final_report, late_fill_state, quantity, expected_price);
            TradingLogs::log_fill_outcome(pair, entry_order_id, late_fill);
            order_store.update_order_status(entry_order_id, OrderRecordStatus::FILLED);
            return late_fill;
        }
    } catch (const API::ExchangeError& status_exception_error) {
        TradingLogs::log_order_status_error(entry_order_id, status_exception_error.what());
    }

    order_store.update_order_status(entry_order_id, OrderRecordStatus::CANCELLED);
    return fill_outcome;
}

Position TradingEngine::build_position(const std::string& pair, const std::string& entry_order_id, const Decimal& filled_quantity,
                                       const Decimal& entry_price, const Config::PairSettings& pair_settings) const {
    Position position;
    TimePoint current_time = clock.now();
    position.position_id = pair + "_" + std::to_string(TimeUtils::to_epoch_milliseconds(current_time));
    position.pair = pair;
    position.quantity = filled_quantity;
    position.entry_price = entry_price;
    position.take_profit_price = DecimalUtils::round_to_tick(
        DecimalUtils::apply_percentage_increase(entry_price, config.strategy.take_profit_percentage), pair_settings.tick_size);
    position.stop_loss_price = DecimalUtils::round_to_tick(
        DecimalUtils::apply_percentage_decrease(entry_price, config.strategy.stop_loss_percentage), pair_settings.tick_size);
    position.created_at = current_time;
    position.entry_filled_at = current_time;
    position.status = PositionStatus::OPEN;
    position.entry_order_id = entry_order_id;

    if (!(position.stop_loss_price > 0 && position.stop_loss_price < position.entry_price &&
          position.entry_price < position.take_profit_price)) {
        throw TradingError("Exit prices for " + pair + " do not bracket entry " + DecimalUtils::format_decimal(entry_price) +
                           " (tp " + DecimalUtils::format_decimal(position.take_profit_price) +
                           ", sl " + DecimalUtils::format_decimal(position.stop_loss_price) + ")");
    }
    return position;
}

void TradingEngine::place_protective_orders(Position& position) {
    try {
        if (config.strategy.protection_mode == Config::ProtectionMode::DUAL) {
            LimitOrderRequest take_profit_request;
            take_profit_request.pair = position.pair;
            take_profit_request.side = OrderSide::SELL;
            take_profit_request.quantity = position.quantity;
            take_profit_request.price = position.take_profit_price;
            take_profit_request.post_only = true;
            std::string take_profit_order_id = gateway.place_limit_order(take_profit_request);
            position.take_profit_order_id = take_profit_order_id;
            TradingLogs::log_order_placed(position.pair, OrderRole::TAKE_PROFIT, "POST_ONLY_LIMIT", take_profit_order_id,
                                          position.quantity, position.take_profit_price);
            record_order(take_profit_order_id, position.pair, OrderSide::SELL, position.quantity,
                         position.take_profit_price, OrderRole::TAKE_PROFIT);
        }

        StopLimitOrderRequest stop_loss_request;
        stop_loss_request.pair = position.pair;
        stop_loss_request.side = OrderSide::SELL;
        stop_loss_request.quantity = position.quantity;
        stop_loss_request.stop_price = position.stop_loss_price;
        stop_loss_request.limit_price = position.stop_loss_price;
        std::string stop_loss_order_id = gateway.place_stop_limit_order(stop_loss_request);
        position.stop_loss_order_id = stop_loss_order_id;
        TradingLogs::log_order_placed(position.pair, OrderRole::STOP_LOSS, "STOP_LIMIT", stop_loss_order_id,
                                      position.quantity, position.stop_loss_price);
        record_order(stop_loss_order_id, position.pair, OrderSide::SELL, position.quantity,
                     position.stop_loss_price, OrderRole::STOP_LOSS);
    } catch (const API::ExchangeError& placement_exception_error) {
        throw TradingError("Protective order placement failed for " + position.pair + ": " + placement_exception_error.what());
    }
}

void TradingEngine::handle_protection_failure(const Position& position, const std::string& error_message) {
    TradingLogs::log_protection_failure(position.pair, error_message);
    cancel_protective_orders(position, "protection failed");

    if (!sell_position_quantity(position.pair, position.quantity, "protection_failed")) {
        TradingLogs::log_manual_intervention_required(position.pair, position.quantity,
                                                      "filled entry " + position.entry_order_id +
                                                      " is unprotected and could not be liquidated");
    }

    std::lock_guard<std::mutex> state_lock(engine_state_mutex);
    roll_daily_counters_unlocked(clock.now());
    daily_counters.failed_trades_today++;
}

void TradingEngine::register_open_position(const Position& position) {
    {
        std::lock_guard<std::mutex> state_lock(engine_state_mutex);
        open_positions[position.position_id] = position;
        daily_counters.trades_today++;
    }
    try {
        position_store.save_position(position);
    } catch (const PersistenceError& persistence_exception_error) {
        PersistenceLogs::log_store_failure("PositionStore", persistence_exception_error.what());
    }
}

// ========================================================================
// SHARED ORDER HELPERS
// ========================================================================

void TradingEngine::record_order(const std::string& order_id, const std::string& pair, OrderSide side,
                                 const Decimal& quantity, const Decimal& price, OrderRole role) {
    OrderRecord order_record;
    order_record.order_id = order_id;
    order_record.pair = pair;
    order_record.side = side;
    order_record.quantity = quantity;
    order_record.price = price;
    order_record.role = role;
    order_record.status = OrderRecordStatus::ACTIVE;
    order_record.created_at = clock.now();
    order_record.last_updated = order_record.created_at;
    order_store.add_order(order_record);
}

bool TradingEngine::cancel_order_safely(const std::string& pair, const std::string& order_id, const std::string& reason) {
    try {
        gateway.cancel_order(pair, order_id);
    } catch (const API::ExchangeError& cancel_exception_error) {
        TradingLogs::log_order_cancel_failed(pair, order_id, cancel_exception_error.what());
        return false;
    }
    TradingLogs::log_order_cancelled(pair, order_id, reason);
    order_store.update_order_status(order_id, OrderRecordStatus::CANCELLED);
    return true;
}

void TradingEngine::cancel_protective_orders(const Position& position, const std::string& reason) {
    if (position.take_profit_order_id) {
        cancel_order_safely(position.pair, *position.take_profit_order_id, reason);
    }
    if (position.stop_loss_order_id) {
        cancel_order_safely(position.pair, *position.stop_loss_order_id, reason);
    }
}

bool TradingEngine::sell_position_quantity(const std::string& pair, const Decimal& quantity, const std::string& reason) {
    Config::PairSettings pair_settings = config.pairs.resolve(pair);
    Decimal sell_quantity = DecimalUtils::round_down(quantity, pair_settings.quantity_decimals);
    if (sell_quantity <= 0) {
        TradingLogs::log_liquidation_attempt(pair, "none", false, quantity, "quantity below precision, nothing to sell");
        return false;
    }

    try {
        MarketOrderRequest market_request;
        market_request.pair = pair;
        market_request.side = OrderSide::SELL;
        market_request.base_quantity = sell_quantity;
        std::string market_order_id = gateway.place_market_order(market_request);
        TradingLogs::log_liquidation_attempt(pair, "market", true, sell_quantity, reason + " order " + market_order_id);
        return true;
    } catch (const API::ExchangeError& market_exception_error) {
        TradingLogs::log_liquidation_attempt(pair, "market", false, sell_quantity, market_exception_error.what());
    }

    try {
        OrderBook order_book = gateway.get_order_book(pair);
        if (!order_book.has_best_bid()) {
            TradingLogs::log_liquidation_attempt(pair, "limit_at_bid", false, sell_quantity, "no bid in order book");
            return false;
        }
        LimitOrderRequest limit_request;
        limit_request.pair = pair;
        limit_request.side = OrderSide::SELL;
        limit_request.quantity = sell_quantity;
        limit_request.price = DecimalUtils::round_to_tick(order_book.best_bid(), pair_settings.tick_size);
        limit_request.post_only = false;
        std::string limit_order_id = gateway.place_limit_order(limit_request);
        record_order(limit_order_id, pair, OrderSide::SELL, sell_quantity, limit_request.price, OrderRole::LIQUIDATION);
        TradingLogs::log_liquidation_attempt(pair, "limit_at_bid", true, sell_quantity,
                                             reason + " order " + limit_order_id + " @ " +
                                             DecimalUtils::format_decimal(limit_request.price));
        return true;
    } catch (const API::ExchangeError& limit_exception_error) {
        TradingLogs::log_liquidation_attempt(pair, "limit_at_bid", false, sell_quantity, limit_exception_error.what());
    }
    return false;
}

// ========================================================================
// STARTUP, PERSISTENCE AND QUERIES
// ========================================================================

size_t TradingEngine::startup_recovery() {
    try {
        order_store.load();
    } catch (const PersistenceError& persistence_exception_error) {
        PersistenceLogs::log_store_failure("OrderStore", persistence_exception_error.what());
    }

    PositionMap loaded_positions;
    try {
        loaded_positions = position_store.load_positions();
    } catch (const PersistenceError& persistence_exception_error) {
        PersistenceLogs::log_store_failure("PositionStore", persistence_exception_error.what());
    }
    size_t loaded_count = loaded_positions.size();

    size_t reconstructed_count = 0;
    if (loaded_positions.empty()) {
        try {
            PositionRecovery position_recovery(gateway, config, clock);
            std::vector<Position> recovered_positions = position_recovery.recover_from_exchange();
            for (const Position& recovered_position : recovered_positions) {
                loaded_positions[recovered_position.position_id] = recovered_position;
            }
            reconstructed_count = recovered_positions.size();
        } catch (const API::ExchangeError& recovery_exception_error) {
            TradingLogs::log_monitor_error("startup_recovery", recovery_exception_error.what());
        }

        if (reconstructed_count > 0) {
            try {
                position_store.save_positions(loaded_positions);
            } catch (const PersistenceError& persistence_exception_error) {
                PersistenceLogs::log_store_failure("PositionStore", persistence_exception_error.what());
            }
        }
    }

    std::lock_guard<std::mutex> state_lock(engine_state_mutex);
    open_positions.clear();
    for (const std::pair<const std::string, Position>& position_entry : loaded_positions) {
        if (position_entry.second.status == PositionStatus::OPEN) {
            open_positions[position_entry.first] = position_entry.second;
        }
    }
    TradingLogs::log_recovery_summary(loaded_count, reconstructed_count);
    return open_positions.size();
}

size_t TradingEngine::cleanup_stale_orders() {
    return order_store.cleanup_stale_orders(config.timing.stale_order_max_age_hours);
}

void TradingEngine::persist_state() {
    try {
        order_store.save();
    } catch (const PersistenceError& persistence_exception_error) {
        PersistenceLogs::log_store_failure("OrderStore", persistence_exception_error.what());
    }

    PositionMap positions_snapshot;
    {
        std::lock_guard<std::mutex> state_lock(engine_state_mutex);
        positions_snapshot = open_positions;
    }
    try {
        position_store.save_positions(positions_snapshot);
    } catch (const PersistenceError& persistence_exception_error) {
        PersistenceLogs::log_store_failure("PositionStore", persistence_exception_error.what());
    }
}

std::vector<Position> TradingEngine::get_open_positions() const {
    std::lock_guard<std::mutex> state_lock(engine_state_mutex);
    std::vector<Position> positions_snapshot;
    for (const std::pair<const std::string, Position>& position_entry : open_positions) {
        positions_snapshot.push_back(position_entry.second);
    }
    return positions_snapshot;
}

std::optional<Position> TradingEngine::get_position(const std::string& position_id) const {
    std::lock_guard<std::mutex> state_lock(engine_state_mutex);
    std::map<std::string, Position>::const_iterator position_iterator = open_positions.find(position_id);
    if (position_iterator == open_positions.end()) {
        return std::nullopt;
    }
    return position_iterator->second;
}

DailyCounters TradingEngine::get_daily_counters() const {
    std::lock_guard<std::mutex> state_lock(engine_state_mutex);
    return daily_counters;
}

void TradingEngine::roll_daily_counters_unlocked(TimePoint current_time) {
    std::string current_date = TimeUtils::format_utc_date(current_time);
    if (daily_counters.date == current_date) {
        return;
    }
    if (!daily_counters.date.empty()) {
        TradingLogs::log_daily_counters_reset(daily_counters);
    }
    daily_counters = DailyCounters{};
    daily_counters.date = current_date;
}

bool TradingEngine::has_open_position_for_pair_unlocked(const std::string& pair) const {
    for (const std::pair<const std::string, Position>& position_entry : open_positions) {
        if (position_entry.second.pair == pair) {
            return true;
        }
    }
    return false;
}

} // namespace Core
} // namespace ValrTrader
