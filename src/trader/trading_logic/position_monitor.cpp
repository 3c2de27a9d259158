#include "trading_engine.hpp"
#include "api/general/api_errors.hpp"
#include "logging/logs/trading_logs.hpp"
#include "logging/logs/persistence_logs.hpp"

using ValrTrader::Logging::TradingLogs;
using ValrTrader::Logging::PersistenceLogs;

namespace ValrTrader {
namespace Core {

namespace {
    bool is_order_open(const std::vector<OpenOrder>& open_orders, const std::string& order_id) {
        for (const OpenOrder& open_order : open_orders) {
            if (open_order.order_id == order_id) {
                return true;
            }
        }
        return false;
    }

    bool report_shows_no_fill(const OrderStatusReport& status_report) {
        bool has_filled_quantity = status_report.filled_quantity && *status_report.filled_quantity > 0;
        return status_report.status == OrderStatus::CANCELLED && !has_filled_quantity;
    }
}

// ========================================================================
// MONITOR CYCLE
// ========================================================================

void TradingEngine::monitor_positions() {
    {
        std::lock_guard<std::mutex> state_lock(engine_state_mutex);
        roll_daily_counters_unlocked(clock.now());
    }

    std::vector<Position> positions_snapshot = get_open_positions();
    if (!positions_snapshot.empty()) {
        std::optional<std::vector<OpenOrder>> open_orders;
        try {
            open_orders = gateway.get_open_orders();
        } catch (const API::ExchangeError& open_orders_exception_error) {
            TradingLogs::log_monitor_error("open_orders", open_orders_exception_error.what());
        }

        for (const Position& position : positions_snapshot) {
            try {
                monitor_single_position(position, open_orders);
            } catch (const API::ExchangeError& monitor_exception_error) {
                TradingLogs::log_monitor_error(position.position_id, monitor_exception_error.what());
            }
        }
    }

    DailyCounters counters_snapshot;
    size_t open_position_count = 0;
    {
        std::lock_guard<std::mutex> state_lock(engine_state_mutex);
        counters_snapshot = daily_counters;
        open_position_count = open_positions.size();
    }
    TradingLogs::log_daily_statistics(counters_snapshot, open_position_count, config.strategy.max_daily_trades);
}

void TradingEngine::monitor_single_position(const Position& position, const std::optional<std::vector<OpenOrder>>& open_orders) {
    if (check_hard_timeouts(position, clock.now())) {
        return;
    }

    if (!position.take_profit_order_id && !position.stop_loss_order_id) {
        force_close_position(position.position_id, "no_protective_orders");
        return;
    }

    // Without the open order list the status check still detects fills
    if (open_orders && check_exit_order_existence(position, *open_orders)) {
        return;
    }

    if (check_exit_order_statuses(position)) {
        return;
    }

    if (config.strategy.protection_mode == Config::ProtectionMode::STOP_LOSS_ONLY && !position.take_profit_order_id) {
        check_manual_take_profit(position);
    }
}

bool TradingEngine::check_hard_timeouts(const Position& position, TimePoint current_time) {
    TimePoint position_deadline = position.entry_filled_at + std::chrono::minutes(config.timing.position_timeout_minutes);
    TimePoint exit_orders_deadline = position.entry_filled_at + std::chrono::minutes(config.timing.exit_order_timeout_minutes);

    if (current_time > position_deadline) {
        force_close_position(position.position_id, "position_timeout");
        return true;
    }
    if (current_time > exit_orders_deadline) {
        force_close_position(position.position_id, "exit_orders_timeout");
        return true;
    }
    return false;
}

// ========================================================================
// EXISTENCE CHECK
// ========================================================================

bool TradingEngine::check_exit_order_existence(const Position& position, const std::vector<OpenOrder>& open_orders) {
    bool take_profit_open = position.take_profit_order_id && is_order_open(open_orders, *position.take_profit_order_id);
    bool stop_loss_open = position.stop_loss_order_id && is_order_open(open_orders, *position.stop_loss_order_id);
    bool take_profit_missing = position.take_profit_order_id && !take_profit_open;
    bool stop_loss_missing = position.stop_loss_order_id && !stop_loss_open;

    if (take_profit_missing && stop_loss_missing) {
        force_close_position(position.position_id, "exit_orders_missing");
        return true;
    }
    if (take_profit_missing) {
        handle_missing_exit_order(position, OrderRole::TAKE_PROFIT);
        return true;
    }
    if (stop_loss_missing) {
        handle_missing_exit_order(position, OrderRole::STOP_LOSS);
        return true;
    }
    return false;
}

void TradingEngine::handle_missing_exit_order(const Position& position, OrderRole missing_role) {
    const std::optional<std::string>& missing_order_id = missing_role == OrderRole::TAKE_PROFIT
        ? position.take_profit_order_id : position.stop_loss_order_id;
    const Decimal& target_price = missing_role == OrderRole::TAKE_PROFIT ? position.take_profit_price : position.stop_loss_price;

    std::optional<OrderStatusReport> missing_order_report;
    try {
        missing_order_report = gateway.get_order_status(position.pair, *missing_order_id);
    } catch (const API::ExchangeError& status_exception_error) {
        TradingLogs::log_order_status_error(*missing_order_id, status_exception_error.what());
    }

    // Cancelled with nothing filled: the quantity is still held
    if (missing_order_report && report_shows_no_fill(*missing_order_report)) {
        force_close_position(position.position_id, "exit_order_cancelled");
        return;
    }

    // Sole protective order gone without a confirmed fill
    const std::optional<std::string>& other_order_id = missing_role == OrderRole::TAKE_PROFIT
        ? position.stop_loss_order_id : position.take_profit_order_id;
    bool missing_order_filled = missing_order_report && missing_order_report->status == OrderStatus::FILLED;
    if (!other_order_id && !missing_order_filled) {
        force_close_position(position.position_id, to_string(missing_role) + "_missing");
        return;
    }

    ExitAttribution exit_attribution;
    exit_attribution.exit_role = missing_role;
    exit_attribution.exit_price = target_price;
    if (missing_order_report && missing_order_report->average_price && *missing_order_report->average_price > 0) {
        exit_attribution.exit_price = *missing_order_report->average_price;
    }
    exit_attribution.reason = to_string(missing_role) + "_filled";
    close_with_attributed_exit(position, exit_attribution);
}

// ========================================================================
// STATUS CHECK
// ========================================================================

bool TradingEngine::check_exit_order_statuses(const Position& position) {
    std::optional<OrderStatusReport> take_profit_report;
    std::optional<OrderStatusReport> stop_loss_report;

    // Fetch both before acting on either
    if (position.take_profit_order_id) {
        take_profit_report = gateway.get_order_status(position.pair, *position.take_profit_order_id);
    }
    if (position.stop_loss_order_id) {
        stop_loss_report = gateway.get_order_status(position.pair, *position.stop_loss_order_id);
    }

    bool take_profit_filled = take_profit_report && take_profit_report->status == OrderStatus::FILLED;
    bool stop_loss_filled = stop_loss_report && stop_loss_report->status == OrderStatus::FILLED;

    if (take_profit_filled && stop_loss_filled) {
        force_close_position(position.position_id, "both_orders_filled");
        return true;
    }

    if (take_profit_filled || stop_loss_filled) {
        const OrderStatusReport& filled_report = take_profit_filled ? *take_profit_report : *stop_loss_report;
        ExitAttribution exit_attribution;
        exit_attribution.exit_role = take_profit_filled ? OrderRole::TAKE_PROFIT : OrderRole::STOP_LOSS;
        exit_attribution.exit_price = take_profit_filled ? position.take_profit_price : position.stop_loss_price;
        if (filled_report.average_price && *filled_report.average_price > 0) {
            exit_attribution.exit_price = *filled_report.average_price;
        }
        exit_attribution.reason = to_string(exit_attribution.exit_role) + "_filled";
        close_with_attributed_exit(position, exit_attribution);
        return true;
    }
    return false;
}

// ========================================================================
// MANUAL TAKE PROFIT (stop_loss_only protection)
// ========================================================================

void TradingEngine::check_manual_take_profit(const Position& position) {
    OrderBook order_book = gateway.get_order_book(position.pair);
    if (!order_book.has_best_bid() || order_book.best_bid() < position.take_profit_price) {
        return;
    }
    Decimal exit_bid = order_book.best_bid();

    if (!mark_position_closing(position.position_id)) {
        return;
    }

    if (position.stop_loss_order_id &&
        !cancel_order_safely(position.pair, *position.stop_loss_order_id, "manual take profit at " + DecimalUtils::format_decimal(exit_bid))) {
        // Stop-loss may still be live; selling now could sell twice
        unmark_position_closing(position.position_id);
        return;
    }

    if (sell_position_quantity(position.pair, position.quantity, "manual_take_profit")) {
        Decimal realized_pnl = (exit_bid - position.entry_price) * position.quantity;
        complete_position_close(position, "take_profit_manual", exit_bid, realized_pnl, false);
        return;
    }

    restore_stop_loss(position);
}

void TradingEngine::restore_stop_loss(const Position& position) {
    Position restored_position = position;
    restored_position.stop_loss_order_id.reset();
    try {
        StopLimitOrderRequest stop_loss_request;
        stop_loss_request.pair = position.pair;
        stop_loss_request.side = OrderSide::SELL;
        stop_loss_request.quantity = position.quantity;
        stop_loss_request.stop_price = position.stop_loss_price;
        stop_loss_request.limit_price = position.stop_loss_price;
        std::string stop_loss_order_id = gateway.place_stop_limit_order(stop_loss_request);
        restored_position.stop_loss_order_id = stop_loss_order_id;
        TradingLogs::log_order_placed(position.pair, OrderRole::STOP_LOSS, "STOP_LIMIT", stop_loss_order_id,
                                      position.quantity, position.stop_loss_price);
        record_order(stop_loss_order_id, position.pair, OrderSide::SELL, position.quantity,
                     position.stop_loss_price, OrderRole::STOP_LOSS);
    } catch (const API::ExchangeError& placement_exception_error) {
        TradingLogs::log_manual_intervention_required(position.pair, position.quantity,
                                                      "manual take profit sell failed and stop loss could not be restored: " +
                                                      std::string(placement_exception_error.what()));
    }

    {
        std::lock_guard<std::mutex> state_lock(engine_state_mutex);
        std::map<std::string, Position>::iterator position_iterator = open_positions.find(position.position_id);
        if (position_iterator != open_positions.end()) {
            position_iterator->second = restored_position;
        }
        closing_position_ids.erase(position.position_id);
    }
    try {
        position_store.save_position(restored_position);
    } catch (const PersistenceError& persistence_exception_error) {
        PersistenceLogs::log_store_failure("PositionStore", persistence_exception_error.what());
    }
}

// ========================================================================
// CLOSING
// ========================================================================

void TradingEngine::close_with_attributed_exit(const Position& position, const ExitAttribution& exit_attribution) {
    if (!mark_position_closing(position.position_id)) {
        return;
    }

    bool take_profit_exit = exit_attribution.exit_role == OrderRole::TAKE_PROFIT;
    const std::optional<std::string>& filled_order_id = take_profit_exit ? position.take_profit_order_id : position.stop_loss_order_id;
    const std::optional<std::string>& remaining_order_id = take_profit_exit ? position.stop_loss_order_id : position.take_profit_order_id;

    if (remaining_order_id) {
        cancel_order_safely(position.pair, *remaining_order_id, exit_attribution.reason);
    }
    if (filled_order_id) {
        order_store.update_order_status(*filled_order_id, OrderRecordStatus::FILLED);
    }

    Decimal realized_pnl = (exit_attribution.exit_price - position.entry_price) * position.quantity;
    complete_position_close(position, exit_attribution.reason, exit_attribution.exit_price, realized_pnl, false);
}

bool TradingEngine::force_close_position(const std::string& position_id, const std::string& reason) {
    Position position;
    {
        std::lock_guard<std::mutex> state_lock(engine_state_mutex);
        std::map<std::string, Position>::const_iterator position_iterator = open_positions.find(position_id);
        if (position_iterator == open_positions.end() || closing_position_ids.count(position_id) > 0) {
            return false;
        }
        closing_position_ids.insert(position_id);
        position = position_iterator->second;
    }

    TradingLogs::log_force_close(position, reason);
    cancel_protective_orders(position, "force close: " + reason);

    if (!sell_position_quantity(position.pair, position.quantity, reason)) {
        TradingLogs::log_manual_intervention_required(position.pair, position.quantity,
                                                      "force close (" + reason + ") could not sell position " + position_id);
    }

    Decimal last_known_price = position.entry_price;
    complete_position_close(position, reason, last_known_price, std::nullopt, true);
    return true;
}

bool TradingEngine::mark_position_closing(const std::string& position_id) {
    std::lock_guard<std::mutex> state_lock(engine_state_mutex);
    if (open_positions.count(position_id) == 0 || closing_position_ids.count(position_id) > 0) {
        return false;
    }
    closing_position_ids.insert(position_id);
    return true;
}

void TradingEngine::unmark_position_closing(const std::string& position_id) {
    std::lock_guard<std::mutex> state_lock(engine_state_mutex);
    closing_position_ids.erase(position_id);
}

void TradingEngine::complete_position_close(const Position& position, const std::string& reason, const Decimal& exit_price,
                                            const std::optional<Decimal>& realized_pnl, bool forced) {
    {
        std::lock_guard<std::mutex> state_lock(engine_state_mutex);
        open_positions.erase(position.position_id);
        closing_position_ids.erase(position.position_id);

        roll_daily_counters_unlocked(clock.now());
        if (forced) {
            daily_counters.forced_closes_today++;
        }
        if (realized_pnl) {
            daily_counters.daily_pnl += *realized_pnl;
            if (*realized_pnl > 0) {
                daily_counters.wins_today++;
            } else {
                daily_counters.losses_today++;
            }
        }
    }

    delete_persisted_position(position.position_id);
    TradingLogs::log_position_closed(position, reason, exit_price, realized_pnl ? *realized_pnl : Decimal(0));
}

void TradingEngine::delete_persisted_position(const std::string& position_id) {
    try {
        position_store.delete_position(position_id);
    } catch (const PersistenceError& persistence_exception_error) {
        PersistenceLogs::log_store_failure("PositionStore", persistence_exception_error.what());
    }
}

} // namespace Core
} // namespace ValrTrader
