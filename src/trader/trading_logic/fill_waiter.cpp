#include "fill_waiter.hpp"
#include "api/general/api_errors.hpp"
#include "logging/logs/trading_logs.hpp"
#include <algorithm>

using ValrTrader::Logging::TradingLogs;

namespace ValrTrader {
namespace Core {

namespace {
    constexpr int FILL_PRICE_DECIMALS = 12;
}

FillPollSchedule FillPollSchedule::from_timing_config(const Config::TimingConfig& timing_config) {
    FillPollSchedule poll_schedule;
    poll_schedule.fast_interval = std::chrono::milliseconds(timing_config.fill_poll_fast_interval_milliseconds);
    poll_schedule.fast_window = std::chrono::seconds(timing_config.fill_poll_fast_window_seconds);
    poll_schedule.medium_interval = std::chrono::milliseconds(timing_config.fill_poll_medium_interval_milliseconds);
    poll_schedule.medium_window = std::chrono::seconds(timing_config.fill_poll_medium_window_seconds);
    poll_schedule.slow_interval = std::chrono::milliseconds(timing_config.fill_poll_slow_interval_milliseconds);
    return poll_schedule;
}

FillWaiter::FillWaiter(API::ExchangeGatewayInterface& gateway_ref, const ClockInterface& clock_ref,
                       const std::atomic<bool>& shutdown_flag, FillPollSchedule poll_schedule)
    : gateway(gateway_ref), clock(clock_ref), shutdown_requested(shutdown_flag), schedule(poll_schedule) {}

std::chrono::milliseconds FillWaiter::poll_interval_for(std::chrono::milliseconds elapsed) const {
    if (elapsed < schedule.fast_window) {
        return schedule.fast_interval;
    }
    if (elapsed < schedule.medium_window) {
        return schedule.medium_interval;
    }
    return schedule.slow_interval;
}

FillOutcome FillWaiter::wait_for_fill(const std::string& pair, const std::string& order_id, const Decimal& submitted_quantity,
                                      const Decimal& fallback_price, std::chrono::milliseconds timeout) {
    TimePoint wait_start = clock.now();
    TimePoint wait_deadline = wait_start + timeout;
    std::optional<OrderStatusReport> last_partial_report;

    while (true) {
        if (shutdown_requested.load()) {
            FillOutcome shutdown_outcome;
            shutdown_outcome.state = FillState::SHUTDOWN;
            if (last_partial_report && last_partial_report->filled_quantity) {
                shutdown_outcome.filled_quantity = *last_partial_report->filled_quantity;
            }
            TradingLogs::log_fill_outcome(pair, order_id, shutdown_outcome);
            return shutdown_outcome;
        }

        try {
            OrderStatusReport status_report = gateway.get_order_status(pair, order_id);
            bool has_filled_quantity = status_report.filled_quantity && *status_report.filled_quantity > 0;

            if (status_report.status == OrderStatus::FILLED) {
                FillOutcome filled_outcome = resolve_filled_outcome(pair, status_report, FillState::FILLED,
                                                                    submitted_quantity, fallback_price);
                TradingLogs::log_fill_outcome(pair, order_id, filled_outcome);
                return filled_outcome;
            }
            if (status_report.status == OrderStatus::CANCELLED) {
                FillOutcome cancelled_outcome;
                cancelled_outcome.state = FillState::CANCELLED;
                if (has_filled_quantity) {
                    cancelled_outcome = resolve_filled_outcome(pair, status_report, FillState::PARTIALLY_FILLED,
                                                               submitted_quantity, fallback_price);
                }
                TradingLogs::log_fill_outcome(pair, order_id, cancelled_outcome);
                return cancelled_outcome;
            }
            if (status_report.status == OrderStatus::PARTIALLY_FILLED && has_filled_quantity) {
                last_partial_report = status_report;
            }
        } catch (const API::ExchangeError& status_exception_error) {
            TradingLogs::log_order_status_error(order_id, status_exception_error.what());
        }

        TimePoint current_time = clock.now();
        if (current_time >= wait_deadline) {
            break;
        }
        std::chrono::milliseconds elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(current_time - wait_start);
        std::chrono::milliseconds remaining = std::chrono::duration_cast<std::chrono::milliseconds>(wait_deadline - current_time);
        std::chrono::milliseconds sleep_duration = std::min(poll_interval_for(elapsed), remaining);
        if (sleep_duration.count() <= 0) {
            break;
        }
        clock.sleep_for(sleep_duration);
    }

    if (last_partial_report) {
        cancel_remainder(pair, order_id);
        FillState final_state = FillState::PARTIALLY_FILLED;
        OrderStatusReport final_report = refresh_after_cancel(pair, order_id, *last_partial_report, final_state);
        FillOutcome partial_outcome = resolve_filled_outcome(pair, final_report, final_state,
                                                             submitted_quantity, fallback_price);
        TradingLogs::log_fill_outcome(pair, order_id, partial_outcome);
        return partial_outcome;
    }

    FillOutcome timeout_outcome;
    timeout_outcome.state = FillState::TIMEOUT;
    TradingLogs::log_fill_outcome(pair, order_id, timeout_outcome);
    return timeout_outcome;
}

FillOutcome FillWaiter::resolve_filled_outcome(const std::string& pair, const OrderStatusReport& status_report,
                                               FillState fill_state, const Decimal& submitted_quantity,
                                               const Decimal& fallback_price) {
    FillOutcome resolved_outcome;
    resolved_outcome.state = fill_state;

    bool reported_quantity_usable = status_report.filled_quantity && *status_report.filled_quantity > 0;
    bool reported_price_usable = status_report.average_price && *status_report.average_price > 0;

    std::vector<OrderFill> order_fills;
    if (!reported_quantity_usable || !reported_price_usable) {
        order_fills = fetch_fills(pair, status_report.order_id);
    }
    Decimal fills_quantity{0};
    Decimal fills_notional{0};
    for (const OrderFill& order_fill : order_fills) {
        fills_quantity += order_fill.quantity;
        fills_notional += order_fill.quantity * order_fill.price;
    }

    if (reported_quantity_usable) {
        resolved_outcome.filled_quantity = *status_report.filled_quantity;
    } else if (fills_quantity > 0) {
        resolved_outcome.filled_quantity = fills_quantity;
        TradingLogs::log_fill_quantity_fallback(status_report.order_id, "fills", fills_quantity);
    } else {
        resolved_outcome.filled_quantity = submitted_quantity;
        TradingLogs::log_fill_quantity_fallback(status_report.order_id, "submitted quantity", submitted_quantity);
    }

    if (reported_price_usable) {
        resolved_outcome.average_price = *status_report.average_price;
    } else if (fills_quantity > 0) {
        resolved_outcome.average_price = DecimalUtils::divide_round_down(fills_notional, fills_quantity, FILL_PRICE_DECIMALS);
    } else {
        resolved_outcome.average_price = fallback_price;
    }
    return resolved_outcome;
}

std::vector<OrderFill> FillWaiter::fetch_fills(const std::string& pair, const std::string& order_id) {
    try {
        return gateway.get_order_fills(pair, order_id);
    } catch (const API::ExchangeError& fills_exception_error) {
        TradingLogs::log_order_status_error(order_id, std::string("fills unavailable: ") + fills_exception_error.what());
    }
    return {};
}

OrderStatusReport FillWaiter::refresh_after_cancel(const std::string& pair, const std::string& order_id,
                                                  const OrderStatusReport& last_partial_report, FillState& final_state) {
    // Quantity may have executed between the last poll and the cancel
    try {
        OrderStatusReport post_cancel_report = gateway.get_order_status(pair, order_id);
        if (post_cancel_report.status == OrderStatus::FILLED) {
            final_state = FillState::FILLED;
            return post_cancel_report;
        }
        if (post_cancel_report.filled_quantity && *post_cancel_report.filled_quantity > *last_partial_report.filled_quantity) {
            if (!post_cancel_report.average_price && last_partial_report.average_price) {
                post_cancel_report.average_price = last_partial_report.average_price;
            }
            return post_cancel_report;
        }
    } catch (const API::ExchangeError& status_exception_error) {
        TradingLogs::log_order_status_error(order_id, std::string("post-cancel check failed: ") + status_exception_error.what());
    }
    return last_partial_report;
}

void FillWaiter::cancel_remainder(const std::string& pair, const std::string& order_id) {
    try {
        gateway.cancel_order(pair, order_id);
        TradingLogs::log_order_cancelled(pair, order_id, "partial fill remainder at timeout");
    } catch (const API::ExchangeError& cancel_exception_error) {
        TradingLogs::log_order_cancel_failed(pair, order_id, cancel_exception_error.what());
    }
}

} // namespace Core
} // namespace ValrTrader
