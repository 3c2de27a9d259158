#include "trading_logs.hpp"
#include "logging/logger/logging_macros.hpp"
#include "utils/time_utils.hpp"
#include <sstream>

using DecimalUtils::format_decimal;

namespace ValrTrader {
namespace Logging {

void TradingLogs::log_signal_scan(const std::string& pair, const ValrTrader::Core::SignalDecision& decision, bool indicator_ready) {
    if (!indicator_ready) {
        log_message("SCAN: " + pair + " collecting price history", "");
        return;
    }
    std::ostringstream oss;
    oss << "SCAN: " << pair << " RSI=" << format_decimal(DecimalUtils::round_down(decision.indicator_value, 2))
        << " -> " << (decision.should_buy ? "BUY_SIGNAL" : "NO_SIGNAL");
    if (decision.should_buy) {
        oss << " (confidence " << format_decimal(DecimalUtils::round_down(decision.confidence, 4)) << ")";
    }
    log_message(oss.str(), "");
}

void TradingLogs::log_trade_setup_start(const std::string& pair, const ValrTrader::Core::SignalDecision& signal) {
    LOG_THREAD_ORDER_EXECUTION_HEADER();
    TABLE_ROW("Pair", pair);
    TABLE_ROW("Signal value", format_decimal(DecimalUtils::round_down(signal.indicator_value, 2)));
    TABLE_ROW("Confidence", format_decimal(DecimalUtils::round_down(signal.confidence, 4)));
}

void TradingLogs::log_trade_setup_rejected(const std::string& pair, const ValrTrader::Core::TradeSetupRejection& rejection) {
    log_message("NO_TRADE: " + pair + " " + ValrTrader::Core::to_string(rejection.reason) +
                (rejection.detail.empty() ? "" : " (" + rejection.detail + ")"), "");
}

void TradingLogs::log_order_placed(const std::string& pair, ValrTrader::Core::OrderRole role, const std::string& order_type,
                                   const std::string& order_id, const ValrTrader::Core::Decimal& quantity,
                                   const ValrTrader::Core::Decimal& price) {
    std::ostringstream oss;
    oss << "ORDER_PLACED: " << pair << " " << ValrTrader::Core::to_string(role) << " " << order_type
        << " id=" << order_id << " qty=" << format_decimal(quantity) << " price=" << format_decimal(price);
    log_message(oss.str(), "");
}

void TradingLogs::log_order_cancelled(const std::string& pair, const std::string& order_id, const std::string& reason) {
    log_message("ORDER_CANCELLED: " + pair + " id=" + order_id + " (" + reason + ")", "");
}

void TradingLogs::log_order_cancel_failed(const std::string& pair, const std::string& order_id, const std::string& error_message) {
    log_message("WARNING: Cancel failed for " + pair + " order " + order_id + ": " + error_message, "");
}

void TradingLogs::log_order_status_error(const std::string& order_id, const std::string& error_message) {
    log_message("WARNING: Status check failed for order " + order_id + ": " + error_message, "");
}

void TradingLogs::log_fill_outcome(const std::string& pair, const std::string& order_id, const ValrTrader::Core::FillOutcome& outcome) {
    std::ostringstream oss;
    oss << "FILL_WAIT: " << pair << " id=" << order_id << " -> " << ValrTrader::Core::to_string(outcome.state)
        << " filled=" << format_decimal(outcome.filled_quantity)
        << " avg_price=" << format_decimal(outcome.average_price);
    log_message(oss.str(), "");
}

void TradingLogs::log_fill_quantity_fallback(const std::string& order_id, const std::string& source,
                                             const ValrTrader::Core::Decimal& quantity) {
    log_message("WARNING: Order " + order_id + " reported filled without quantity, using " + source +
                " quantity " + format_decimal(quantity), "");
}

void TradingLogs::log_protection_failure(const std::string& pair, const std::string& error_message) {
    log_message("ERROR: Protective order placement failed for " + pair + ", liquidating: " + error_message, "");
}

void TradingLogs::log_liquidation_attempt(const std::string& pair, const std::string& method, bool success,
                                          const ValrTrader::Core::Decimal& quantity, const std::string& detail) {
    std::ostringstream oss;
    oss << (success ? "LIQUIDATION: " : "ERROR: Liquidation failed: ") << pair << " " << method
        << " sell qty=" << format_decimal(quantity);
    if (!detail.empty()) {
        oss << " (" << detail << ")";
    }
    log_message(oss.str(), "");
}

void TradingLogs::log_manual_intervention_required(const std::string& pair, const ValrTrader::Core::Decimal& quantity,
                                                   const std::string& detail) {
    log_message("CRITICAL: MANUAL INTERVENTION REQUIRED - unprotected " + format_decimal(quantity) + " " + pair +
                " could not be liquidated: " + detail, "");
}

void TradingLogs::log_position_opened(const ValrTrader::Core::Position& position) {
    LOG_THREAD_POSITION_HEADER();
    TABLE_ROW("Position", position.position_id);
    TABLE_ROW("Quantity", format_decimal(position.quantity));
    TABLE_ROW("Entry price", format_decimal(position.entry_price));
    TABLE_ROW("Take profit", format_decimal(position.take_profit_price) +
              (position.take_profit_order_id ? " (order " + *position.take_profit_order_id + ")" : " (monitored)"));
    TABLE_ROW("Stop loss", format_decimal(position.stop_loss_price) +
              (position.stop_loss_order_id ? " (order " + *position.stop_loss_order_id + ")" : ""));
    TABLE_ROW("Filled at", TimeUtils::format_iso8601(position.entry_filled_at));
    LOG_THREAD_SECTION_FOOTER();
}

void TradingLogs::log_position_closed(const ValrTrader::Core::Position& position, const std::string& reason,
                                      const ValrTrader::Core::Decimal& exit_price, const ValrTrader::Core::Decimal& pnl) {
    std::ostringstream oss;
    oss << "POSITION_CLOSED: " << position.position_id << " " << reason
        << " entry=" << format_decimal(position.entry_price)
        << " exit=" << format_decimal(exit_price)
        << " qty=" << format_decimal(position.quantity)
        << " pnl=" << format_decimal(pnl);
    log_message(oss.str(), "");
}

void TradingLogs::log_force_close(const ValrTrader::Core::Position& position, const std::string& reason) {
    log_message("FORCE_CLOSE: " + position.position_id + " " + position.pair + " qty=" + format_decimal(position.quantity) +
                " reason=" + reason, "");
}

void TradingLogs::log_position_recovered(const ValrTrader::Core::Position& position) {
    std::ostringstream oss;
    oss << "RECOVERED: " << position.position_id << " qty=" << format_decimal(position.quantity)
        << " entry~" << format_decimal(position.entry_price)
        << " tp=" << format_decimal(position.take_profit_price)
        << " sl=" << format_decimal(position.stop_loss_price);
    log_message(oss.str(), "");
}

void TradingLogs::log_recovery_unmatched(const std::string& pair, const std::string& detail) {
    log_message("WARNING: Recovery could not match " + pair + ": " + detail, "");
}

void TradingLogs::log_recovery_summary(size_t loaded_count, size_t reconstructed_count) {
    LOG_THREAD_RECOVERY_HEADER();
    TABLE_ROW("Loaded from store", std::to_string(loaded_count));
    TABLE_ROW("Rebuilt from orders", std::to_string(reconstructed_count));
    LOG_THREAD_SECTION_FOOTER();
}

void TradingLogs::log_monitor_error(const std::string& position_id, const std::string& error_message) {
    log_message("ERROR: Monitoring " + position_id + " failed: " + error_message, "");
}

void TradingLogs::log_daily_statistics(const ValrTrader::Core::DailyCounters& counters, size_t open_position_count, int max_daily_trades) {
    LOG_THREAD_DAILY_STATISTICS_HEADER();
    TABLE_ROW("Date (UTC)", counters.date);
    TABLE_ROW("Trades", std::to_string(counters.trades_today) + "/" + std::to_string(max_daily_trades));
    TABLE_ROW("Wins / losses", std::to_string(counters.wins_today) + " / " + std::to_string(counters.losses_today));
    TABLE_ROW("Failed / forced", std::to_string(counters.failed_trades_today) + " / " + std::to_string(counters.forced_closes_today));
    TABLE_ROW("Daily PnL", format_decimal(counters.daily_pnl));
    TABLE_ROW("Open positions", std::to_string(open_position_count));
    LOG_THREAD_SECTION_FOOTER();
}

void TradingLogs::log_daily_counters_reset(const ValrTrader::Core::DailyCounters& previous_counters) {
    log_message("DAILY_RESET: Closing " + previous_counters.date + " with " + std::to_string(previous_counters.trades_today) +
                " trades, pnl " + format_decimal(previous_counters.daily_pnl), "");
}

} // namespace Logging
} // namespace ValrTrader
