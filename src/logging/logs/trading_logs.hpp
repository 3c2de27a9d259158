#ifndef TRADING_LOGS_HPP
#define TRADING_LOGS_HPP

#include <string>
#include "trader/data_structures/data_structures.hpp"

namespace ValrTrader {
namespace Logging {

/**
 * Order, position and daily statistics logging for the trading engine.
 */
class TradingLogs {
public:
    // Signals and trade setup
    static void log_signal_scan(const std::string& pair, const ValrTrader::Core::SignalDecision& decision, bool indicator_ready);
    static void log_trade_setup_start(const std::string& pair, const ValrTrader::Core::SignalDecision& signal);
    static void log_trade_setup_rejected(const std::string& pair, const ValrTrader::Core::TradeSetupRejection& rejection);

    // Order events
    static void log_order_placed(const std::string& pair, ValrTrader::Core::OrderRole role, const std::string& order_type,
                                 const std::string& order_id, const ValrTrader::Core::Decimal& quantity,
                                 const ValrTrader::Core::Decimal& price);
    static void log_order_cancelled(const std::string& pair, const std::string& order_id, const std::string& reason);
    static void log_order_cancel_failed(const std::string& pair, const std::string& order_id, const std::string& error_message);
    static void log_order_status_error(const std::string& order_id, const std::string& error_message);
    static void log_fill_outcome(const std::string& pair, const std::string& order_id, const ValrTrader::Core::FillOutcome& outcome);
    static void log_fill_quantity_fallback(const std::string& order_id, const std::string& source,
                                           const ValrTrader::Core::Decimal& quantity);

    // Protection and liquidation
    static void log_protection_failure(const std::string& pair, const std::string& error_message);
    static void log_liquidation_attempt(const std::string& pair, const std::string& method, bool success,
                                        const ValrTrader::Core::Decimal& quantity, const std::string& detail);
    static void log_manual_intervention_required(const std::string& pair, const ValrTrader::Core::Decimal& quantity,
                                                 const std::string& detail);

    // Position transitions
    static void log_position_opened(const ValrTrader::Core::Position& position);
    static void log_position_closed(const ValrTrader::Core::Position& position, const std::string& reason,
                                    const ValrTrader::Core::Decimal& exit_price, const ValrTrader::Core::Decimal& pnl);
    static void log_force_close(const ValrTrader::Core::Position& position, const std::string& reason);
    static void log_position_recovered(const ValrTrader::Core::Position& position);
    static void log_recovery_unmatched(const std::string& pair, const std::string& detail);
    static void log_recovery_summary(size_t loaded_count, size_t reconstructed_count);
    static void log_monitor_error(const std::string& position_id, const std::string& error_message);

    // Daily statistics
    static void log_daily_statistics(const ValrTrader::Core::DailyCounters& counters, size_t open_position_count, int max_daily_trades);
    static void log_daily_counters_reset(const ValrTrader::Core::DailyCounters& previous_counters);
};

} // namespace Logging
} // namespace ValrTrader

#endif // TRADING_LOGS_HPP
