#ifndef TRADING_ENGINE_HPP
#define TRADING_ENGINE_HPP

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "trading_engine_structures.hpp"
#include "fill_waiter.hpp"
#include "entry_pricing_strategy.hpp"
#include "trader/data_structures/data_structures.hpp"
#include "trader/data_structures/trading_errors.hpp"

namespace ValrTrader {
namespace Core {

/**
 * @brief Owns the entry -> fill -> protect -> exit lifecycle of every position.
 *
 * Trade setup and the monitor cycle may run on different threads; open positions,
 * the closing set and the daily counters are guarded by one mutex. Exchange calls
 * are made without holding it.
 */
class TradingEngine {
public:
    explicit TradingEngine(const TradingEngineConstructionParams& construction_params);

    // Never throws for exchange failures; every reason for not trading is a rejection.
    TradeSetupResult execute_trade_setup(const std::string& pair, const SignalDecision& signal);

    // One pass over every open position: timeouts, existence check, status check.
    void monitor_positions();

    // Cancel protection, sell the quantity, drop the position. False if it was not open.
    bool force_close_position(const std::string& position_id, const std::string& reason);

    // Loads persisted state, or rebuilds positions from exchange orders. Returns open position count.
    size_t startup_recovery();

    size_t cleanup_stale_orders();
    void persist_state();

    std::vector<Position> get_open_positions() const;
    std::optional<Position> get_position(const std::string& position_id) const;
    DailyCounters get_daily_counters() const;

private:
    // ========================================================================
    // TRADE SETUP
    // ========================================================================

    TradeSetupRejection make_rejection(const std::string& pair, TradeSetupFailure reason, const std::string& detail) const;
    Decimal required_quote_balance() const;
    std::string place_entry_order(const std::string& pair, const EntryOrderPlan& entry_plan, const Decimal& quantity);
    FillOutcome confirm_entry_fill(const std::string& pair, const std::string& entry_order_id,
                                   const Decimal& quantity, const Decimal& expected_price);
    Position build_position(const std::string& pair, const std::string& entry_order_id, const Decimal& filled_quantity,
                            const Decimal& entry_price, const Config::PairSettings& pair_settings) const;
    void place_protective_orders(Position& position);
    void handle_protection_failure(const Position& position, const std::string& error_message);
    void register_open_position(const Position& position);

    // ========================================================================
    // SHARED ORDER HELPERS
    // ========================================================================

    void record_order(const std::string& order_id, const std::string& pair, OrderSide side,
                      const Decimal& quantity, const Decimal& price, OrderRole role);
    bool cancel_order_safely(const std::string& pair, const std::string& order_id, const std::string& reason);
    void cancel_protective_orders(const Position& position, const std::string& reason);
    // Market sell, then an aggressive limit at the best bid. False if both fail.
    bool sell_position_quantity(const std::string& pair, const Decimal& quantity, const std::string& reason);

    // ========================================================================
    // POSITION MONITOR (position_monitor.cpp)
    // ========================================================================

    void monitor_single_position(const Position& position, const std::optional<std::vector<OpenOrder>>& open_orders);
    bool check_hard_timeouts(const Position& position, TimePoint current_time);
    bool check_exit_order_existence(const Position& position, const std::vector<OpenOrder>& open_orders);
    bool check_exit_order_statuses(const Position& position);
    void check_manual_take_profit(const Position& position);
    void handle_missing_exit_order(const Position& position, OrderRole missing_role);
    void close_with_attributed_exit(const Position& position, const ExitAttribution& exit_attribution);
    void restore_stop_loss(const Position& position);

    bool mark_position_closing(const std::string& position_id);
    void unmark_position_closing(const std::string& position_id);
    void complete_position_close(const Position& position, const std::string& reason, const Decimal& exit_price,
                                 const std::optional<Decimal>& realized_pnl, bool forced);
    void delete_persisted_position(const std::string& position_id);

    // ========================================================================
    // COUNTERS
    // ========================================================================

    void roll_daily_counters_unlocked(TimePoint current_time);
    bool has_open_position_for_pair_unlocked(const std::string& pair) const;

    const Config::SystemConfig& config;
    API::ExchangeGatewayInterface& gateway;
    OrderStore& order_store;
    PositionStore& position_store;
    const ClockInterface& clock;
    const std::atomic<bool>& shutdown_requested;
    FillWaiter fill_waiter;
    std::unique_ptr<EntryPricingStrategy> entry_pricing_strategy;

    mutable std::mutex engine_state_mutex;
    std::map<std::string, Position> open_positions;
    std::set<std::string> closing_position_ids;
    DailyCounters daily_counters;
};

} // namespace Core
} // namespace ValrTrader

#endif // TRADING_ENGINE_HPP
