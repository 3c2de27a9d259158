#include "test_support/engine_test_fixture.hpp"

using ValrTrader::Core::DailyCounters;
using ValrTrader::Core::Decimal;
using ValrTrader::Core::OrderStatus;
using ValrTrader::Core::Position;
using ValrTrader::Testing::make_status_report;

class PositionMonitorTest : public ValrTrader::Testing::EngineTestBase {
protected:
    void SetUp() override {
        EngineTestBase::SetUp();
        create_engine();
    }

    void keep_exits_open() {
        exchange.set_open_orders({open_sell("ORD-2", "0.00007692", "1319500"), open_sell("ORD-3", "0.00007692", "1274000")});
    }
};

TEST_F(PositionMonitorTest, resting_exits_leave_position_untouched) {
    Position position = open_dual_protected_position();
    keep_exits_open();

    trading_engine->monitor_positions();
    EXPECT_TRUE(trading_engine->get_position(position.position_id).has_value());
    EXPECT_TRUE(exchange.cancelled_order_ids.empty());
    EXPECT_TRUE(exchange.market_orders.empty());
    EXPECT_EQ(exchange.open_orders_calls, 1);
}

TEST_F(PositionMonitorTest, filled_take_profit_closes_with_profit) {
    Position position = open_dual_protected_position();
    exchange.set_open_orders({open_sell("ORD-3", "0.00007692", "1274000")});
    exchange.script_status("ORD-2", {make_status_report(OrderStatus::FILLED, "0.00007692", "1319500")});

    trading_engine->monitor_positions();

    EXPECT_FALSE(trading_engine->get_position(position.position_id).has_value());
    EXPECT_TRUE(exchange.was_cancelled("ORD-3"));
    EXPECT_TRUE(exchange.market_orders.empty());
    DailyCounters daily_counters = trading_engine->get_daily_counters();
    EXPECT_EQ(daily_counters.wins_today, 1);
    EXPECT_EQ(daily_counters.losses_today, 0);
    EXPECT_EQ(daily_counters.daily_pnl, Decimal("1.49994"));
    EXPECT_TRUE(position_store->load_positions().empty());
    EXPECT_TRUE(order_store->get_active_orders().empty());
}

TEST_F(PositionMonitorTest, filled_stop_loss_found_by_status_counts_a_loss) {
    Position position = open_dual_protected_position();
    exchange.fail_open_orders = true;
    exchange.script_status("ORD-3", {make_status_report(OrderStatus::FILLED, "0.00007692")});

    trading_engine->monitor_positions();

    EXPECT_FALSE(trading_engine->get_position(position.position_id).has_value());
    EXPECT_TRUE(exchange.was_cancelled("ORD-2"));
    DailyCounters daily_counters = trading_engine->get_daily_counters();
    EXPECT_EQ(daily_counters.losses_today, 1);
    EXPECT_EQ(daily_counters.wins_today, 0);
    EXPECT_EQ(daily_counters.daily_pnl, Decimal("-1.99992"));
}

TEST_F(PositionMonitorTest, both_exits_filled_forces_close_without_pnl) {
    Position position = open_dual_protected_position();
    exchange.fail_open_orders = true;
    exchange.script_status("ORD-2", {make_status_report(OrderStatus::FILLED, "0.00007692", "1319500")});
    exchange.script_status("ORD-3", {make_status_report(OrderStatus::FILLED, "0.00007692", "1274000")});

    trading_engine->monitor_positions();

    EXPECT_FALSE(trading_engine->get_position(position.position_id).has_value());
    EXPECT_EQ(exchange.market_orders.size(), 1u);
    DailyCounters daily_counters = trading_engine->get_daily_counters();
    EXPECT_EQ(daily_counters.forced_closes_today, 1);
    EXPECT_EQ(daily_counters.wins_today, 0);
    EXPECT_EQ(daily_counters.losses_today, 0);
    EXPECT_EQ(daily_counters.daily_pnl, Decimal(0));
}

TEST_F(PositionMonitorTest, both_exits_missing_forces_close) {
    Position position = open_dual_protected_position();
    exchange.set_open_orders({});

    trading_engine->monitor_positions();

    EXPECT_FALSE(trading_engine->get_position(position.position_id).has_value());
    EXPECT_TRUE(exchange.was_cancelled("ORD-2"));
    EXPECT_TRUE(exchange.was_cancelled("ORD-3"));
    ASSERT_EQ(exchange.market_orders.size(), 1u);
    EXPECT_EQ(*exchange.market_orders[0].request.base_quantity, Decimal("0.00007692"));
    EXPECT_EQ(trading_engine->get_daily_counters().forced_closes_today, 1);
}

TEST_F(PositionMonitorTest, cancelled_exit_without_fill_forces_close) {
    Position position = open_dual_protected_position();
    exchange.set_open_orders({open_sell("ORD-3", "0.00007692", "1274000")});
    exchange.script_status("ORD-2", {make_status_report(OrderStatus::CANCELLED)});

    trading_engine->monitor_positions();

    EXPECT_FALSE(trading_engine->get_position(position.position_id).has_value());
    EXPECT_EQ(exchange.market_orders.size(), 1u);
    EXPECT_EQ(trading_engine->get_daily_counters().forced_closes_today, 1);
    EXPECT_EQ(trading_engine->get_daily_counters().wins_today, 0);
}

TEST_F(PositionMonitorTest, exit_order_timeout_forces_close) {
    Position position = open_dual_protected_position();
    keep_exits_open();

    clock.advance(std::chrono::minutes(45));
    trading_engine->monitor_positions();
    EXPECT_TRUE(trading_engine->get_position(position.position_id).has_value());

    clock.advance(std::chrono::seconds(1));
    trading_engine->monitor_positions();
    EXPECT_FALSE(trading_engine->get_position(position.position_id).has_value());
    EXPECT_EQ(exchange.market_orders.size(), 1u);
    EXPECT_EQ(trading_engine->get_daily_counters().forced_closes_today, 1);
}

TEST_F(PositionMonitorTest, position_timeout_forces_close_before_exit_deadline) {
    config.timing.position_timeout_minutes = 30;
    config.timing.exit_order_timeout_minutes = 90;
    Position position = open_dual_protected_position();
    keep_exits_open();

    clock.advance(std::chrono::minutes(30));
    trading_engine->monitor_positions();
    EXPECT_TRUE(trading_engine->get_position(position.position_id).has_value());
    EXPECT_TRUE(exchange.market_orders.empty());

    clock.advance(std::chrono::seconds(1));
    trading_engine->monitor_positions();
    EXPECT_FALSE(trading_engine->get_position(position.position_id).has_value());
    ASSERT_EQ(exchange.market_orders.size(), 1u);
    ASSERT_TRUE(exchange.market_orders[0].request.base_quantity.has_value());
    EXPECT_EQ(*exchange.market_orders[0].request.base_quantity, position.quantity);
    EXPECT_TRUE(exchange.was_cancelled("ORD-2"));
    EXPECT_TRUE(exchange.was_cancelled("ORD-3"));
    EXPECT_EQ(trading_engine->get_daily_counters().forced_closes_today, 1);
    EXPECT_TRUE(position_store->load_positions().empty());
}

TEST_F(PositionMonitorTest, force_close_runs_once) {
    Position position = open_dual_protected_position();

    EXPECT_TRUE(trading_engine->force_close_position(position.position_id, "operator"));
    EXPECT_FALSE(trading_engine->force_close_position(position.position_id, "operator"));
    EXPECT_FALSE(trading_engine->force_close_position("unknown", "operator"));
    EXPECT_EQ(exchange.market_orders.size(), 1u);
    EXPECT_EQ(trading_engine->get_daily_counters().forced_closes_today, 1);
    EXPECT_TRUE(position_store->load_positions().empty());
}

TEST_F(PositionMonitorTest, failed_liquidation_still_drops_position) {
    Position position = open_dual_protected_position();
    exchange.fail_market_orders = true;
    exchange.fail_limit_orders = true;

    EXPECT_TRUE(trading_engine->force_close_position(position.position_id, "operator"));
    EXPECT_FALSE(trading_engine->get_position(position.position_id).has_value());
    EXPECT_TRUE(exchange.market_orders.empty());
}

TEST_F(PositionMonitorTest, counters_reset_on_new_utc_day) {
    Position position = open_dual_protected_position();
    trading_engine->force_close_position(position.position_id, "operator");
    DailyCounters first_day = trading_engine->get_daily_counters();
    EXPECT_EQ(first_day.trades_today, 1);

    clock.advance(std::chrono::hours(24));
    trading_engine->monitor_positions();

    DailyCounters second_day = trading_engine->get_daily_counters();
    EXPECT_NE(second_day.date, first_day.date);
    EXPECT_EQ(second_day.trades_today, 0);
    EXPECT_EQ(second_day.forced_closes_today, 0);
}

class StopLossOnlyMonitorTest : public PositionMonitorTest {
protected:
    void SetUp() override {
        EngineTestBase::SetUp();
        config.strategy.protection_mode = ValrTrader::Config::ProtectionMode::STOP_LOSS_ONLY;
        create_engine();
    }

    // Entry ORD-1, stop loss ORD-2.
    Position open_stop_loss_position() {
        Position position = open_dual_protected_position();
        exchange.set_open_orders({open_sell("ORD-2", "0.00007692", "1274000")});
        return position;
    }
};

TEST_F(StopLossOnlyMonitorTest, bid_below_target_keeps_position) {
    Position position = open_stop_loss_position();
    exchange.set_order_book("BTCZAR", Decimal("1319499"), Decimal("1319600"));

    trading_engine->monitor_positions();
    EXPECT_TRUE(trading_engine->get_position(position.position_id).has_value());
    EXPECT_TRUE(exchange.market_orders.empty());
}

TEST_F(StopLossOnlyMonitorTest, bid_at_target_takes_profit_manually) {
    Position position = open_stop_loss_position();
    exchange.set_order_book("BTCZAR", Decimal("1320000"), Decimal("1320100"));

    trading_engine->monitor_positions();

    EXPECT_FALSE(trading_engine->get_position(position.position_id).has_value());
    EXPECT_TRUE(exchange.was_cancelled("ORD-2"));
    ASSERT_EQ(exchange.market_orders.size(), 1u);
    DailyCounters daily_counters = trading_engine->get_daily_counters();
    EXPECT_EQ(daily_counters.wins_today, 1);
    EXPECT_EQ(daily_counters.daily_pnl, Decimal("1.5384"));
}

TEST_F(StopLossOnlyMonitorTest, failed_stop_cancel_aborts_manual_exit) {
    Position position = open_stop_loss_position();
    exchange.set_order_book("BTCZAR", Decimal("1320000"), Decimal("1320100"));
    exchange.fail_cancels = true;

    trading_engine->monitor_positions();

    EXPECT_TRUE(trading_engine->get_position(position.position_id).has_value());
    EXPECT_TRUE(exchange.market_orders.empty());
    EXPECT_EQ(trading_engine->get_daily_counters().wins_today, 0);
}

TEST_F(StopLossOnlyMonitorTest, failed_manual_sell_restores_stop_loss) {
    Position position = open_stop_loss_position();
    exchange.set_order_book("BTCZAR", Decimal("1320000"), Decimal("1320100"));
    exchange.fail_market_orders = true;
    exchange.fail_limit_orders = true;

    trading_engine->monitor_positions();

    std::optional<Position> restored_position = trading_engine->get_position(position.position_id);
    ASSERT_TRUE(restored_position.has_value());
    ASSERT_TRUE(restored_position->stop_loss_order_id.has_value());
    EXPECT_EQ(*restored_position->stop_loss_order_id, "ORD-3");
    EXPECT_EQ(exchange.stop_limit_orders.size(), 2u);
    EXPECT_EQ(*position_store->load_positions().at(position.position_id).stop_loss_order_id, "ORD-3");
}

TEST_F(StopLossOnlyMonitorTest, vanished_stop_loss_forces_close) {
    Position position = open_stop_loss_position();
    exchange.set_open_orders({});

    trading_engine->monitor_positions();

    EXPECT_FALSE(trading_engine->get_position(position.position_id).has_value());
    EXPECT_EQ(exchange.market_orders.size(), 1u);
    EXPECT_EQ(trading_engine->get_daily_counters().forced_closes_today, 1);
}
