#include "test_support/engine_test_fixture.hpp"

using ValrTrader::Core::Decimal;
using ValrTrader::Core::OrderRecord;
using ValrTrader::Core::OrderRole;
using ValrTrader::Core::OrderStatus;
using ValrTrader::Core::Position;
using ValrTrader::Core::TradeSetupFailure;
using ValrTrader::Core::TradeSetupResult;
using ValrTrader::Testing::make_status_report;

class TradingEngineTest : public ValrTrader::Testing::EngineTestBase {};

TEST_F(TradingEngineTest, successful_setup_opens_dual_protected_position) {
    ValrTrader::Core::TradingEngine& engine = create_engine();
    Position position = open_dual_protected_position();

    EXPECT_EQ(position.position_id, "BTCZAR_1710000000000");
    EXPECT_EQ(position.quantity, Decimal("0.00007692"));
    EXPECT_EQ(position.entry_price, Decimal("1300000"));
    EXPECT_EQ(position.take_profit_price, Decimal("1319500"));
    EXPECT_EQ(position.stop_loss_price, Decimal("1274000"));
    EXPECT_EQ(position.entry_order_id, "ORD-1");
    EXPECT_EQ(*position.take_profit_order_id, "ORD-2");
    EXPECT_EQ(*position.stop_loss_order_id, "ORD-3");

    ASSERT_EQ(exchange.limit_orders.size(), 2u);
    EXPECT_EQ(exchange.limit_orders[0].request.side, ValrTrader::Core::OrderSide::BUY);
    EXPECT_EQ(exchange.limit_orders[0].request.price, Decimal("1300000"));
    EXPECT_FALSE(exchange.limit_orders[0].request.post_only);
    EXPECT_EQ(exchange.limit_orders[1].request.side, ValrTrader::Core::OrderSide::SELL);
    EXPECT_TRUE(exchange.limit_orders[1].request.post_only);
    EXPECT_EQ(exchange.limit_orders[1].request.price, Decimal("1319500"));
    ASSERT_EQ(exchange.stop_limit_orders.size(), 1u);
    EXPECT_EQ(exchange.stop_limit_orders[0].request.stop_price, Decimal("1274000"));
    EXPECT_EQ(exchange.stop_limit_orders[0].request.limit_price, Decimal("1274000"));

    EXPECT_EQ(engine.get_daily_counters().trades_today, 1);
    EXPECT_EQ(engine.get_open_positions().size(), 1u);
    EXPECT_EQ(position_store->load_positions().count(position.position_id), 1u);

    // Entry record is pruned once filled; the two exits stay active
    std::vector<OrderRecord> active_orders = order_store->get_active_orders();
    ASSERT_EQ(active_orders.size(), 2u);
    EXPECT_FALSE(order_store->get_order("ORD-1").has_value());
    EXPECT_EQ(order_store->get_order("ORD-2")->role, OrderRole::TAKE_PROFIT);
    EXPECT_EQ(order_store->get_order("ORD-3")->role, OrderRole::STOP_LOSS);
}

TEST_F(TradingEngineTest, daily_limit_rejects_before_any_exchange_call) {
    config.strategy.max_daily_trades = 0;
    ValrTrader::Core::TradingEngine& engine = create_engine();

    TradeSetupResult setup_result = engine.execute_trade_setup("BTCZAR", buy_signal());
    EXPECT_EQ(rejection_reason(setup_result), TradeSetupFailure::DAILY_LIMIT_REACHED);
    EXPECT_EQ(exchange.order_book_calls, 0);
    EXPECT_EQ(exchange.balance_calls, 0);
    EXPECT_EQ(exchange.total_placed_orders(), 0u);
}

TEST_F(TradingEngineTest, second_setup_on_same_pair_is_rejected) {
    ValrTrader::Core::TradingEngine& engine = create_engine();
    open_dual_protected_position();

    TradeSetupResult setup_result = engine.execute_trade_setup("BTCZAR", buy_signal());
    EXPECT_EQ(rejection_reason(setup_result), TradeSetupFailure::POSITION_ALREADY_OPEN);
    EXPECT_EQ(exchange.total_placed_orders(), 3u);
}

TEST_F(TradingEngineTest, shutdown_rejects_new_setups) {
    ValrTrader::Core::TradingEngine& engine = create_engine();
    shutdown_requested.store(true);

    EXPECT_EQ(rejection_reason(engine.execute_trade_setup("BTCZAR", buy_signal())), TradeSetupFailure::SHUTDOWN_REQUESTED);
    EXPECT_EQ(exchange.order_book_calls, 0);
}

TEST_F(TradingEngineTest, empty_order_book_is_no_market_data) {
    exchange.set_empty_order_book("BTCZAR");
    ValrTrader::Core::TradingEngine& engine = create_engine();

    EXPECT_EQ(rejection_reason(engine.execute_trade_setup("BTCZAR", buy_signal())), TradeSetupFailure::NO_MARKET_DATA);
    EXPECT_EQ(exchange.total_placed_orders(), 0u);
}

TEST_F(TradingEngineTest, quantity_below_minimum_is_invalid_size) {
    config.pairs.pair_settings["BTCZAR"].minimum_quantity = Decimal("0.0001");
    ValrTrader::Core::TradingEngine& engine = create_engine();

    EXPECT_EQ(rejection_reason(engine.execute_trade_setup("BTCZAR", buy_signal())), TradeSetupFailure::INVALID_ORDER_SIZE);
    EXPECT_EQ(exchange.total_placed_orders(), 0u);
}

TEST_F(TradingEngineTest, balance_must_cover_fee_and_safety_margin) {
    exchange.set_balance("ZAR", Decimal("101.17"));
    ValrTrader::Core::TradingEngine& engine = create_engine();
    EXPECT_EQ(rejection_reason(engine.execute_trade_setup("BTCZAR", buy_signal())), TradeSetupFailure::INSUFFICIENT_BALANCE);
    EXPECT_EQ(exchange.total_placed_orders(), 0u);

    exchange.set_balance("ZAR", Decimal("101.18"));
    script_entry_fill();
    EXPECT_TRUE(std::holds_alternative<Position>(engine.execute_trade_setup("BTCZAR", buy_signal())));
}

TEST_F(TradingEngineTest, unfilled_entry_is_cancelled_and_rejected) {
    ValrTrader::Core::TradingEngine& engine = create_engine();

    TradeSetupResult setup_result = engine.execute_trade_setup("BTCZAR", buy_signal());
    EXPECT_EQ(rejection_reason(setup_result), TradeSetupFailure::ENTRY_NOT_FILLED);
    EXPECT_TRUE(exchange.was_cancelled("ORD-1"));
    EXPECT_EQ(exchange.total_placed_orders(), 1u);
    EXPECT_TRUE(order_store->get_active_orders().empty());
    EXPECT_TRUE(engine.get_open_positions().empty());
    EXPECT_EQ(engine.get_daily_counters().trades_today, 0);
}

TEST_F(TradingEngineTest, fill_landing_during_cancel_still_opens_position) {
    // Three polls inside the one second budget, then the post-cancel check sees the fill
    exchange.script_status("ORD-1", {
        make_status_report(OrderStatus::PENDING),
        make_status_report(OrderStatus::PENDING),
        make_status_report(OrderStatus::PENDING),
        make_status_report(OrderStatus::FILLED, "0.00007692", "1300000")
    });
    ValrTrader::Core::TradingEngine& engine = create_engine();

    TradeSetupResult setup_result = engine.execute_trade_setup("BTCZAR", buy_signal());
    ASSERT_TRUE(std::holds_alternative<Position>(setup_result));
    EXPECT_TRUE(exchange.was_cancelled("ORD-1"));
    EXPECT_EQ(exchange.stop_limit_orders.size(), 1u);
    EXPECT_EQ(engine.get_open_positions().size(), 1u);
}

TEST_F(TradingEngineTest, protection_failure_liquidates_with_market_sell) {
    exchange.fail_stop_limit_orders = true;
    ValrTrader::Core::TradingEngine& engine = create_engine();
    script_entry_fill();

    TradeSetupResult setup_result = engine.execute_trade_setup("BTCZAR", buy_signal());
    EXPECT_EQ(rejection_reason(setup_result), TradeSetupFailure::PROTECTION_FAILED);

    EXPECT_TRUE(exchange.was_cancelled("ORD-2"));
    ASSERT_EQ(exchange.market_orders.size(), 1u);
    EXPECT_EQ(exchange.market_orders[0].request.side, ValrTrader::Core::OrderSide::SELL);
    ASSERT_TRUE(exchange.market_orders[0].request.base_quantity.has_value());
    EXPECT_EQ(*exchange.market_orders[0].request.base_quantity, Decimal("0.00007692"));

    ValrTrader::Core::DailyCounters daily_counters = engine.get_daily_counters();
    EXPECT_EQ(daily_counters.failed_trades_today, 1);
    EXPECT_EQ(daily_counters.trades_today, 0);
    EXPECT_TRUE(engine.get_open_positions().empty());
    EXPECT_TRUE(position_store->load_positions().empty());
}

TEST_F(TradingEngineTest, rejected_market_sell_falls_back_to_limit_at_bid) {
    exchange.fail_stop_limit_orders = true;
    exchange.fail_market_orders = true;
    ValrTrader::Core::TradingEngine& engine = create_engine();
    script_entry_fill();

    EXPECT_EQ(rejection_reason(engine.execute_trade_setup("BTCZAR", buy_signal())), TradeSetupFailure::PROTECTION_FAILED);

    ASSERT_EQ(exchange.limit_orders.size(), 3u);
    const ValrTrader::Testing::FakeExchange::PlacedLimitOrder& liquidation_order = exchange.limit_orders[2];
    EXPECT_EQ(liquidation_order.request.side, ValrTrader::Core::OrderSide::SELL);
    EXPECT_EQ(liquidation_order.request.price, Decimal("1299000"));
    EXPECT_FALSE(liquidation_order.request.post_only);

    std::optional<OrderRecord> liquidation_record = order_store->get_order(liquidation_order.order_id);
    ASSERT_TRUE(liquidation_record.has_value());
    EXPECT_EQ(liquidation_record->role, OrderRole::LIQUIDATION);
}

TEST_F(TradingEngineTest, exchange_failure_during_setup_is_a_rejection) {
    exchange.fail_order_book = true;
    ValrTrader::Core::TradingEngine& engine = create_engine();
    EXPECT_EQ(rejection_reason(engine.execute_trade_setup("BTCZAR", buy_signal())), TradeSetupFailure::EXCHANGE_ERROR);
}

TEST_F(TradingEngineTest, market_entry_spends_quote_amount_and_uses_fill_price) {
    config.strategy.entry_pricing_mode = ValrTrader::Config::EntryPricingMode::MARKET;
    ValrTrader::Core::TradingEngine& engine = create_engine();
    script_entry_fill("0.0000769", "1300050");

    TradeSetupResult setup_result = engine.execute_trade_setup("BTCZAR", buy_signal());
    ASSERT_TRUE(std::holds_alternative<Position>(setup_result));
    const Position& position = std::get<Position>(setup_result);

    ASSERT_EQ(exchange.market_orders.size(), 1u);
    ASSERT_TRUE(exchange.market_orders[0].request.quote_amount.has_value());
    EXPECT_EQ(*exchange.market_orders[0].request.quote_amount, Decimal("100"));
    EXPECT_EQ(position.quantity, Decimal("0.0000769"));
    EXPECT_EQ(position.entry_price, Decimal("1300050"));
    EXPECT_EQ(position.take_profit_price, Decimal("1319550"));
}

TEST_F(TradingEngineTest, stop_loss_only_mode_places_single_exit) {
    config.strategy.protection_mode = ValrTrader::Config::ProtectionMode::STOP_LOSS_ONLY;
    ValrTrader::Core::TradingEngine& engine = create_engine();
    script_entry_fill();

    TradeSetupResult setup_result = engine.execute_trade_setup("BTCZAR", buy_signal());
    ASSERT_TRUE(std::holds_alternative<Position>(setup_result));
    const Position& position = std::get<Position>(setup_result);
    EXPECT_FALSE(position.take_profit_order_id.has_value());
    EXPECT_EQ(*position.stop_loss_order_id, "ORD-2");
    EXPECT_EQ(exchange.limit_orders.size(), 1u);
}

TEST_F(TradingEngineTest, startup_loads_persisted_positions) {
    create_engine();
    Position persisted_position = open_dual_protected_position();

    ValrTrader::Core::TradingEngine& restarted_engine = create_engine();
    EXPECT_EQ(restarted_engine.startup_recovery(), 1u);
    std::optional<Position> loaded_position = restarted_engine.get_position(persisted_position.position_id);
    ASSERT_TRUE(loaded_position.has_value());
    EXPECT_EQ(loaded_position->stop_loss_price, Decimal("1274000"));
    EXPECT_EQ(order_store->get_active_orders().size(), 2u);
    EXPECT_EQ(exchange.open_orders_calls, 0);
}

TEST_F(TradingEngineTest, startup_rebuilds_positions_from_exchange_when_nothing_persisted) {
    exchange.set_open_orders({open_sell("tp-9", "0.001", "1319500"), open_sell("sl-9", "0.001", "1274000")});
    ValrTrader::Core::TradingEngine& engine = create_engine();

    EXPECT_EQ(engine.startup_recovery(), 1u);
    std::vector<Position> open_positions = engine.get_open_positions();
    ASSERT_EQ(open_positions.size(), 1u);
    EXPECT_EQ(open_positions[0].entry_price, Decimal("1300000"));
    EXPECT_EQ(open_positions[0].entry_order_id, "recovered");
    EXPECT_EQ(position_store->load_positions().size(), 1u);
}

TEST_F(TradingEngineTest, persist_state_writes_both_stores) {
    ValrTrader::Core::TradingEngine& engine = create_engine();
    open_dual_protected_position();
    position_store->save_positions({});

    engine.persist_state();
    EXPECT_EQ(position_store->load_positions().size(), 1u);
    nlohmann::json orders_document = nlohmann::json::parse(temp_directory.read("orders.json"));
    EXPECT_EQ(orders_document.at("orders").size(), 2u);
}

TEST_F(TradingEngineTest, stale_order_cleanup_uses_configured_age) {
    config.timing.stale_order_max_age_hours = 24;
    ValrTrader::Core::TradingEngine& engine = create_engine();
    open_dual_protected_position();

    clock.advance(std::chrono::hours(23));
    EXPECT_EQ(engine.cleanup_stale_orders(), 0u);
    clock.advance(std::chrono::hours(2));
    EXPECT_EQ(engine.cleanup_stale_orders(), 2u);
}
