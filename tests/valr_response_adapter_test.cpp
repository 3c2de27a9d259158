#include <gtest/gtest.h>
#include "api/general/api_errors.hpp"
#include "api/valr/valr_response_adapter.hpp"

using ValrTrader::API::ValrResponseAdapter;
using ValrTrader::API::ApiError;
using ValrTrader::API::json;
using ValrTrader::Core::Decimal;
using ValrTrader::Core::OrderStatus;

TEST(ValrResponseAdapterTest, normalizes_exchange_status_spellings) {
    EXPECT_EQ(ValrResponseAdapter::normalize_status("Filled"), OrderStatus::FILLED);
    EXPECT_EQ(ValrResponseAdapter::normalize_status("COMPLETED"), OrderStatus::FILLED);
    EXPECT_EQ(ValrResponseAdapter::normalize_status("Partially Filled"), OrderStatus::PARTIALLY_FILLED);
    EXPECT_EQ(ValrResponseAdapter::normalize_status("partially_filled"), OrderStatus::PARTIALLY_FILLED);
    EXPECT_EQ(ValrResponseAdapter::normalize_status("Cancelled"), OrderStatus::CANCELLED);
    EXPECT_EQ(ValrResponseAdapter::normalize_status("canceled"), OrderStatus::CANCELLED);
    EXPECT_EQ(ValrResponseAdapter::normalize_status("Failed"), OrderStatus::CANCELLED);
    EXPECT_EQ(ValrResponseAdapter::normalize_status("Placed"), OrderStatus::PENDING);
    EXPECT_EQ(ValrResponseAdapter::normalize_status("Active"), OrderStatus::PENDING);
    EXPECT_EQ(ValrResponseAdapter::normalize_status("something new"), OrderStatus::PENDING);
}

TEST(ValrResponseAdapterTest, order_status_reads_quantities_and_price) {
    json status_json = {
        {"orderStatusType", "Filled"},
        {"originalQuantity", "0.5"},
        {"filledQuantity", "0.5"},
        {"averagePrice", "1300000"}
    };
    ValrTrader::Core::OrderStatusReport status_report = ValrResponseAdapter::parse_order_status(status_json, "abc");
    EXPECT_EQ(status_report.order_id, "abc");
    EXPECT_EQ(status_report.status, OrderStatus::FILLED);
    EXPECT_EQ(status_report.raw_status, "Filled");
    ASSERT_TRUE(status_report.filled_quantity.has_value());
    EXPECT_EQ(*status_report.filled_quantity, Decimal("0.5"));
    ASSERT_TRUE(status_report.average_price.has_value());
    EXPECT_EQ(*status_report.average_price, Decimal("1300000"));
}

TEST(ValrResponseAdapterTest, pending_order_with_executed_quantity_is_partial) {
    json status_json = {
        {"orderStatusType", "Active"},
        {"originalQuantity", "1.0"},
        {"remainingQuantity", "0.25"}
    };
    ValrTrader::Core::OrderStatusReport status_report = ValrResponseAdapter::parse_order_status(status_json, "abc");
    EXPECT_EQ(status_report.status, OrderStatus::PARTIALLY_FILLED);
    ASSERT_TRUE(status_report.filled_quantity.has_value());
    EXPECT_EQ(*status_report.filled_quantity, Decimal("0.75"));
}

TEST(ValrResponseAdapterTest, order_status_without_quantities_leaves_them_empty) {
    json status_json = {{"orderStatusType", "Filled"}};
    ValrTrader::Core::OrderStatusReport status_report = ValrResponseAdapter::parse_order_status(status_json, "abc");
    EXPECT_EQ(status_report.status, OrderStatus::FILLED);
    EXPECT_FALSE(status_report.filled_quantity.has_value());
    EXPECT_FALSE(status_report.average_price.has_value());
    EXPECT_THROW(ValrResponseAdapter::parse_order_status(json::array(), "abc"), ApiError);
}

TEST(ValrResponseAdapterTest, order_book_sorts_best_levels_first) {
    json order_book_json = {
        {"Bids", {{{"price", "99"}, {"quantity", "1"}}, {{"price", "100"}, {"quantity", "2"}}}},
        {"Asks", {{{"price", "102"}, {"quantity", "1"}}, {{"price", "101"}, {"quantity", "3"}}, {{"side", "sell"}}}}
    };
    ValrTrader::Core::OrderBook order_book = ValrResponseAdapter::parse_order_book(order_book_json, "BTCZAR");
    ASSERT_TRUE(order_book.has_best_bid());
    ASSERT_TRUE(order_book.has_best_ask());
    EXPECT_EQ(order_book.best_bid(), Decimal("100"));
    EXPECT_EQ(order_book.best_ask(), Decimal("101"));
    EXPECT_EQ(order_book.asks.size(), 2u);
}

TEST(ValrResponseAdapterTest, balances_accept_bare_and_wrapped_arrays) {
    json bare_balances = json::array({
        {{"currency", "ZAR"}, {"available", "1500.25"}, {"total", "2000"}},
        {{"currency", "BTC"}, {"available", "0.01"}}
    });
    std::map<std::string, Decimal> balances = ValrResponseAdapter::parse_balances(bare_balances);
    EXPECT_EQ(balances.at("ZAR"), Decimal("1500.25"));
    EXPECT_EQ(balances.at("BTC"), Decimal("0.01"));

    json wrapped_balances = {{"balances", json::array({{{"asset", "USDT"}, {"free", 12}}})}};
    EXPECT_EQ(ValrResponseAdapter::parse_balances(wrapped_balances).at("USDT"), Decimal("12"));
}

TEST(ValrResponseAdapterTest, order_id_required_in_placement_response) {
    EXPECT_EQ(ValrResponseAdapter::extract_order_id(json{{"id", "558f5e0a"}}), "558f5e0a");
    EXPECT_EQ(ValrResponseAdapter::extract_order_id(json{{"orderId", "x-1"}}), "x-1");
    EXPECT_THROW(ValrResponseAdapter::extract_order_id(json::object()), ApiError);
}

TEST(ValrResponseAdapterTest, open_orders_skip_malformed_entries) {
    json open_orders_json = json::array({
        {{"orderId", "tp-1"}, {"currencyPair", "BTCZAR"}, {"side", "sell"}, {"remainingQuantity", "0.001"}, {"price", "1050000"}},
        {{"orderId", "bad"}, {"currencyPair", "BTCZAR"}, {"side", "sell"}},
        {{"orderId", "weird"}, {"currencyPair", "BTCZAR"}, {"side", "sideways"}, {"quantity", "1"}, {"price", "1"}}
    });
    std::vector<ValrTrader::Core::OpenOrder> open_orders = ValrResponseAdapter::parse_open_orders(open_orders_json);
    ASSERT_EQ(open_orders.size(), 1u);
    EXPECT_EQ(open_orders[0].order_id, "tp-1");
    EXPECT_EQ(open_orders[0].side, ValrTrader::Core::OrderSide::SELL);
    EXPECT_EQ(open_orders[0].quantity, Decimal("0.001"));
}

TEST(ValrResponseAdapterTest, fills_keep_only_matching_order) {
    json fills_json = json::array({
        {{"orderId", "o-1"}, {"price", "100"}, {"quantity", "0.4"}},
        {{"orderId", "o-2"}, {"price", "200"}, {"quantity", "1"}},
        {{"price", "101"}, {"quantity", "0.6"}}
    });
    std::vector<ValrTrader::Core::OrderFill> fills = ValrResponseAdapter::parse_fills(fills_json, "o-1");
    ASSERT_EQ(fills.size(), 2u);
    EXPECT_EQ(fills[0].price, Decimal("100"));
    EXPECT_EQ(fills[1].quantity, Decimal("0.6"));
}

TEST(ValrResponseAdapterTest, pair_trade_history_needs_order_tag) {
    json trade_history_json = json::array({
        {{"orderId", "o-1"}, {"price", "100"}, {"quantity", "0.4"}},
        {{"price", "101"}, {"quantity", "0.6"}},
        {{"orderId", "o-9"}, {"price", "102"}, {"quantity", "2"}}
    });
    std::vector<ValrTrader::Core::OrderFill> fills = ValrResponseAdapter::parse_fills(trade_history_json, "o-1", true);
    ASSERT_EQ(fills.size(), 1u);
    EXPECT_EQ(fills[0].quantity, Decimal("0.4"));
}

TEST(ValrResponseAdapterTest, server_time_is_reported_in_milliseconds) {
    EXPECT_EQ(ValrResponseAdapter::parse_server_time(json{{"epochTime", 1555513423}, {"time", "2019-04-17T15:03:43.000Z"}}),
              1555513423000LL);
    EXPECT_THROW(ValrResponseAdapter::parse_server_time(json{{"time", "x"}}), ApiError);
}

TEST(ValrResponseAdapterTest, last_traded_price_must_be_positive) {
    EXPECT_EQ(ValrResponseAdapter::parse_last_traded_price(json{{"lastTradedPrice", "1234.5"}}, "BTCZAR"), Decimal("1234.5"));
    EXPECT_THROW(ValrResponseAdapter::parse_last_traded_price(json{{"lastTradedPrice", "0"}}, "BTCZAR"), ApiError);
}
