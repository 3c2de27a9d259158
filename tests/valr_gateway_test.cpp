#include <gtest/gtest.h>
#include "api/general/api_errors.hpp"
#include "api/valr/valr_gateway.hpp"
#include "test_support/scripted_transport.hpp"

using ValrTrader::API::ApiError;
using ValrTrader::API::ConnectionError;
using ValrTrader::API::RateLimitError;
using ValrTrader::API::ValrGateway;
using ValrTrader::API::ValrRequestSigner;
using ValrTrader::API::json;
using ValrTrader::Core::Decimal;
using ValrTrader::Testing::ScriptedTransport;
using ValrTrader::Testing::find_header_value;

class ValrGatewayTest : public ::testing::Test {
protected:
    void SetUp() override {
        api_config.base_url = "https://api.test";
        api_config.api_key = "test-key";
        api_config.api_secret = "test-secret";
        api_config.max_retries = 2;
        api_config.retry_base_delay_milliseconds = 1;
        api_config.retry_backoff_factor = 2.0;
    }

    ValrTrader::Config::ApiConfig api_config;
    ScriptedTransport transport;
};

TEST_F(ValrGatewayTest, signs_requests_with_versioned_path) {
    transport.enqueue_response(200, R"([{"currency":"ZAR","available":"250.5"}])");
    ValrGateway gateway(api_config, transport);

    std::map<std::string, Decimal> balances = gateway.get_balances();
    EXPECT_EQ(balances.at("ZAR"), Decimal("250.5"));

    ASSERT_EQ(transport.get_requests().size(), 1u);
    const HttpRequest& sent_request = transport.get_requests()[0];
    EXPECT_EQ(sent_request.method, "GET");
    EXPECT_EQ(sent_request.url, "https://api.test/v1/account/balances");
    EXPECT_EQ(find_header_value(sent_request, "X-VALR-API-KEY"), "test-key");
    EXPECT_EQ(find_header_value(sent_request, "Content-Type"), "application/json");

    std::string timestamp = find_header_value(sent_request, "X-VALR-API-TIMESTAMP");
    ASSERT_FALSE(timestamp.empty());
    ValrRequestSigner expected_signer("test-secret");
    EXPECT_EQ(find_header_value(sent_request, "X-VALR-API-SIGNATURE"),
              expected_signer.sign(timestamp, "GET", "/v1/account/balances", ""));
}

TEST_F(ValrGatewayTest, retries_server_errors_then_succeeds) {
    transport.enqueue_response(503, "");
    transport.enqueue_response(502, "bad gateway");
    transport.enqueue_response(200, R"({"epochTime":1700000000})");
    ValrGateway gateway(api_config, transport);

    EXPECT_EQ(gateway.get_server_time(), 1700000000000LL);
    EXPECT_EQ(transport.get_requests().size(), 3u);
}

TEST_F(ValrGatewayTest, exhausted_transport_retries_raise_connection_error) {
    transport.enqueue_transport_error();
    transport.enqueue_transport_error();
    transport.enqueue_transport_error();
    ValrGateway gateway(api_config, transport);

    EXPECT_THROW(gateway.get_open_orders(), ConnectionError);
    EXPECT_EQ(transport.get_requests().size(), 3u);
}

TEST_F(ValrGatewayTest, exhausted_rate_limit_retries_raise_rate_limit_error) {
    transport.enqueue_response(429, "");
    transport.enqueue_response(429, "");
    transport.enqueue_response(429, "");
    ValrGateway gateway(api_config, transport);

    EXPECT_THROW(gateway.get_balances(), RateLimitError);
    EXPECT_EQ(transport.get_requests().size(), 3u);
}

TEST_F(ValrGatewayTest, persistent_server_error_raises_api_error_with_status) {
    transport.enqueue_response(500, R"({"code":"INTERNAL","message":"boom"})");
    transport.enqueue_response(500, R"({"code":"INTERNAL","message":"boom"})");
    transport.enqueue_response(500, R"({"code":"INTERNAL","message":"boom"})");
    ValrGateway gateway(api_config, transport);

    try {
        gateway.get_balances();
        FAIL() << "expected ApiError";
    } catch (const ApiError& api_exception_error) {
        EXPECT_EQ(api_exception_error.get_http_status(), 500);
        EXPECT_EQ(api_exception_error.get_error_code(), "INTERNAL");
    }
}

TEST_F(ValrGatewayTest, client_error_is_not_retried) {
    transport.enqueue_response(400, R"({"code":-6,"message":"Insufficient Balance"})");
    ValrGateway gateway(api_config, transport);

    ValrTrader::Core::LimitOrderRequest limit_request;
    limit_request.pair = "BTCZAR";
    limit_request.quantity = Decimal("0.001");
    limit_request.price = Decimal("1300000");
    try {
        gateway.place_limit_order(limit_request);
        FAIL() << "expected ApiError";
    } catch (const ApiError& api_exception_error) {
        EXPECT_EQ(api_exception_error.get_http_status(), 400);
        EXPECT_EQ(api_exception_error.get_error_code(), "-6");
        EXPECT_NE(std::string(api_exception_error.what()).find("Insufficient Balance"), std::string::npos);
    }
    EXPECT_EQ(transport.get_requests().size(), 1u);
}

TEST_F(ValrGatewayTest, non_json_error_body_uses_http_status_code) {
    transport.enqueue_response(403, "forbidden");
    ValrGateway gateway(api_config, transport);

    try {
        gateway.get_balances();
        FAIL() << "expected ApiError";
    } catch (const ApiError& api_exception_error) {
        EXPECT_EQ(api_exception_error.get_error_code(), "HTTP_403");
    }
}

TEST_F(ValrGatewayTest, not_found_falls_back_to_next_endpoint) {
    transport.enqueue_response(404, "");
    transport.enqueue_response(200, R"({"Bids":[{"price":"100","quantity":"1"}],"Asks":[{"price":"101","quantity":"1"}]})");
    ValrGateway gateway(api_config, transport);

    ValrTrader::Core::OrderBook order_book = gateway.get_order_book("BTCZAR");
    EXPECT_EQ(order_book.best_ask(), Decimal("101"));

    ASSERT_EQ(transport.get_requests().size(), 2u);
    EXPECT_EQ(transport.get_requests()[0].url, "https://api.test/v1/marketdata/BTCZAR/orderbook");
    EXPECT_EQ(transport.get_requests()[1].url, "https://api.test/v1/public/BTCZAR/orderbook");
}

TEST_F(ValrGatewayTest, not_found_on_last_endpoint_propagates) {
    transport.enqueue_response(404, "");
    ValrGateway gateway(api_config, transport);

    try {
        gateway.get_last_traded_price("NOPEZAR");
        FAIL() << "expected ApiError";
    } catch (const ApiError& api_exception_error) {
        EXPECT_EQ(api_exception_error.get_http_status(), 404);
    }
}

TEST_F(ValrGatewayTest, fills_fall_back_to_tagged_trade_history) {
    transport.enqueue_response(404, "");
    transport.enqueue_response(200, R"([{"orderId":"o-1","price":"100","quantity":"0.4"},{"price":"99","quantity":"5"}])");
    ValrGateway gateway(api_config, transport);

    std::vector<ValrTrader::Core::OrderFill> fills = gateway.get_order_fills("BTCZAR", "o-1");
    ASSERT_EQ(fills.size(), 1u);
    EXPECT_EQ(fills[0].price, Decimal("100"));

    ASSERT_EQ(transport.get_requests().size(), 2u);
    EXPECT_EQ(transport.get_requests()[0].url, "https://api.test/v1/orders/o-1/fills");
    EXPECT_EQ(transport.get_requests()[1].url, "https://api.test/v1/account/BTCZAR/tradehistory");
}

TEST_F(ValrGatewayTest, market_order_body_carries_exactly_one_amount) {
    transport.enqueue_response(202, R"({"id":"mkt-1"})");
    ValrGateway gateway(api_config, transport);

    ValrTrader::Core::MarketOrderRequest market_request;
    market_request.pair = "BTCZAR";
    market_request.side = ValrTrader::Core::OrderSide::BUY;
    market_request.quote_amount = Decimal("100");
    EXPECT_EQ(gateway.place_market_order(market_request), "mkt-1");

    json sent_body = json::parse(transport.get_requests()[0].body);
    EXPECT_EQ(sent_body.at("quoteAmount").get<std::string>(), "100");
    EXPECT_EQ(sent_body.at("side").get<std::string>(), "BUY");
    EXPECT_EQ(sent_body.count("baseAmount"), 0u);

    market_request.base_quantity = Decimal("0.01");
    EXPECT_THROW(gateway.place_market_order(market_request), std::runtime_error);
}

TEST_F(ValrGatewayTest, cancel_sends_delete_with_order_and_pair) {
    transport.enqueue_response(200, "");
    ValrGateway gateway(api_config, transport);

    gateway.cancel_order("ETHZAR", "ord-9");
    const HttpRequest& sent_request = transport.get_requests()[0];
    EXPECT_EQ(sent_request.method, "DELETE");
    EXPECT_EQ(sent_request.url, "https://api.test/v1/orders/order");
    json sent_body = json::parse(sent_request.body);
    EXPECT_EQ(sent_body.at("orderId").get<std::string>(), "ord-9");
    EXPECT_EQ(sent_body.at("pair").get<std::string>(), "ETHZAR");
}
