#ifndef VALR_GATEWAY_HPP
#define VALR_GATEWAY_HPP

#include "api/general/exchange_gateway_interface.hpp"
#include "api/general/http_transport_interface.hpp"
#include "api/valr/rate_limiter.hpp"
#include "api/valr/valr_request_signer.hpp"
#include "configs/api_config.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace ValrTrader {
namespace API {

using json = nlohmann::json;

/**
 * @brief Authenticated VALR REST client.
 * Every call goes through the shared rate limiter, is signed, retried with
 * exponential backoff on transport failures, HTTP 429 and 5xx, and logged once per attempt.
 */
class ValrGateway : public ExchangeGatewayInterface {
public:
    ValrGateway(const Config::ApiConfig& api_config, HttpTransportInterface& http_transport);

    std::map<std::string, Core::Decimal> get_balances() override;
    Core::OrderBook get_order_book(const std::string& pair) override;

    std::string place_limit_order(const Core::LimitOrderRequest& order_request) override;
    std::string place_market_order(const Core::MarketOrderRequest& order_request) override;
    std::string place_stop_limit_order(const Core::StopLimitOrderRequest& order_request) override;
    void cancel_order(const std::string& pair, const std::string& order_id) override;

    Core::OrderStatusReport get_order_status(const std::string& pair, const std::string& order_id) override;
    std::vector<Core::OpenOrder> get_open_orders() override;
    std::vector<Core::OrderFill> get_order_fills(const std::string& pair, const std::string& order_id) override;

    Core::Decimal get_last_traded_price(const std::string& pair) override;
    long long get_server_time() override;

    // Tries each endpoint in order; a 404 on any but the last moves on to the next.
    json request(const std::string& method, const std::vector<std::string>& candidate_endpoints,
                 const std::string& body = "");

private:
    json execute_with_retries(const std::string& method, const std::string& endpoint, const std::string& body);
    HttpRequest build_signed_request(const std::string& method, const std::string& endpoint, const std::string& body) const;
    long long backoff_delay_milliseconds(int attempt_index) const;
    void wait_before_retry(const std::string& method, const std::string& endpoint, int attempt_index,
                           const std::string& reason) const;
    static std::string extract_error_message(const std::string& response_body);
    static std::string extract_error_code(const std::string& response_body, long status_code);

    const Config::ApiConfig& config;
    HttpTransportInterface& transport;
    RateLimiter rate_limiter;
    ValrRequestSigner request_signer;
};

} // namespace API
} // namespace ValrTrader

#endif // VALR_GATEWAY_HPP
