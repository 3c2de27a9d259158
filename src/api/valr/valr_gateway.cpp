#include "valr_gateway.hpp"
#include "api/general/api_errors.hpp"
#include "api/valr/valr_response_adapter.hpp"
#include "logging/logs/api_logs.hpp"
#include "utils/time_utils.hpp"
#include <chrono>
#include <cmath>
#include <thread>

using ValrTrader::Logging::ApiLogs;

namespace ValrTrader {
namespace API {

namespace {
    std::string side_to_wire(Core::OrderSide side) {
        return side == Core::OrderSide::BUY ? "BUY" : "SELL";
    }

    long long elapsed_milliseconds_since(std::chrono::steady_clock::time_point start_time) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_time).count();
    }
}

ValrGateway::ValrGateway(const Config::ApiConfig& api_config, HttpTransportInterface& http_transport)
    : config(api_config), transport(http_transport),
      rate_limiter(api_config.rate_limit_requests_per_window,
                   std::chrono::milliseconds(static_cast<long long>(api_config.rate_limit_window_seconds) * 1000)),
      request_signer(api_config.api_secret) {
    if (config.base_url.empty()) {
        throw std::runtime_error("VALR base URL is required but not provided");
    }
    if (config.max_retries < 0) {
        throw std::runtime_error("VALR max_retries must not be negative");
    }
}

// ========================================================================
// REQUEST PIPELINE
// ========================================================================

json ValrGateway::request(const std::string& method, const std::vector<std::string>& candidate_endpoints,
                          const std::string& body) {
    if (candidate_endpoints.empty()) {
        throw std::runtime_error("No endpoint given for " + method + " request");
    }

    for (size_t endpoint_index = 0; endpoint_index < candidate_endpoints.size(); ++endpoint_index) {
        const std::string& endpoint = candidate_endpoints[endpoint_index];
        bool has_fallback = endpoint_index + 1 < candidate_endpoints.size();
        try {
            return execute_with_retries(method, endpoint, body);
        } catch (const ApiError& api_exception_error) {
            if (!has_fallback || api_exception_error.get_http_status() != 404) {
                throw;
            }
            ApiLogs::log_endpoint_fallback(endpoint, candidate_endpoints[endpoint_index + 1]);
        }
    }
    throw std::runtime_error("Unreachable endpoint fallback state for " + method);
}

json ValrGateway::execute_with_retries(const std::string& method, const std::string& endpoint, const std::string& body) {
    int max_attempts = config.max_retries + 1;

    for (int attempt_index = 0; attempt_index < max_attempts; ++attempt_index) {
        bool is_last_attempt = attempt_index + 1 >= max_attempts;

        std::chrono::milliseconds rate_limit_wait = rate_limiter.acquire();
        if (rate_limit_wait.count() > 0) {
            ApiLogs::log_rate_limit_wait(rate_limit_wait.count(), rate_limiter.get_requests_in_window());
        }

        HttpRequest signed_request = build_signed_request(method, endpoint, body);
        std::chrono::steady_clock::time_point request_start = std::chrono::steady_clock::now();

        HttpResponse http_response;
        try {
            http_response = transport.perform(signed_request);
        } catch (const TransportError& transport_exception_error) {
            ApiLogs::log_api_call(method, endpoint, 0, elapsed_milliseconds_since(request_start),
                                  std::string("transport error: ") + transport_exception_error.what());
            if (is_last_attempt) {
                throw ConnectionError("Connection to " + endpoint + " failed after " + std::to_string(max_attempts) +
                                      " attempts: " + transport_exception_error.what());
            }
            wait_before_retry(method, endpoint, attempt_index, "transport error");
            continue;
        }

        long long latency_milliseconds = elapsed_milliseconds_since(request_start);
        long status_code = http_response.status_code;

        if (status_code == 429) {
            ApiLogs::log_api_call(method, endpoint, status_code, latency_milliseconds, "rate limited");
            if (is_last_attempt) {
                throw RateLimitError("Rate limited on " + endpoint + " after " + std::to_string(max_attempts) + " attempts");
            }
            wait_before_retry(method, endpoint, attempt_index, "HTTP 429");
            continue;
        }

        if (status_code >= 500) {
            ApiLogs::log_api_call(method, endpoint, status_code, latency_milliseconds, "server error");
            if (is_last_attempt) {
                throw ApiError("Server error on " + endpoint + ": " + extract_error_message(http_response.body),
                               extract_error_code(http_response.body, status_code), static_cast<int>(status_code));
            }
            wait_before_retry(method, endpoint, attempt_index, "HTTP " + std::to_string(status_code));
            continue;
        }

        if (status_code < 200 || status_code >= 300) {
            ApiLogs::log_api_call(method, endpoint, status_code, latency_milliseconds, "error");
            throw ApiError(method + " " + endpoint + " failed: " + extract_error_message(http_response.body),
                           extract_error_code(http_response.body, status_code), static_cast<int>(status_code));
        }

        ApiLogs::log_api_call(method, endpoint, status_code, latency_milliseconds, "ok");
        if (http_response.body.empty()) {
            return json::object();
        }
        try {
            return json::parse(http_response.body);
        } catch (const json::parse_error& parse_exception_error) {
            throw ApiError("Unparseable response from " + endpoint + ": " + parse_exception_error.what(),
                           "INVALID_RESPONSE", static_cast<int>(status_code));
        }
    }
    throw ConnectionError("No attempt made for " + endpoint);
}

HttpRequest ValrGateway::build_signed_request(const std::string& method, const std::string& endpoint,
                                              const std::string& body) const {
    std::string signed_path = "/" + config.api_version + endpoint;
    std::string timestamp = std::to_string(TimeUtils::to_epoch_milliseconds(std::chrono::system_clock::now()));
    std::string signature = request_signer.sign(timestamp, method, signed_path, body);

    std::vector<std::string> request_headers = {
        "X-VALR-API-KEY: " + config.api_key,
        "X-VALR-API-SIGNATURE: " + signature,
        "X-VALR-API-TIMESTAMP: " + timestamp,
        "Content-Type: application/json"
    };
    return HttpRequest(method, config.base_url + signed_path, request_headers, body,
                       config.request_timeout_seconds, config.enable_ssl_verification);
}

long long ValrGateway::backoff_delay_milliseconds(int attempt_index) const {
    double delay_value = static_cast<double>(config.retry_base_delay_milliseconds) *
                         std::pow(config.retry_backoff_factor, attempt_index);
    return static_cast<long long>(delay_value);
}

void ValrGateway::wait_before_retry(const std::string& method, const std::string& endpoint, int attempt_index,
                                    const std::string& reason) const {
    long long delay_milliseconds = backoff_delay_milliseconds(attempt_index);
    ApiLogs::log_retry_scheduled(method, endpoint, attempt_index + 2, config.max_retries + 1, delay_milliseconds, reason);
    std::this_thread::sleep_for(std::chrono::milliseconds(delay_milliseconds));
}

std::string ValrGateway::extract_error_message(const std::string& response_body) {
    try {
        json error_json = json::parse(response_body);
        std::string error_message = ValrResponseAdapter::string_field(error_json, {"message", "error"});
        if (!error_message.empty()) {
            return error_message;
        }
    } catch (const json::parse_error&) {
        // Not JSON; fall through to the raw body
    }
    return response_body.empty() ? "empty response body" : response_body;
}

std::string ValrGateway::extract_error_code(const std::string& response_body, long status_code) {
    try {
        json error_json = json::parse(response_body);
        std::string error_code = ValrResponseAdapter::string_field(error_json, {"code", "errorCode"});
        if (!error_code.empty()) {
            return error_code;
        }
    } catch (const json::parse_error&) {
        // Not JSON; use the HTTP status as the code
    }
    return "HTTP_" + std::to_string(status_code);
}

// ========================================================================
// ACCOUNT AND MARKET DATA
// ========================================================================

std::map<std::string, Core::Decimal> ValrGateway::get_balances() {
    return ValrResponseAdapter::parse_balances(request("GET", {"/account/balances"}));
}

Core::OrderBook ValrGateway::get_order_book(const std::string& pair) {
    json order_book_json = request("GET", {"/marketdata/" + pair + "/orderbook", "/public/" + pair + "/orderbook"});
    return ValrResponseAdapter::parse_order_book(order_book_json, pair);
}

Core::Decimal ValrGateway::get_last_traded_price(const std::string& pair) {
    return ValrResponseAdapter::parse_last_traded_price(request("GET", {"/public/" + pair + "/marketsummary"}), pair);
}

long long ValrGateway::get_server_time() {
    return ValrResponseAdapter::parse_server_time(request("GET", {"/public/time"}));
}

// ========================================================================
// ORDER PLACEMENT
// ========================================================================

std::string ValrGateway::place_limit_order(const Core::LimitOrderRequest& order_request) {
    json order_body = {
        {"pair", order_request.pair},
        {"side", side_to_wire(order_request.side)},
        {"quantity", DecimalUtils::format_decimal(order_request.quantity)},
        {"price", DecimalUtils::format_decimal(order_request.price)},
        {"postOnly", order_request.post_only},
        {"timeInForce", order_request.time_in_force}
    };
    json order_response = request("POST", {"/orders/limit", "/orders"}, order_body.dump());
    return ValrResponseAdapter::extract_order_id(order_response);
}

std::string ValrGateway::place_market_order(const Core::MarketOrderRequest& order_request) {
    if (order_request.base_quantity.has_value() == order_request.quote_amount.has_value()) {
        throw std::runtime_error("Market order for " + order_request.pair +
                                 " needs exactly one of base quantity or quote amount");
    }

    json order_body = {
        {"pair", order_request.pair},
        {"side", side_to_wire(order_request.side)}
    };
    if (order_request.base_quantity) {
        order_body["baseAmount"] = DecimalUtils::format_decimal(*order_request.base_quantity);
    } else {
        order_body["quoteAmount"] = DecimalUtils::format_decimal(*order_request.quote_amount);
    }
    json order_response = request("POST", {"/orders/market"}, order_body.dump());
    return ValrResponseAdapter::extract_order_id(order_response);
}

std::string ValrGateway::place_stop_limit_order(const Core::StopLimitOrderRequest& order_request) {
    json order_body = {
        {"pair", order_request.pair},
        {"side", side_to_wire(order_request.side)},
        {"quantity", DecimalUtils::format_decimal(order_request.quantity)},
        {"price", DecimalUtils::format_decimal(order_request.limit_price)},
        {"stopPrice", DecimalUtils::format_decimal(order_request.stop_price)},
        {"type", "STOP_LOSS_LIMIT"},
        {"timeInForce", "GTC"}
    };
    json order_response = request("POST", {"/orders/stop/limit"}, order_body.dump());
    return ValrResponseAdapter::extract_order_id(order_response);
}

void ValrGateway::cancel_order(const std::string& pair, const std::string& order_id) {
    json cancel_body = {
        {"orderId", order_id},
        {"pair", pair}
    };
    request("DELETE", {"/orders/order", "/orders/" + order_id}, cancel_body.dump());
}

// ========================================================================
// ORDER QUERIES
// ========================================================================

Core::OrderStatusReport ValrGateway::get_order_status(const std::string& pair, const std::string& order_id) {
    json status_json = request("GET", {"/orders/" + pair + "/orderid/" + order_id, "/orders/" + order_id});
    return ValrResponseAdapter::parse_order_status(status_json, order_id);
}

std::vector<Core::OpenOrder> ValrGateway::get_open_orders() {
    return ValrResponseAdapter::parse_open_orders(request("GET", {"/orders/open"}));
}

std::vector<Core::OrderFill> ValrGateway::get_order_fills(const std::string& pair, const std::string& order_id) {
    const std::string order_fills_endpoint = "/orders/" + order_id + "/fills";
    const std::string trade_history_endpoint = "/account/" + pair + "/tradehistory";
    try {
        return ValrResponseAdapter::parse_fills(request("GET", {order_fills_endpoint}), order_id, false);
    } catch (const ApiError& api_exception_error) {
        if (api_exception_error.get_http_status() != 404) {
            throw;
        }
        ApiLogs::log_endpoint_fallback(order_fills_endpoint, trade_history_endpoint);
    }
    // Trade history covers the whole pair; only entries tagged with this order count
    return ValrResponseAdapter::parse_fills(request("GET", {trade_history_endpoint}), order_id, true);
}

} // namespace API
} // namespace ValrTrader
