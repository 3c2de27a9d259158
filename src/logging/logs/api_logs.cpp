#include "api_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include <sstream>

namespace ValrTrader {
namespace Logging {

void ApiLogs::log_api_call(const std::string& method, const std::string& endpoint, long status_code,
                           long long latency_milliseconds, const std::string& outcome) {
    std::ostringstream oss;
    oss << "API_CALL: " << method << " " << endpoint
        << " | status=" << status_code
        << " | latency=" << latency_milliseconds << "ms"
        << " | " << outcome;
    log_message(oss.str(), "");
}

void ApiLogs::log_retry_scheduled(const std::string& method, const std::string& endpoint, int attempt_number,
                                  int max_attempts, long long delay_milliseconds, const std::string& reason) {
    std::ostringstream oss;
    oss << "WARNING: API retry " << attempt_number << "/" << max_attempts << " for " << method << " " << endpoint
        << " in " << delay_milliseconds << "ms (" << reason << ")";
    log_message(oss.str(), "");
}

void ApiLogs::log_rate_limit_wait(long long wait_milliseconds, int requests_in_window) {
    log_message("RATE_LIMIT: " + std::to_string(requests_in_window) + " requests in window, waited " +
                std::to_string(wait_milliseconds) + "ms", "");
}

void ApiLogs::log_endpoint_fallback(const std::string& failed_endpoint, const std::string& next_endpoint) {
    log_message("API_FALLBACK: " + failed_endpoint + " returned 404, trying " + next_endpoint, "");
}

void ApiLogs::log_response_warning(const std::string& context, const std::string& detail) {
    log_message("WARNING: " + context + ": " + detail, "");
}

} // namespace Logging
} // namespace ValrTrader
