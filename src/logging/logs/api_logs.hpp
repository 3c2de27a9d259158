#ifndef API_LOGS_HPP
#define API_LOGS_HPP

#include <string>

namespace ValrTrader {
namespace Logging {

/**
 * Exchange gateway call logging.
 * Every request attempt produces exactly one log_api_call line.
 */
class ApiLogs {
public:
    static void log_api_call(const std::string& method, const std::string& endpoint, long status_code,
                             long long latency_milliseconds, const std::string& outcome);
    static void log_retry_scheduled(const std::string& method, const std::string& endpoint, int attempt_number,
                                    int max_attempts, long long delay_milliseconds, const std::string& reason);
    static void log_rate_limit_wait(long long wait_milliseconds, int requests_in_window);
    static void log_endpoint_fallback(const std::string& failed_endpoint, const std::string& next_endpoint);
    static void log_response_warning(const std::string& context, const std::string& detail);
};

} // namespace Logging
} // namespace ValrTrader

#endif // API_LOGS_HPP
