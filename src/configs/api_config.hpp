#ifndef API_CONFIG_HPP
#define API_CONFIG_HPP

#include <string>

namespace ValrTrader {
namespace Config {

struct ApiConfig {
    std::string base_url = "https://api.valr.com";   // Exchange REST root
    std::string api_version = "v1";                   // Path prefix, part of the signed path
    std::string api_key;                              // Overridden by VALR_API_KEY
    std::string api_secret;                           // Overridden by VALR_API_SECRET

    int request_timeout_seconds = 30;
    int max_retries = 3;                              // Retries after the first attempt
    int retry_base_delay_milliseconds = 1000;         // Delay before the first retry
    double retry_backoff_factor = 2.0;                // Multiplier per retry, must be > 1
    int rate_limit_requests_per_window = 600;
    int rate_limit_window_seconds = 60;
    bool enable_ssl_verification = true;
};

} // namespace Config
} // namespace ValrTrader

#endif // API_CONFIG_HPP
