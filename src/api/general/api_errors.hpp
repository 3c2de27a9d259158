#ifndef API_ERRORS_HPP
#define API_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace ValrTrader {
namespace API {

// Base of every failure surfaced by the exchange gateway.
class ExchangeError : public std::runtime_error {
public:
    explicit ExchangeError(const std::string& message) : std::runtime_error(message) {}
};

// Network-level failure of a single HTTP exchange. Retried by the gateway.
class TransportError : public ExchangeError {
public:
    explicit TransportError(const std::string& message) : ExchangeError(message) {}
};

// Transport retries exhausted.
class ConnectionError : public ExchangeError {
public:
    explicit ConnectionError(const std::string& message) : ExchangeError(message) {}
};

// Still rate limited (HTTP 429) after the retry budget.
class RateLimitError : public ExchangeError {
public:
    explicit RateLimitError(const std::string& message) : ExchangeError(message) {}
};

// Non-2xx application response, or a body that cannot be interpreted.
class ApiError : public ExchangeError {
public:
    ApiError(const std::string& message, const std::string& code, int status)
        : ExchangeError(message), error_code(code), http_status(status) {}

    const std::string& get_error_code() const { return error_code; }
    int get_http_status() const { return http_status; }

private:
    std::string error_code;
    int http_status;
};

} // namespace API
} // namespace ValrTrader

#endif // API_ERRORS_HPP
