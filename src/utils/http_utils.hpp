#ifndef HTTP_UTILS_HPP
#define HTTP_UTILS_HPP

#include <string>
#include <vector>

// HTTP request wrapper to avoid multi-parameter functions
struct HttpRequest {
    std::string method;                  // GET, POST or DELETE
    std::string url;
    std::vector<std::string> headers;    // "Name: value" lines
    std::string body;                    // Empty for requests without a body
    int timeout_seconds;
    bool enable_ssl_verification;

    HttpRequest(const std::string& m,
                const std::string& u,
                std::vector<std::string> h = {},
                std::string b = "",
                int timeout = 30,
                bool ssl_verify = true)
        : method(m), url(u), headers(std::move(h)), body(std::move(b)),
          timeout_seconds(timeout), enable_ssl_verification(ssl_verify) {}
};

struct HttpResponse {
    long status_code = 0;
    std::string body;
};

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* s);

// Single curl exchange. Throws ValrTrader::API::TransportError if no response arrives.
HttpResponse perform_http_request(const HttpRequest& http_request);

// Process-wide libcurl setup and teardown
void initialize_http_library();
void cleanup_http_library();

#endif // HTTP_UTILS_HPP
