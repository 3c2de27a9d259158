// HttpUtils.cpp
#include "http_utils.hpp"
#include "api/general/api_errors.hpp"
#include <curl/curl.h>
#include <string>
#include <stdexcept>

// Implement write_callback
size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* response_string) {
    response_string->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

HttpResponse perform_http_request(const HttpRequest& http_request) {
    CURL* curl_handle = curl_easy_init();
    if (!curl_handle) {
        throw ValrTrader::API::TransportError("Failed to initialize CURL for HTTP " + http_request.method + " request");
    }

    HttpResponse http_response;
    struct curl_slist* headers = nullptr;

    try {
        for (const std::string& header_line : http_request.headers) {
            headers = curl_slist_append(headers, header_line.c_str());
        }
        curl_easy_setopt(curl_handle, CURLOPT_URL, http_request.url.c_str());
        curl_easy_setopt(curl_handle, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl_handle, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl_handle, CURLOPT_WRITEDATA, &http_response.body);
        curl_easy_setopt(curl_handle, CURLOPT_TIMEOUT, static_cast<long>(http_request.timeout_seconds));
        curl_easy_setopt(curl_handle, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl_handle, CURLOPT_SSL_VERIFYPEER, http_request.enable_ssl_verification ? 1L : 0L);
        curl_easy_setopt(curl_handle, CURLOPT_SSL_VERIFYHOST, http_request.enable_ssl_verification ? 2L : 0L);

        if (http_request.method == "GET") {
            curl_easy_setopt(curl_handle, CURLOPT_HTTPGET, 1L);
        } else if (http_request.method == "POST") {
            curl_easy_setopt(curl_handle, CURLOPT_POST, 1L);
            curl_easy_setopt(curl_handle, CURLOPT_POSTFIELDS, http_request.body.c_str());
        } else {
            curl_easy_setopt(curl_handle, CURLOPT_CUSTOMREQUEST, http_request.method.c_str());
            if (!http_request.body.empty()) {
                curl_easy_setopt(curl_handle, CURLOPT_POSTFIELDS, http_request.body.c_str());
            }
        }

        CURLcode curl_result = curl_easy_perform(curl_handle);
        if (curl_result != CURLE_OK) {
            std::string error_message = "HTTP " + http_request.method + " failed: " + std::string(curl_easy_strerror(curl_result)) +
                                        " URL: " + http_request.url;
            curl_slist_free_all(headers);
            curl_easy_cleanup(curl_handle);
            throw ValrTrader::API::TransportError(error_message);
        }

        curl_easy_getinfo(curl_handle, CURLINFO_RESPONSE_CODE, &http_response.status_code);
        curl_slist_free_all(headers);
        curl_easy_cleanup(curl_handle);
        return http_response;
    } catch (const ValrTrader::API::TransportError&) {
        throw;
    } catch (...) {
        curl_slist_free_all(headers);
        curl_easy_cleanup(curl_handle);
        throw;
    }
}

void initialize_http_library() {
    CURLcode init_result = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (init_result != CURLE_OK) {
        throw std::runtime_error("curl_global_init failed: " + std::string(curl_easy_strerror(init_result)));
    }
}

void cleanup_http_library() {
    curl_global_cleanup();
}
