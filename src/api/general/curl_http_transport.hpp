#ifndef CURL_HTTP_TRANSPORT_HPP
#define CURL_HTTP_TRANSPORT_HPP

#include "api/general/http_transport_interface.hpp"
#include "utils/http_utils.hpp"

namespace ValrTrader {
namespace API {

class CurlHttpTransport : public HttpTransportInterface {
public:
    HttpResponse perform(const HttpRequest& http_request) override {
        return perform_http_request(http_request);
    }
};

} // namespace API
} // namespace ValrTrader

#endif // CURL_HTTP_TRANSPORT_HPP
