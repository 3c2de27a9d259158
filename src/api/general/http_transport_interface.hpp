#ifndef HTTP_TRANSPORT_INTERFACE_HPP
#define HTTP_TRANSPORT_INTERFACE_HPP

#include <memory>
#include "utils/http_utils.hpp"

namespace ValrTrader {
namespace API {

// Performs one HTTP exchange. Throws TransportError when no response arrives.
class HttpTransportInterface {
public:
    virtual ~HttpTransportInterface() = default;

    virtual HttpResponse perform(const HttpRequest& http_request) = 0;
};

using HttpTransportPtr = std::unique_ptr<HttpTransportInterface>;

} // namespace API
} // namespace ValrTrader

#endif // HTTP_TRANSPORT_INTERFACE_HPP
