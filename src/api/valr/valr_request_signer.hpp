#ifndef VALR_REQUEST_SIGNER_HPP
#define VALR_REQUEST_SIGNER_HPP

#include <string>

namespace ValrTrader {
namespace API {

// HMAC-SHA512 over timestamp + METHOD + path + body, hex encoded.
class ValrRequestSigner {
public:
    explicit ValrRequestSigner(const std::string& secret) : api_secret(secret) {}

    std::string sign(const std::string& timestamp, const std::string& method,
                     const std::string& path, const std::string& body) const;

private:
    std::string api_secret;
};

} // namespace API
} // namespace ValrTrader

#endif // VALR_REQUEST_SIGNER_HPP
