#include "valr_request_signer.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace ValrTrader {
namespace API {

std::string ValrRequestSigner::sign(const std::string& timestamp, const std::string& method,
                                    const std::string& path, const std::string& body) const {
    std::string payload = timestamp + method + path + body;

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    unsigned char* hmac_result = HMAC(EVP_sha512(),
                                      api_secret.data(), static_cast<int>(api_secret.size()),
                                      reinterpret_cast<const unsigned char*>(payload.data()), payload.size(),
                                      digest, &digest_len);
    if (hmac_result == nullptr) {
        throw std::runtime_error("HMAC-SHA512 signing failed for " + method + " " + path);
    }

    std::ostringstream out;
    for (unsigned int i = 0; i < digest_len; ++i) {
        out << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return out.str();
}

} // namespace API
} // namespace ValrTrader
