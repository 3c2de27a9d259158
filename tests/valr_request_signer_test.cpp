#include <gtest/gtest.h>
#include "api/valr/valr_request_signer.hpp"

using ValrTrader::API::ValrRequestSigner;

namespace {
    const char* PUBLISHED_SECRET = "4961b74efac86b25cce8fbe4c9811c4c7a787b7a5996660afcc2e287ad864363";
}

// Reference signatures published with the exchange's authentication guide
TEST(ValrRequestSignerTest, signs_get_without_body) {
    ValrRequestSigner request_signer(PUBLISHED_SECRET);
    EXPECT_EQ(request_signer.sign("1558014486185", "GET", "/v1/account/balances", ""),
              "9d52c181ed69460b49307b7891f04658e938b21181173844b5018b2fe783a6d4"
              "c62b8e67a03de4d099e7437ebfabe12c56233b73c6a0cc0f7ae87e05f6289928");
}

TEST(ValrRequestSignerTest, signs_post_with_body) {
    ValrRequestSigner request_signer(PUBLISHED_SECRET);
    std::string order_body =
        "{\"customerOrderId\":\"ORDER-000001\",\"pair\":\"BTCZAR\",\"side\":\"BUY\",\"quoteAmount\":\"80000\"}";
    EXPECT_EQ(request_signer.sign("1558017528946", "POST", "/v1/orders/market", order_body),
              "be97d4cd9077a9eea7c4e199ddcfd87408cb638f2ec2f7f74dd44aef70a49fdc"
              "49960fd5de9b8b2845dc4a38b4fc7e56ef08f042a3c78a3af9aed23ca80822e8");
}

TEST(ValrRequestSignerTest, signature_is_lowercase_hex_of_sha512_length) {
    ValrRequestSigner request_signer("secret");
    std::string signature = request_signer.sign("1", "DELETE", "/v1/orders/order", "{}");
    ASSERT_EQ(signature.size(), 128u);
    for (char signature_char : signature) {
        EXPECT_TRUE((signature_char >= '0' && signature_char <= '9') || (signature_char >= 'a' && signature_char <= 'f'));
    }
    EXPECT_NE(signature, request_signer.sign("2", "DELETE", "/v1/orders/order", "{}"));
}
