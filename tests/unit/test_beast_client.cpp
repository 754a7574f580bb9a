#include <gtest/gtest.h>
#include <openssl/ssl.h>
#include "../../src/network/http/beast_client.hpp"
#include "../fixtures/fakes.hpp"

using namespace Reader;
using namespace Reader::Network::Http;
using Reader::Testing::run_sync;

TEST(BeastClientTest, TlsContextAllowsModernVersions) {
    auto     ctx    = BeastClient::make_ssl_context();
    SSL_CTX* handle = ctx.native_handle();

    // No upper bound, so TLS 1.3-only hosts still negotiate.
    EXPECT_EQ(SSL_CTX_get_max_proto_version(handle), 0);

    auto options = SSL_CTX_get_options(handle);
    EXPECT_NE(options & SSL_OP_NO_SSLv3, 0u);
    EXPECT_NE(options & SSL_OP_NO_TLSv1, 0u);
    EXPECT_NE(options & SSL_OP_NO_TLSv1_1, 0u);
    EXPECT_EQ(options & SSL_OP_NO_TLSv1_2, 0u);
    EXPECT_EQ(options & SSL_OP_NO_TLSv1_3, 0u);

    EXPECT_EQ(SSL_CTX_get_verify_mode(handle), SSL_VERIFY_PEER);
}

TEST(BeastClientTest, RejectsNonHttpUrl) {
    BeastClient client;
    BodyFilter  accept_all = [](const std::string&) { return true; };
    Response    res        = run_sync(client.probe("ftp://example.com/file.pdf", accept_all));
    EXPECT_FALSE(res.success);
    EXPECT_EQ(res.error, "Invalid URL");
    EXPECT_EQ(res.error_type, ErrorType::Other);
}
