#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <string>
#include "../../core/types/constants.hpp"
#include "../../utils/url/url.hpp"
#include "http_client.hpp"

namespace Reader {
namespace Network {
namespace Http {

class BeastClient : public HttpClient {
public:
    BeastClient();
    ~BeastClient() override = default;

    // Covers name resolution, connect, TLS handshake and the response head.
    void set_timeout(std::chrono::milliseconds timeout) override;
    void set_max_body_bytes(size_t bytes);

    boost::asio::awaitable<Response> probe(const std::string& url,
                                           const BodyFilter&  accept) override;

    // TLS 1.2 or newer, peer verification against the system trust store.
    static boost::asio::ssl::context make_ssl_context();

private:
    std::chrono::milliseconds timeout_{Core::Constants::DEFAULT_PROBE_TIMEOUT_MS};
    std::chrono::milliseconds body_timeout_{std::chrono::seconds(60)};
    size_t                    max_body_bytes_ = Core::Constants::DEFAULT_MAX_PDF_BYTES;
    boost::asio::ssl::context ssl_ctx_{make_ssl_context()};

    boost::asio::awaitable<Response> do_request_impl(const Utils::TargetUrl& url,
                                                     const BodyFilter&       accept);

    boost::asio::awaitable<Response> perform_http_request(const Utils::TargetUrl& url,
                                                          const BodyFilter&       accept,
                                                          Response                response);
    boost::asio::awaitable<Response> perform_https_request(const Utils::TargetUrl& url,
                                                           const BodyFilter&       accept,
                                                           Response                response);
};

}  // namespace Http
}  // namespace Network
}  // namespace Reader
