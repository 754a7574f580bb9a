#include "beast_client.hpp"
#include <memory>
#include "../../core/logger/logger.hpp"
#include "../../utils/url/url.hpp"

namespace Reader {
namespace Network {
namespace Http {

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
namespace ssl   = net::ssl;
using tcp       = net::ip::tcp;

using namespace Reader::Core;

namespace {

bool is_redirect(long status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

std::string strip_brackets(const std::string& host) {
    if (host.size() > 2 && host.front() == '[' && host.back() == ']')
        return host.substr(1, host.size() - 2);
    return host;
}

Response error_response(const std::string& url, const std::string& error, ErrorType type) {
    Response response;
    response.effective_url = url;
    response.error         = error;
    response.error_type    = type;
    return response;
}

// Host carries the port whenever it is not the scheme default (RFC 7230 5.4).
std::string host_header(const Utils::TargetUrl& url) {
    return url.port.empty() ? url.host : url.host + ":" + url.port;
}

http::request<http::empty_body> make_request(const Utils::TargetUrl& url) {
    http::request<http::empty_body> req{http::verb::get, url.request_target(), 11};
    req.set(http::field::host, host_header(url));
    req.set(http::field::user_agent, Constants::USER_AGENT);
    req.set(http::field::accept, "*/*");
    return req;
}

// Name lookup runs on Asio's resolver thread, outside any stream deadline, and
// a blocked getaddrinfo cannot be cancelled. The caller stops waiting at
// `deadline`; a late result is dropped.
net::awaitable<tcp::resolver::results_type> resolve(const std::string&                    host,
                                                    const std::string&                    port,
                                                    std::chrono::steady_clock::time_point deadline) {
    struct Lookup {
        explicit Lookup(const net::any_io_executor& executor)
            : resolver(executor), wake(executor, net::steady_timer::time_point::max()) {
        }

        tcp::resolver               resolver;
        net::steady_timer           wake;
        tcp::resolver::results_type results;
        beast::error_code           ec;
        bool                        done      = false;
        bool                        timed_out = false;
    };

    auto executor = co_await net::this_coro::executor;
    auto lookup   = std::make_shared<Lookup>(executor);

    lookup->resolver.async_resolve(
        host, port, [lookup](const beast::error_code& ec, tcp::resolver::results_type results) {
            lookup->done    = true;
            lookup->ec      = ec;
            lookup->results = std::move(results);
            lookup->wake.cancel();
        });

    net::steady_timer deadline_timer(executor, deadline);
    deadline_timer.async_wait([lookup](const beast::error_code& ec) {
        if (ec)
            return;
        lookup->timed_out = true;
        lookup->wake.cancel();
    });

    while (!lookup->done && !lookup->timed_out) {
        beast::error_code ignored;
        co_await lookup->wake.async_wait(net::redirect_error(net::use_awaitable, ignored));
    }
    deadline_timer.cancel();

    if (!lookup->done) {
        lookup->resolver.cancel();
        throw beast::system_error(beast::error_code(beast::error::timeout));
    }
    if (lookup->ec)
        throw beast::system_error(lookup->ec);
    co_return lookup->results;
}

// Reads headers first; the body is only pulled off the wire when `accept`
// approves the content type.
template <class Stream>
net::awaitable<Response> read_response(Stream&                   stream,
                                       beast::tcp_stream&        lowest,
                                       const BodyFilter&         accept,
                                       size_t                    max_body_bytes,
                                       std::chrono::milliseconds body_timeout,
                                       Response                  response,
                                       bool&                     complete) {
    beast::flat_buffer                        buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(max_body_bytes);

    co_await http::async_read_header(stream, buffer, parser, net::use_awaitable);

    const auto& header   = parser.get();
    response.status_code = header.result_int();
    response.success     = (response.status_code >= 200 && response.status_code < 400);
    auto ct              = header.find(http::field::content_type);
    if (ct != header.end())
        response.content_type = std::string(ct->value());
    auto loc = header.find(http::field::location);
    if (loc != header.end())
        response.location = std::string(loc->value());

    if (is_redirect(response.status_code) || (accept && !accept(response.content_type))) {
        response.skipped = true;
        complete         = false;
        co_return response;
    }

    lowest.expires_after(body_timeout);
    co_await http::async_read(stream, buffer, parser, net::use_awaitable);
    response.body = std::move(parser.get().body());
    complete      = true;
    co_return response;
}

}  // namespace

ssl::context BeastClient::make_ssl_context() {
    ssl::context ctx{ssl::context::tls_client};
    ctx.set_options(ssl::context::default_workarounds | ssl::context::no_sslv2
                    | ssl::context::no_sslv3 | ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1);
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(ssl::verify_peer);
    return ctx;
}

BeastClient::BeastClient() = default;

void BeastClient::set_timeout(std::chrono::milliseconds timeout) {
    timeout_ = timeout;
}

void BeastClient::set_max_body_bytes(size_t bytes) {
    max_body_bytes_ = bytes;
}

net::awaitable<Response> BeastClient::probe(const std::string& url, const BodyFilter& accept) {
    auto current = Utils::Url::parse_absolute(url);
    if (!current)
        co_return error_response(url, "Invalid URL", ErrorType::Other);

    for (int hop = 0; hop <= Constants::MAX_REDIRECTS; ++hop) {
        Response res = co_await do_request_impl(*current, accept);
        if (!is_redirect(res.status_code) || res.location.empty())
            co_return res;

        auto next = Utils::Url::resolve(*current, res.location);
        if (!next) {
            Logger::debug("HTTP: unusable redirect from " + current->to_string() + " to "
                          + res.location);
            co_return res;
        }
        Logger::debug("HTTP: " + std::to_string(res.status_code) + " " + current->to_string()
                      + " -> " + next->to_string());
        current = std::move(next);
    }

    co_return error_response(current->to_string(), "Too many redirects", ErrorType::Network);
}

net::awaitable<Response> BeastClient::do_request_impl(const Utils::TargetUrl& url,
                                                      const BodyFilter&       accept) {
    Response response;
    response.effective_url = url.scheme + "://" + url.host + ":" + url.effective_port()
                             + url.request_target();

    try {
        if (!url.is_https()) {
            co_return co_await perform_http_request(url, accept, response);
        }
        co_return co_await perform_https_request(url, accept, response);
    } catch (const boost::system::system_error& e) {
        response.success = false;
        response.error   = e.what();
        if (e.code() == beast::error::timeout)
            response.error_type = ErrorType::Timeout;
        else if (e.code() == http::error::body_limit)
            response.error_type = ErrorType::TooLarge;
        else
            response.error_type = ErrorType::Network;
        co_return response;
    } catch (const std::exception& e) {
        response.success    = false;
        response.error      = e.what();
        response.error_type = ErrorType::Network;
        co_return response;
    }
}

net::awaitable<Response> BeastClient::perform_http_request(const Utils::TargetUrl& url,
                                                           const BodyFilter&       accept,
                                                           Response                response) {
    beast::tcp_stream stream(co_await net::this_coro::executor);

    auto deadline = std::chrono::steady_clock::now() + timeout_;
    auto results  = co_await resolve(strip_brackets(url.host), url.effective_port(), deadline);
    stream.expires_at(deadline);
    co_await stream.async_connect(results, net::use_awaitable);

    auto req = make_request(url);
    co_await http::async_write(stream, req, net::use_awaitable);

    bool complete = false;
    response      = co_await read_response(
        stream, stream, accept, max_body_bytes_, body_timeout_, std::move(response), complete);

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    co_return response;
}

net::awaitable<Response> BeastClient::perform_https_request(const Utils::TargetUrl& url,
                                                            const BodyFilter&       accept,
                                                            Response                response) {
    beast::ssl_stream<beast::tcp_stream> ssl_stream(co_await net::this_coro::executor, ssl_ctx_);

    const std::string sni_host = strip_brackets(url.host);
    if (!SSL_set_tlsext_host_name(ssl_stream.native_handle(), sni_host.c_str())) {
        throw beast::system_error(
            beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()));
    }

    auto& lowest   = beast::get_lowest_layer(ssl_stream);
    auto  deadline = std::chrono::steady_clock::now() + timeout_;
    auto  results  = co_await resolve(sni_host, url.effective_port(), deadline);
    lowest.expires_at(deadline);
    co_await lowest.async_connect(results, net::use_awaitable);
    co_await ssl_stream.async_handshake(ssl::stream_base::client, net::use_awaitable);

    auto req = make_request(url);
    co_await http::async_write(ssl_stream, req, net::use_awaitable);

    bool complete = false;
    response      = co_await read_response(
        ssl_stream, lowest, accept, max_body_bytes_, body_timeout_, std::move(response), complete);

    if (complete) {
        // Many servers drop the connection without a close_notify.
        lowest.expires_after(timeout_);
        beast::error_code ec;
        co_await ssl_stream.async_shutdown(net::redirect_error(net::use_awaitable, ec));
        if (ec && ec != net::ssl::error::stream_truncated)
            Logger::debug("HTTP: TLS shutdown for " + url.host + ": " + ec.message());
    }
    co_return response;
}

}  // namespace Http
}  // namespace Network
}  // namespace Reader
