#include "connection.hpp"
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <nlohmann/json.hpp>
#include "../core/errors/errors.hpp"
#include "../core/logger/logger.hpp"
#include "../utils/text/string_utils.hpp"
#include "http_server.hpp"

namespace Reader {
namespace Server {

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;

using namespace Reader::Core;

Connection::Connection(boost::asio::ip::tcp::socket socket, HttpServer* server)
    : stream_(std::move(socket)), server_(server) {
    boost::system::error_code ec;
    auto                      remote = stream_.socket().remote_endpoint(ec);
    client_id_                       = ec ? "unknown" : remote.address().to_string();
}

Connection::~Connection() {
    close();
}

void Connection::start() {
    boost::asio::co_spawn(
        stream_.get_executor(),
        [self = shared_from_this()]() { return self->start_impl(); },
        boost::asio::detached);
}

void Connection::close() {
    boost::system::error_code ec;
    if (stream_.socket().is_open()) {
        stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
        stream_.socket().close(ec);
    }
}

std::string Connection::url_from_body(const std::string& body) {
    auto json = nlohmann::json::parse(body, nullptr, false);
    if (!json.is_discarded()) {
        if (json.is_object()) {
            auto it = json.find("url");
            return it != json.end() && it->is_string() ? it->get<std::string>() : "";
        }
        if (json.is_string())
            return json.get<std::string>();
    }
    return Utils::Text::trim(body);
}

HttpResponse Connection::make_response(const HttpRequest& req,
                                       http::status       status,
                                       std::string        body) const {
    HttpResponse res{status, req.version()};
    res.set(http::field::server, std::string("reader/") + Constants::VERSION);
    res.set(http::field::content_type, "text/plain; charset=utf-8");
    res.keep_alive(req.keep_alive());
    if (body.empty() || body.back() != '\n')
        body += '\n';
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}

boost::asio::awaitable<HttpResponse> Connection::convert(const HttpRequest& req,
                                                         const std::string& raw_url) {
    Limiter::Admission admission = server_->limiter().admit(client_id_);
    if (!admission.allowed) {
        int retry_after = admission.retry_after_seconds;
        if (retry_after <= 0)
            retry_after = Constants::DEFAULT_RETRY_AFTER_SECONDS;
        Logger::warn("Rate limit exceeded for " + client_id_ + ", retry in "
                     + std::to_string(retry_after) + "s");
        auto res = make_response(req, http::status::too_many_requests, "Rate limit exceeded");
        res.set(http::field::retry_after, std::to_string(retry_after));
        co_return res;
    }

    try {
        std::string markdown = co_await server_->pipeline().run(raw_url);
        co_return make_response(req, http::status::ok, std::move(markdown));
    } catch (const InvalidUrlError& e) {
        Logger::warn("Rejected '" + raw_url + "': " + e.what());
        co_return make_response(req, http::status::bad_request, e.what());
    } catch (const FetchError& e) {
        Logger::error(e.what());
        co_return make_response(req, http::status::bad_gateway, e.what());
    } catch (const PdfParseError& e) {
        Logger::error(e.what());
        co_return make_response(req, http::status::internal_server_error, e.what());
    } catch (const std::exception& e) {
        Logger::error("Unexpected failure for '" + raw_url + "': " + e.what());
        co_return make_response(req, http::status::internal_server_error, "Internal server error");
    }
}

boost::asio::awaitable<HttpResponse> Connection::handle(const HttpRequest& req) {
    std::string target(req.target());
    Logger::info(std::string(req.method_string()) + " " + target + " from " + client_id_);

    if (req.method() == http::verb::get) {
        if (target.empty() || target == "/")
            co_return make_response(req, http::status::ok, Constants::USAGE_TEXT);
        // Everything after the first slash is the target URL, query string included.
        co_return co_await convert(req, target.substr(1));
    }

    if (req.method() == http::verb::post && (target == "/" || target.empty()))
        co_return co_await convert(req, url_from_body(req.body()));

    co_return make_response(req, http::status::not_found, "Not found");
}

boost::asio::awaitable<void> Connection::start_impl() {
    while (true) {
        http::request_parser<http::string_body> parser;
        parser.body_limit(server_->options().max_body_bytes);

        boost::system::error_code ec;
        stream_.expires_after(kReadTimeout);
        co_await http::async_read(
            stream_, buffer_, parser, net::redirect_error(net::use_awaitable, ec));

        if (ec == http::error::end_of_stream)
            break;
        if (ec == http::error::body_limit) {
            HttpRequest head;
            head.version(parser.get().version());
            head.keep_alive(false);
            auto res =
                make_response(head, http::status::payload_too_large, "Request body too large");
            co_await http::async_write(stream_, res, net::redirect_error(net::use_awaitable, ec));
            break;
        }
        if (ec) {
            if (ec != beast::error::timeout)
                Logger::debug("Connection " + client_id_ + ": read failed: " + ec.message());
            break;
        }

        HttpRequest req = parser.release();
        stream_.expires_never();

        HttpResponse res        = co_await handle(req);
        bool         keep_alive = res.keep_alive();

        co_await http::async_write(stream_, res, net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            Logger::debug("Connection " + client_id_ + ": write failed: " + ec.message());
            break;
        }
        if (!keep_alive)
            break;
    }
    close();
}

}  // namespace Server
}  // namespace Reader
