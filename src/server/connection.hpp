#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <chrono>
#include <memory>
#include <string>

namespace Reader {
namespace Server {

class HttpServer;

using HttpRequest  = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

class Connection : public std::enable_shared_from_this<Connection> {
public:
    static constexpr std::chrono::seconds kReadTimeout{30};

    Connection(boost::asio::ip::tcp::socket socket, HttpServer* server);
    ~Connection();

    void start();

    // URL carried by a POST body: {"url": "..."}, a JSON string, or plain text.
    static std::string url_from_body(const std::string& body);

private:
    boost::asio::awaitable<void>         start_impl();
    boost::asio::awaitable<HttpResponse> handle(const HttpRequest& req);
    boost::asio::awaitable<HttpResponse> convert(const HttpRequest& req, const std::string& raw_url);
    void                                 close();

    HttpResponse make_response(const HttpRequest&              req,
                               boost::beast::http::status      status,
                               std::string                     body) const;

    boost::beast::tcp_stream  stream_;
    boost::beast::flat_buffer buffer_;
    HttpServer*               server_;
    std::string               client_id_;
};

}  // namespace Server
}  // namespace Reader
