#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <chrono>
#include <functional>
#include <string>

namespace Reader {
namespace Network {
namespace Http {

enum class ErrorType { None, Network, Timeout, TooLarge, Other, Render, Browser };

enum class HTTPCode { Ok = 200, BrowserError = 599 };

}  // namespace Http
}  // namespace Network
}  // namespace Reader

namespace Reader {

struct Response {
    std::string              effective_url;
    long                     status_code = 0;
    std::string              content_type;
    std::string              location;
    std::string              body;
    std::string              error;
    bool                     success    = false;
    bool                     skipped    = false;
    Network::Http::ErrorType error_type = Network::Http::ErrorType::None;
};

namespace Network {
namespace Http {

// Decides from the content-type header whether a response body is wanted.
using BodyFilter = std::function<bool(const std::string& content_type)>;

class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual void set_timeout(std::chrono::milliseconds /*timeout*/) {};

    // GET that stops after the response headers unless `accept` approves the
    // content type. A rejected response comes back with `skipped` set and an
    // empty body.
    virtual boost::asio::awaitable<Response> probe(const std::string& url,
                                                   const BodyFilter&  accept) = 0;
};

}  // namespace Http
}  // namespace Network
}  // namespace Reader
