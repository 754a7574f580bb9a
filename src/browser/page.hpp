#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <stdexcept>
#include <string>

namespace Reader {

// The browser reported a navigation failure (DNS, refused connection, ...).
class NavigationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class Page {
public:
    virtual ~Page() = default;

    virtual boost::asio::awaitable<void> set_user_agent(const std::string& user_agent) = 0;

    // Returns false when the DOM was not ready within `timeout`; the page keeps
    // whatever it loaded so far. Throws NavigationError when the load failed.
    virtual boost::asio::awaitable<bool> goto_url(const std::string&        url,
                                                  std::chrono::milliseconds timeout) = 0;

    // Serialized markup of the current document, doctype included.
    virtual boost::asio::awaitable<std::string> content() = 0;
    virtual boost::asio::awaitable<void>        close()   = 0;

    virtual boost::asio::awaitable<std::string> evaluate(const std::string& script) = 0;
};

}  // namespace Reader
