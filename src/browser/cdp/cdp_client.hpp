#pragma once

#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace Reader {
namespace Browser {
namespace CDP {

class CDPError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class CDPTimeout : public CDPError {
public:
    using CDPError::CDPError;
};

// Chrome DevTools Protocol connection over a single WebSocket. Page sessions
// are multiplexed on it with flattened session ids. Calls are meant to be
// issued one at a time from the coroutine that owns the client.
class CDPClient : public std::enable_shared_from_this<CDPClient> {
public:
    static constexpr std::chrono::milliseconds kDefaultTimeout{10000};
    static constexpr size_t                    kMaxMessageBytes = 256 * 1024 * 1024;
    static constexpr size_t                    kMaxQueuedEvents = 1024;

    using EventFilter = std::function<bool(const nlohmann::json& params)>;

    explicit CDPClient(boost::asio::any_io_executor executor);
    ~CDPClient();

    CDPClient(const CDPClient&)            = delete;
    CDPClient& operator=(const CDPClient&) = delete;

    boost::asio::awaitable<void> connect(const std::string&        host,
                                         int                       port,
                                         const std::string&        path,
                                         std::chrono::milliseconds timeout = kDefaultTimeout);

    // Sends `method` and waits for its reply. Throws CDPError when the browser
    // answers with an error, CDPTimeout when no reply arrives in time.
    boost::asio::awaitable<nlohmann::json> call(const std::string&        method,
                                                nlohmann::json            params = nlohmann::json::object(),
                                                const std::string&        session_id = "",
                                                std::chrono::milliseconds timeout    = kDefaultTimeout);

    // Waits for an event, including ones that arrived before the call. Returns
    // false on timeout.
    boost::asio::awaitable<bool> wait_for_event(const std::string&        method,
                                                const std::string&        session_id,
                                                std::chrono::milliseconds timeout,
                                                const EventFilter&        filter = {});

    // Drops queued events for a session so later waits only see new ones.
    void discard_events(const std::string& session_id);

    void close() noexcept;
    bool is_connected() const {
        return connected_;
    }

private:
    boost::asio::awaitable<void> read_loop();
    void                         dispatch(nlohmann::json message);
    boost::asio::awaitable<bool> wait_until(const std::function<bool()>&          ready,
                                            std::chrono::steady_clock::time_point deadline);

    boost::asio::any_io_executor                              executor_;
    boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
    boost::asio::steady_timer                                 notify_;
    bool                                                      connected_ = false;
    std::string                                               last_error_;

    int current_id_ = 1;

    std::map<int, nlohmann::json> responses_;
    std::deque<nlohmann::json>    events_;
};

}  // namespace CDP
}  // namespace Browser
}  // namespace Reader
