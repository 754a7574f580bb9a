#include "cdp_client.hpp"
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include "../../core/logger/logger.hpp"

namespace Reader {
namespace Browser {
namespace CDP {

namespace beast     = boost::beast;
namespace net       = boost::asio;
namespace websocket = beast::websocket;
using tcp           = net::ip::tcp;

using namespace Reader::Core;

CDPClient::CDPClient(net::any_io_executor executor)
    : executor_(executor), ws_(executor), notify_(executor) {
}

CDPClient::~CDPClient() {
    close();
}

net::awaitable<void> CDPClient::connect(const std::string&        host,
                                        int                       port,
                                        const std::string&        path,
                                        std::chrono::milliseconds timeout) {
    tcp::resolver resolver(executor_);
    auto results = co_await resolver.async_resolve(host, std::to_string(port), net::use_awaitable);

    beast::get_lowest_layer(ws_).expires_after(timeout);
    co_await beast::get_lowest_layer(ws_).async_connect(results, net::use_awaitable);

    // The websocket keeps its own idle timers from here on.
    beast::get_lowest_layer(ws_).expires_never();
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    ws_.read_message_max(kMaxMessageBytes);

    co_await ws_.async_handshake(host + ":" + std::to_string(port), path, net::use_awaitable);
    connected_ = true;

    net::co_spawn(
        executor_, [self = shared_from_this()]() { return self->read_loop(); }, net::detached);
}

net::awaitable<void> CDPClient::read_loop() {
    beast::flat_buffer buffer;
    while (connected_) {
        beast::error_code ec;
        co_await ws_.async_read(buffer, net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            if (connected_ && ec != websocket::error::closed)
                Logger::debug("CDP: connection lost: " + ec.message());
            last_error_ = ec.message();
            connected_  = false;
            break;
        }

        auto message = nlohmann::json::parse(beast::buffers_to_string(buffer.data()), nullptr, false);
        buffer.consume(buffer.size());
        if (message.is_discarded()) {
            Logger::warn("CDP: dropping malformed message");
            continue;
        }
        dispatch(std::move(message));
        notify_.cancel();
    }
    notify_.cancel();
}

void CDPClient::dispatch(nlohmann::json message) {
    if (message.contains("id") && message["id"].is_number_integer()) {
        responses_[message["id"].get<int>()] = std::move(message);
        return;
    }
    if (!message.contains("method"))
        return;

    events_.push_back(std::move(message));
    if (events_.size() > kMaxQueuedEvents)
        events_.pop_front();
}

net::awaitable<bool> CDPClient::wait_until(const std::function<bool()>&          ready,
                                           std::chrono::steady_clock::time_point deadline) {
    while (!ready()) {
        if (!connected_)
            throw CDPError("DevTools connection closed" + (last_error_.empty() ? "" : ": " + last_error_));
        if (std::chrono::steady_clock::now() >= deadline)
            co_return false;

        notify_.expires_at(deadline);
        boost::system::error_code ec;
        co_await notify_.async_wait(net::redirect_error(net::use_awaitable, ec));
    }
    co_return true;
}

net::awaitable<nlohmann::json> CDPClient::call(const std::string&        method,
                                               nlohmann::json            params,
                                               const std::string&        session_id,
                                               std::chrono::milliseconds timeout) {
    if (!connected_)
        throw CDPError("DevTools connection is not open");

    const int      id      = current_id_++;
    nlohmann::json request = {{"id", id}, {"method", method}, {"params", std::move(params)}};
    if (!session_id.empty())
        request["sessionId"] = session_id;

    Logger::debug("CDP: -> " + method);
    co_await ws_.async_write(net::buffer(request.dump()), net::use_awaitable);

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    bool       answered = co_await wait_until([&] { return responses_.count(id) > 0; }, deadline);
    if (!answered)
        throw CDPTimeout(method + " timed out after " + std::to_string(timeout.count()) + "ms");

    nlohmann::json reply = std::move(responses_[id]);
    responses_.erase(id);

    if (reply.contains("error")) {
        throw CDPError(method + " failed: " + reply["error"].value("message", reply["error"].dump()));
    }
    co_return reply.value("result", nlohmann::json::object());
}

net::awaitable<bool> CDPClient::wait_for_event(const std::string&        method,
                                               const std::string&        session_id,
                                               std::chrono::milliseconds timeout,
                                               const EventFilter&        filter) {
    auto matches = [&](const nlohmann::json& event) {
        if (event.value("method", "") != method)
            return false;
        if (event.value("sessionId", "") != session_id)
            return false;
        return !filter || filter(event.value("params", nlohmann::json::object()));
    };

    auto take_match = [&]() {
        for (auto it = events_.begin(); it != events_.end(); ++it) {
            if (matches(*it)) {
                events_.erase(it);
                return true;
            }
        }
        return false;
    };

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    co_return co_await wait_until(take_match, deadline);
}

void CDPClient::discard_events(const std::string& session_id) {
    std::erase_if(events_, [&](const nlohmann::json& event) {
        return event.value("sessionId", "") == session_id;
    });
}

void CDPClient::close() noexcept {
    connected_ = false;
    beast::error_code ec;
    beast::get_lowest_layer(ws_).socket().shutdown(tcp::socket::shutdown_both, ec);
    beast::get_lowest_layer(ws_).socket().close(ec);
    notify_.cancel();
}

}  // namespace CDP
}  // namespace Browser
}  // namespace Reader
