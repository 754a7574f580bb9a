#pragma once

#include <atomic>
#include <utility>
#include <boost/asio.hpp>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "../core/types/constants.hpp"
#include "../engine/pipeline/pipeline.hpp"
#include "../limiter/rate_limiter.hpp"

namespace Reader {
namespace Server {

struct ServerOptions {
    std::string bind_ip        = Core::Constants::DEFAULT_HOST;
    int         bind_port      = Core::Constants::DEFAULT_PORT;
    int         thread_count   = Core::Constants::DEFAULT_THREADS;
    size_t      max_body_bytes = Core::Constants::DEFAULT_MAX_BODY_BYTES;
    bool        handle_signals = true;
};

class Connection;

// HTTP/1.1 front end. Every accepted connection runs on its own strand.
class HttpServer {
public:
    HttpServer(Engine::Pipeline& pipeline, Limiter::RateLimiter& limiter, ServerOptions options);
    ~HttpServer();

    HttpServer(const HttpServer&)            = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Binds and starts the IO threads. Throws std::runtime_error when the
    // address cannot be bound.
    void start();
    // Blocks until stop() is called or SIGINT/SIGTERM arrives.
    void wait();
    void stop();
    int  get_port() const;

    Engine::Pipeline& pipeline() {
        return pipeline_;
    }
    Limiter::RateLimiter& limiter() {
        return limiter_;
    }
    const ServerOptions& options() const {
        return options_;
    }

private:
    boost::asio::awaitable<void> do_accept();
    void                         init_signals();
    void                         trigger_done();

    Engine::Pipeline&     pipeline_;
    Limiter::RateLimiter& limiter_;
    ServerOptions         options_;
    int                   port_ = 0;

    boost::asio::io_context        io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::signal_set        signals_;
    std::vector<std::thread>       threads_;

    std::atomic<bool>       done_{false};
    std::mutex              done_mutex_;
    std::condition_variable done_cv_;
};

}  // namespace Server
}  // namespace Reader
