#include "http_server.hpp"
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <algorithm>
#include <stdexcept>
#include "../core/logger/logger.hpp"
#include "connection.hpp"

namespace Reader {
namespace Server {

using namespace Reader::Core;

HttpServer::HttpServer(Engine::Pipeline& pipeline, Limiter::RateLimiter& limiter, ServerOptions options)
    : pipeline_(pipeline),
      limiter_(limiter),
      options_(std::move(options)),
      acceptor_(io_context_),
      signals_(io_context_) {
}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::start() {
    try {
        boost::asio::ip::tcp::resolver resolver(io_context_);
        boost::asio::ip::tcp::endpoint endpoint =
            *resolver.resolve(options_.bind_ip, std::to_string(options_.bind_port)).begin();

        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(boost::asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();
    } catch (const std::exception& e) {
        throw std::runtime_error("Cannot listen on " + options_.bind_ip + ":"
                                 + std::to_string(options_.bind_port) + ": " + e.what());
    }

    port_ = acceptor_.local_endpoint().port();
    Logger::info("HttpServer: Listening on " + options_.bind_ip + ":" + std::to_string(port_));

    if (options_.handle_signals)
        init_signals();

    boost::asio::co_spawn(io_context_, do_accept(), boost::asio::detached);

    for (int i = 0; i < std::max(options_.thread_count, 1); ++i) {
        threads_.emplace_back([this]() {
            try {
                io_context_.run();
            } catch (const std::exception& e) {
                Logger::error("IO Thread Exception: " + std::string(e.what()));
            }
        });
    }
    Logger::info("Started " + std::to_string(threads_.size()) + " IO threads.");
}

void HttpServer::init_signals() {
    signals_.add(SIGINT);
    signals_.add(SIGTERM);
    signals_.async_wait([this](const boost::system::error_code& error, int signal_number) {
        if (!error) {
            Logger::info("Signal " + std::to_string(signal_number) + " received. Shutting down...");
            trigger_done();
        }
    });
}

void HttpServer::trigger_done() {
    {
        std::lock_guard<std::mutex> lock(done_mutex_);
        done_ = true;
    }
    done_cv_.notify_all();
}

void HttpServer::wait() {
    std::unique_lock<std::mutex> lock(done_mutex_);
    done_cv_.wait(lock, [this] { return done_.load(); });
}

void HttpServer::stop() {
    trigger_done();
    if (!io_context_.stopped()) {
        io_context_.stop();
    }
    for (auto& t : threads_) {
        if (t.joinable())
            t.join();
    }
    if (!threads_.empty())
        Logger::info("HttpServer: Stopped");
    threads_.clear();
}

int HttpServer::get_port() const {
    return port_;
}

boost::asio::awaitable<void> HttpServer::do_accept() {
    while (true) {
        try {
            auto socket = co_await acceptor_.async_accept(boost::asio::make_strand(io_context_),
                                                          boost::asio::use_awaitable);
            std::make_shared<Connection>(std::move(socket), this)->start();
        } catch (const boost::system::system_error& e) {
            if (e.code() == boost::asio::error::operation_aborted)
                co_return;
            Logger::error("HttpServer: Accept error: " + std::string(e.what()));
        }
    }
}

}  // namespace Server
}  // namespace Reader
