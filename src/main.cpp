#include <chrono>
#include <exception>
#include <string>
#include "browser/browser_client.hpp"
#include "browser/launcher/browser_launcher.hpp"
#include "core/config/config.hpp"
#include "core/logger/logger.hpp"
#include "engine/acquirer/content_acquirer.hpp"
#include "engine/pipeline/pipeline.hpp"
#include "limiter/rate_limiter.hpp"
#include "network/http/beast_client.hpp"
#include "server/http_server.hpp"

using namespace Reader;
using namespace Reader::Core;

namespace {

Browser::BrowserOptions make_browser_options(const Config& config) {
    Browser::BrowserOptions options;
    options.launch.path = config.browser_path;
    if (options.launch.path.empty())
        options.launch.path = Browser::Launcher::BrowserLauncher::find_browser();
    options.launch.headless    = config.headless;
    options.launch.timeout     = std::chrono::milliseconds(config.launch_timeout);
    options.navigation_timeout = std::chrono::milliseconds(config.navigation_timeout);
    options.max_browsers       = config.max_browsers;
    return options;
}

int run(const Config& config) {
    Logger::set_level(Logger::parse_level(config.log_level));

    auto browser_options = make_browser_options(config);
    if (browser_options.launch.path.empty()) {
        Logger::warn("No Chromium browser found. HTML pages will fail until --browser or "
                     "OVERRIDE_CHROME_EXECUTABLE_PATH is set.");
    }

    Network::Http::BeastClient http;
    http.set_timeout(std::chrono::milliseconds(config.probe_timeout));
    http.set_max_body_bytes(config.max_pdf_bytes);

    Browser::BrowserClient  renderer(browser_options);
    Engine::ContentAcquirer acquirer(http, renderer);
    Engine::Pipeline        pipeline(acquirer);

    Limiter::RateLimiterConfig limiter_config;
    limiter_config.window      = std::chrono::seconds(config.rate_window);
    limiter_config.capacity    = config.rate_limit;
    limiter_config.max_clients = config.rate_max_clients;
    Limiter::RateLimiter limiter(limiter_config);

    Server::ServerOptions server_options;
    server_options.bind_ip        = config.host;
    server_options.bind_port      = config.port;
    server_options.thread_count   = config.threads;
    server_options.max_body_bytes = config.max_body_bytes;

    Server::HttpServer server(pipeline, limiter, server_options);
    server.start();
    Logger::success("Reader " + std::string(Constants::VERSION) + " ready on port "
                    + std::to_string(server.get_port()));

    server.wait();
    server.stop();
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        auto config = Config::parse(argc, argv);
        return run(config);
    } catch (const std::exception& e) {
        Logger::error(e.what());
        return 1;
    }
}
