#pragma once
#include <atomic>
#include <chrono>
#include "../core/types/constants.hpp"
#include "../network/http/http_client.hpp"
#include "launcher/browser_launcher.hpp"

namespace Reader {
namespace Browser {

// Produces the post-script markup of a page. The result's body holds the
// serialized document on success.
class PageRenderer {
public:
    virtual ~PageRenderer() = default;

    virtual boost::asio::awaitable<Response> render(const std::string& url) = 0;
};

struct BrowserOptions {
    Launcher::LaunchOptions   launch;
    std::chrono::milliseconds navigation_timeout{Core::Constants::DEFAULT_NAVIGATION_TIMEOUT_MS};
    int                       max_browsers = Core::Constants::DEFAULT_MAX_BROWSERS;  // 0 = no cap
};

// Renders every request in a browser of its own, launched for that request
// and killed before render() returns.
class BrowserClient : public PageRenderer {
public:
    explicit BrowserClient(BrowserOptions options);
    ~BrowserClient() override = default;

    boost::asio::awaitable<Response> render(const std::string& url) override;

private:
    BrowserOptions   options_;
    std::atomic<int> active_{0};

    boost::asio::awaitable<void> acquire_slot();
    void                         release_slot();
    boost::asio::awaitable<bool> render_to_response(const std::string& url, Response& res);
};

}  // namespace Browser
}  // namespace Reader
