#include "browser_client.hpp"
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include "../core/logger/logger.hpp"
#include "../utils/text/string_utils.hpp"
#include "browser.hpp"
#include "cdp/cdp_client.hpp"
#include "page.hpp"

namespace Reader {
namespace Browser {

using namespace Reader::Core;
using Reader::Network::Http::ErrorType;
using Reader::Network::Http::HTTPCode;

namespace {
constexpr int SLOT_POLL_INTERVAL_MS = 50;

class SlotGuard {
public:
    explicit SlotGuard(std::atomic<int>& counter) : counter_(counter) {
    }
    ~SlotGuard() {
        counter_.fetch_sub(1);
    }

private:
    std::atomic<int>& counter_;
};
}  // namespace

BrowserClient::BrowserClient(BrowserOptions options) : options_(std::move(options)) {
    Logger::info("Initializing Chromium CDP Browser Engine (" + options_.launch.path + ")...");
}

boost::asio::awaitable<void> BrowserClient::acquire_slot() {
    if (options_.max_browsers <= 0) {
        active_.fetch_add(1);
        co_return;
    }

    boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
    bool                      announced = false;
    while (true) {
        int current = active_.load();
        if (current < options_.max_browsers
            && active_.compare_exchange_weak(current, current + 1)) {
            co_return;
        }
        if (!announced) {
            Logger::debug("Browser: all " + std::to_string(options_.max_browsers)
                          + " browser slots busy, waiting...");
            announced = true;
        }
        timer.expires_after(std::chrono::milliseconds(SLOT_POLL_INTERVAL_MS));
        co_await timer.async_wait(boost::asio::use_awaitable);
    }
}

boost::asio::awaitable<bool> BrowserClient::render_to_response(const std::string& url,
                                                               Response&          res) {
    try {
        auto browser = co_await Browser::launch(options_.launch);
        auto page    = co_await browser->new_page();

        // HeadlessChrome/... is the most common bot signal.
        std::string user_agent =
            Utils::Text::replace_icase(co_await browser->user_agent(), "Headless", "");
        if (!user_agent.empty())
            co_await page->set_user_agent(user_agent);

        Logger::info("Browser: Navigating to " + url);
        if (!co_await page->goto_url(url, options_.navigation_timeout)) {
            Logger::warn("Browser: DOM not ready after "
                         + std::to_string(options_.navigation_timeout.count())
                         + "ms, capturing current document for " + url);
        }

        res.body = co_await page->content();
        try {
            co_await page->close();
        } catch (const std::exception& e) {
            Logger::debug("Browser: closing page for " + url + " failed: " + e.what());
        }

        if (res.body.empty()) {
            res.error      = "Browser returned empty content";
            res.error_type = ErrorType::Render;
            co_return false;
        }

        co_return true;
    } catch (const NavigationError& e) {
        res.error      = e.what();
        res.error_type = ErrorType::Network;
    } catch (const CDP::CDPTimeout& e) {
        res.error      = std::string("DevTools timeout: ") + e.what();
        res.error_type = ErrorType::Timeout;
    } catch (const boost::system::system_error& e) {
        res.error      = std::string("DevTools connection: ") + e.what();
        res.error_type = ErrorType::Browser;
    } catch (const std::exception& e) {
        res.error      = std::string("Browser Engine Error: ") + e.what();
        res.error_type = ErrorType::Browser;
    }
    co_return false;
}

boost::asio::awaitable<Response> BrowserClient::render(const std::string& url) {
    co_await acquire_slot();
    SlotGuard slot(active_);

    Response res;
    res.effective_url = url;
    res.success       = co_await render_to_response(url, res);

    if (res.success) {
        res.status_code  = static_cast<long>(HTTPCode::Ok);
        res.content_type = "text/html";
    }
    else {
        if (res.status_code == 0)
            res.status_code = static_cast<long>(HTTPCode::BrowserError);
        Logger::error("Browser Error [" + url + "]: " + res.error);
    }

    co_return res;
}

}  // namespace Browser
}  // namespace Reader
