#include "browser.hpp"
#include <boost/asio/this_coro.hpp>
#include "../core/logger/logger.hpp"
#include "cdp/cdp_client.hpp"

namespace Reader {
namespace Browser {

using namespace Reader::Core;
using CDP::CDPClient;

namespace {
constexpr char kSerializeDocument[] =
    "(document.doctype ? new XMLSerializer().serializeToString(document.doctype) : '') + "
    "(document.documentElement ? document.documentElement.outerHTML : '')";
}

class PageImpl : public Page {
public:
    PageImpl(std::shared_ptr<CDPClient> cdp, std::string target_id, std::string session_id)
        : cdp_(std::move(cdp)), target_id_(std::move(target_id)), session_id_(std::move(session_id)) {
    }

    boost::asio::awaitable<void> set_user_agent(const std::string& user_agent) override {
        nlohmann::json params = {{"userAgent", user_agent}};
        co_await cdp_->call("Emulation.setUserAgentOverride", params, session_id_);
    }

    boost::asio::awaitable<bool> goto_url(const std::string&        url,
                                          std::chrono::milliseconds timeout) override {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        cdp_->discard_events(session_id_);

        nlohmann::json result;
        nlohmann::json params = {{"url", url}};
        try {
            result = co_await cdp_->call("Page.navigate", params, session_id_, timeout);
        } catch (const CDP::CDPTimeout&) {
            co_return false;
        }

        std::string error_text = result.value("errorText", "");
        if (!error_text.empty())
            throw NavigationError("Navigation to " + url + " failed: " + error_text);

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0)
            co_return false;

        co_return co_await cdp_->wait_for_event("Page.domContentEventFired", session_id_, remaining);
    }

    boost::asio::awaitable<std::string> content() override {
        co_return co_await evaluate(kSerializeDocument);
    }

    boost::asio::awaitable<void> close() override {
        if (!cdp_->is_connected())
            co_return;
        nlohmann::json params = {{"targetId", target_id_}};
        co_await cdp_->call("Target.closeTarget", params);
    }

    boost::asio::awaitable<std::string> evaluate(const std::string& script) override {
        nlohmann::json params = {{"expression", script}, {"returnByValue", true}};
        auto result = co_await cdp_->call("Runtime.evaluate", params, session_id_);

        if (result.contains("exceptionDetails")) {
            throw CDP::CDPError("Script threw: "
                                + result["exceptionDetails"].value("text", std::string("exception")));
        }
        const auto& value = result["result"];
        if (!value.contains("value"))
            co_return "";
        if (value["value"].is_string())
            co_return value["value"].get<std::string>();
        co_return value["value"].dump();
    }

private:
    std::shared_ptr<CDPClient> cdp_;
    std::string                target_id_;
    std::string                session_id_;
};

Browser::Browser(std::unique_ptr<Launcher::BrowserProcess> process, std::shared_ptr<CDPClient> cdp)
    : process_(std::move(process)), cdp_(std::move(cdp)) {
}

Browser::~Browser() {
    close();
}

boost::asio::awaitable<std::unique_ptr<Browser>>
Browser::launch(const Launcher::LaunchOptions& options) {
    auto process = co_await Launcher::BrowserLauncher::launch(options);

    auto cdp = std::make_shared<CDPClient>(co_await boost::asio::this_coro::executor);
    co_await cdp->connect(kDevToolsHost, process->devtools_port(), process->devtools_path(),
                          options.timeout);

    co_return std::unique_ptr<Browser>(new Browser(std::move(process), std::move(cdp)));
}

boost::asio::awaitable<std::unique_ptr<Page>> Browser::new_page() {
    nlohmann::json create_params = {{"url", "about:blank"}};
    auto target = co_await cdp_->call("Target.createTarget", create_params);
    std::string target_id = target.value("targetId", "");

    nlohmann::json attach_params = {{"targetId", target_id}, {"flatten", true}};
    auto attached = co_await cdp_->call("Target.attachToTarget", attach_params);
    std::string session_id = attached.value("sessionId", "");
    if (session_id.empty())
        throw CDP::CDPError("Target.attachToTarget returned no session");

    co_await cdp_->call("Page.enable", nlohmann::json::object(), session_id);
    co_return std::make_unique<PageImpl>(cdp_, target_id, session_id);
}

boost::asio::awaitable<std::string> Browser::user_agent() {
    auto version = co_await cdp_->call("Browser.getVersion");
    co_return version.value("userAgent", "");
}

void Browser::close() noexcept {
    if (cdp_) {
        cdp_->close();
        cdp_.reset();
    }
    if (process_) {
        process_->terminate();
        process_.reset();
    }
}

}  // namespace Browser
}  // namespace Reader
