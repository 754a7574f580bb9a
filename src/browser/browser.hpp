#pragma once
#include <memory>
#include <string>
#include "launcher/browser_launcher.hpp"
#include "page.hpp"

#include <boost/asio/awaitable.hpp>

namespace Reader {
namespace Browser {

namespace CDP {
class CDPClient;
}

// One isolated browser: its own process, profile and DevTools connection.
// Destroying it closes the connection and kills the process.
class Browser {
public:
    static constexpr char kDevToolsHost[] = "127.0.0.1";

    static boost::asio::awaitable<std::unique_ptr<Browser>>
    launch(const Launcher::LaunchOptions& options);

    ~Browser();

    Browser(const Browser&)            = delete;
    Browser& operator=(const Browser&) = delete;

    boost::asio::awaitable<std::unique_ptr<Page>> new_page();
    boost::asio::awaitable<std::string>           user_agent();
    void                                          close() noexcept;

private:
    Browser(std::unique_ptr<Launcher::BrowserProcess> process,
            std::shared_ptr<CDP::CDPClient>           cdp);

    std::unique_ptr<Launcher::BrowserProcess> process_;
    std::shared_ptr<CDP::CDPClient>           cdp_;
};

}  // namespace Browser
}  // namespace Reader
