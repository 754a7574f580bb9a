#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <optional>
#include <string>
#include <variant>
#include "../../browser/browser_client.hpp"
#include "../../network/http/http_client.hpp"
#include "../../utils/url/url.hpp"

namespace Reader {
namespace Engine {

struct HtmlContent {
    std::string markup;
};

struct PdfContent {
    std::string bytes;
};

using AcquiredContent = std::variant<HtmlContent, PdfContent>;

// Chooses how a page is fetched: a direct GET that only keeps PDF bodies,
// then a full browser render for everything else.
class ContentAcquirer {
public:
    ContentAcquirer(Network::Http::HttpClient& http, Browser::PageRenderer& renderer);

    // Throws Core::FetchError when the page could not be rendered.
    boost::asio::awaitable<AcquiredContent> acquire(const Utils::TargetUrl& url);

    static bool is_pdf(const std::string& content_type);

private:
    Network::Http::HttpClient& http_;
    Browser::PageRenderer&     renderer_;

    boost::asio::awaitable<std::optional<PdfContent>> probe_pdf(const std::string& url);
};

}  // namespace Engine
}  // namespace Reader
