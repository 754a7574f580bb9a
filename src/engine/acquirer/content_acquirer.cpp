#include "content_acquirer.hpp"
#include "../../core/errors/errors.hpp"
#include "../../core/logger/logger.hpp"
#include "../../core/types/constants.hpp"
#include "../../utils/text/string_utils.hpp"

namespace Reader {
namespace Engine {

using namespace Reader::Core;

ContentAcquirer::ContentAcquirer(Network::Http::HttpClient& http, Browser::PageRenderer& renderer)
    : http_(http), renderer_(renderer) {
}

bool ContentAcquirer::is_pdf(const std::string& content_type) {
    return Utils::Text::contains_icase(content_type, Constants::PDF_MIME);
}

boost::asio::awaitable<std::optional<PdfContent>> ContentAcquirer::probe_pdf(const std::string& url) {
    Response res = co_await http_.probe(url, &ContentAcquirer::is_pdf);

    if (!res.error.empty()) {
        Logger::debug("Probe: " + url + " unreachable directly (" + res.error + "), rendering");
        co_return std::nullopt;
    }
    if (res.skipped || !is_pdf(res.content_type)) {
        Logger::debug("Probe: " + url + " is "
                      + (res.content_type.empty() ? "untyped" : res.content_type) + ", rendering");
        co_return std::nullopt;
    }
    if (res.status_code < 200 || res.status_code >= 300) {
        Logger::debug("Probe: " + url + " answered " + std::to_string(res.status_code)
                      + ", rendering");
        co_return std::nullopt;
    }

    Logger::info("Probe: PDF detected at " + url + " (" + std::to_string(res.body.size())
                 + " bytes)");
    co_return PdfContent{std::move(res.body)};
}

boost::asio::awaitable<AcquiredContent> ContentAcquirer::acquire(const Utils::TargetUrl& url) {
    const std::string target = url.to_string();

    auto pdf = co_await probe_pdf(target);
    if (pdf)
        co_return std::move(*pdf);

    Response rendered = co_await renderer_.render(target);
    if (!rendered.success)
        throw FetchError("Failed to fetch " + target + ": " + rendered.error);

    co_return HtmlContent{std::move(rendered.body)};
}

}  // namespace Engine
}  // namespace Reader
