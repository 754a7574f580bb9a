#include "pipeline.hpp"
#include <type_traits>
#include "../../core/logger/logger.hpp"
#include "../../transform/html_transformer.hpp"
#include "../../transform/pdf_transformer.hpp"
#include "../resolver/url_resolver.hpp"

namespace Reader {
namespace Engine {

using namespace Reader::Core;

Pipeline::Pipeline(ContentAcquirer& acquirer) : acquirer_(acquirer) {
}

std::string Pipeline::transform(const AcquiredContent& content) {
    return std::visit(
        [](const auto& acquired) -> std::string {
            using T = std::decay_t<decltype(acquired)>;
            if constexpr (std::is_same_v<T, PdfContent>) {
                return Transform::PdfTransformer::to_markdown(acquired.bytes);
            }
            else {
                static_assert(std::is_same_v<T, HtmlContent>);
                return Transform::HtmlTransformer::to_markdown(acquired.markup);
            }
        },
        content);
}

boost::asio::awaitable<std::string> Pipeline::run(const std::string& raw_url) {
    Utils::TargetUrl target  = UrlResolver::resolve(raw_url);
    AcquiredContent  content = co_await acquirer_.acquire(target);

    std::string markdown = transform(content);
    Logger::success("Converted " + target.to_string() + " ("
                    + (std::holds_alternative<PdfContent>(content) ? "pdf" : "html") + ", "
                    + std::to_string(markdown.size()) + " chars)");
    co_return markdown;
}

}  // namespace Engine
}  // namespace Reader
