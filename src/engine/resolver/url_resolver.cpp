#include "url_resolver.hpp"
#include "../../core/errors/errors.hpp"
#include "../../core/logger/logger.hpp"
#include "../../utils/text/string_utils.hpp"

namespace Reader {
namespace Engine {

using namespace Reader::Core;
using Reader::Utils::TargetUrl;
using Reader::Utils::Url;

TargetUrl UrlResolver::resolve(const std::string& raw) {
    const std::string trimmed = Utils::Text::trim(raw);
    if (trimmed.empty())
        throw InvalidUrlError("No URL provided");

    if (auto target = Url::parse_absolute(trimmed))
        return *target;

    auto decoded = Url::percent_decode(trimmed);
    if (decoded) {
        if (auto target = Url::parse_absolute(Utils::Text::trim(*decoded)))
            return *target;
    }

    Logger::debug("Resolver: rejected input '" + trimmed + "'");
    throw InvalidUrlError("Invalid URL");
}

}  // namespace Engine
}  // namespace Reader
