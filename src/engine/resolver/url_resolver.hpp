#pragma once
#include <string>
#include "../../utils/url/url.hpp"

namespace Reader {
namespace Engine {

class UrlResolver {
public:
    // Trims `raw` and parses it as an absolute URL. When that fails, exactly one
    // percent-decoding pass is applied and parsing is retried, so a target
    // passed as a single path segment (https%3A%2F%2Fexample.com) is accepted.
    // Throws Core::InvalidUrlError when the input is empty or still unparseable.
    static Utils::TargetUrl resolve(const std::string& raw);
};

}  // namespace Engine
}  // namespace Reader
