#pragma once
#include <string>

namespace Reader {
namespace Transform {

class HtmlTransformer {
public:
    // Converts rendered markup to Markdown, keeping only the main content when
    // it can be identified. Never throws; the worst case is an empty string.
    static std::string to_markdown(const std::string& markup);

    // Serializer step alone: HTML fragment to Markdown, fenced code blocks.
    static std::string serialize_markdown(const std::string& html);
};

}  // namespace Transform
}  // namespace Reader
