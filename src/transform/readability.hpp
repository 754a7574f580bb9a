#pragma once
#include <gumbo.h>
#include <optional>
#include <string>

namespace Reader {
namespace Transform {

// Locates the main article content of a parsed document by scoring paragraph
// containers, the way reader modes do.
class Readability {
public:
    static constexpr size_t kMinParagraphChars = 25;

    // HTML fragment of the best candidate with boilerplate removed, or
    // std::nullopt when nothing readable was found.
    static std::optional<std::string> extract(const GumboNode* root);

    // Serializes a subtree back to HTML. Script-like elements are always
    // dropped; navigation, ads and banners only when `strip_boilerplate`.
    static std::string serialize(const GumboNode* node, bool strip_boilerplate);

    static std::string text_content(const GumboNode* node);

    // True for elements whose tag, role, class or id marks them as page chrome.
    static bool is_boilerplate(const GumboNode* node);
};

}  // namespace Transform
}  // namespace Reader
