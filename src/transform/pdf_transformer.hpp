#pragma once
#include <string>
#include <vector>

namespace Reader {
namespace Transform {

class PdfTransformer {
public:
    // One "# Page n" section per page, in page order, holding the page's text
    // stream. Throws Core::PdfParseError when the document cannot be opened.
    static std::string to_markdown(const std::string& bytes);

    // Raw text of every page, same order as the document.
    static std::vector<std::string> extract_pages(const std::string& bytes);
};

}  // namespace Transform
}  // namespace Reader
