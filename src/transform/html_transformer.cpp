#include "html_transformer.hpp"
#include <gumbo.h>
#include <memory>
#include "../core/logger/logger.hpp"
#include "../utils/text/string_utils.hpp"
#include "html2md.h"
#include "readability.hpp"

namespace Reader {
namespace Transform {

using namespace Reader::Core;

namespace {

struct GumboOutputDeleter {
    void operator()(GumboOutput* output) const {
        gumbo_destroy_output(&kGumboDefaultOptions, output);
    }
};

using GumboDocument = std::unique_ptr<GumboOutput, GumboOutputDeleter>;

GumboDocument parse(const std::string& markup) {
    return GumboDocument(
        gumbo_parse_with_options(&kGumboDefaultOptions, markup.data(), markup.size()));
}

bool has_root_element(const GumboDocument& doc) {
    return doc && doc->root && doc->root->type == GUMBO_NODE_ELEMENT
           && doc->root->v.element.children.length > 0;
}

}  // namespace

std::string HtmlTransformer::serialize_markdown(const std::string& html) {
    html2md::Options options;
    options.splitLines = false;

    html2md::Converter converter(html, &options);
    return converter.convert();
}

std::string HtmlTransformer::to_markdown(const std::string& markup) {
    std::string html = markup;

    try {
        auto doc = parse(markup);
        if (!has_root_element(doc)) {
            doc = parse("<html><body>" + markup + "</body></html>");
        }

        if (has_root_element(doc)) {
            auto fragment = Readability::extract(doc->root);
            if (fragment && !Utils::Text::trim(*fragment).empty()) {
                html = std::move(*fragment);
            }
            else {
                Logger::debug("Transform: no main content found, converting the whole document");
                html = Readability::serialize(doc->root, false);
            }
        }
    } catch (const std::exception& e) {
        Logger::warn(std::string("Transform: extraction failed, using original markup: ")
                     + e.what());
        html = markup;
    }

    try {
        return Utils::Text::trim(serialize_markdown(html));
    } catch (const std::exception& e) {
        Logger::error(std::string("Transform: Markdown conversion failed: ") + e.what());
        return "";
    }
}

}  // namespace Transform
}  // namespace Reader
