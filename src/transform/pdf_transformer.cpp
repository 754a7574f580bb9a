#include "pdf_transformer.hpp"
#include <memory>
#include <mutex>
#include "../core/errors/errors.hpp"
#include "../core/logger/logger.hpp"
#include "../utils/text/string_utils.hpp"
#include "fpdf_text.h"
#include "fpdfview.h"

namespace Reader {
namespace Transform {

using namespace Reader::Core;

namespace {

// PDFium keeps global state and is not thread-safe.
std::mutex& pdfium_mutex() {
    static std::mutex mutex;
    return mutex;
}

void ensure_library() {
    static std::once_flag once;
    std::call_once(once, [] {
        FPDF_LIBRARY_CONFIG config{};
        config.version = 2;
        FPDF_InitLibraryWithConfig(&config);
    });
}

struct DocumentCloser {
    void operator()(void* doc) const {
        FPDF_CloseDocument(static_cast<FPDF_DOCUMENT>(doc));
    }
};

struct PageCloser {
    void operator()(void* page) const {
        FPDF_ClosePage(static_cast<FPDF_PAGE>(page));
    }
};

struct TextPageCloser {
    void operator()(void* text_page) const {
        FPDFText_ClosePage(static_cast<FPDF_TEXTPAGE>(text_page));
    }
};

std::string describe_error(unsigned long code) {
    switch (code) {
        case FPDF_ERR_FILE:
            return "file not found or could not be opened";
        case FPDF_ERR_FORMAT:
            return "not a PDF or corrupted";
        case FPDF_ERR_PASSWORD:
            return "password required";
        case FPDF_ERR_SECURITY:
            return "unsupported security scheme";
        case FPDF_ERR_PAGE:
            return "page not found or content error";
        default:
            return "unknown error " + std::to_string(code);
    }
}

void append_utf8(std::string& out, unsigned int cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    }
    else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

std::string utf16_to_utf8(const std::vector<unsigned short>& units, size_t length) {
    std::string out;
    out.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        unsigned int cp = units[i];
        if (cp >= 0xD800 && cp <= 0xDBFF && i + 1 < length) {
            unsigned int low = units[i + 1];
            if (low >= 0xDC00 && low <= 0xDFFF) {
                cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                ++i;
            }
        }
        if (cp >= 0xD800 && cp <= 0xDFFF)
            cp = 0xFFFD;
        append_utf8(out, cp);
    }
    return out;
}

// Line ends come out of PDFium as "\r\n".
std::string normalize_line_ends(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r') {
            out += '\n';
            if (i + 1 < text.size() && text[i + 1] == '\n')
                ++i;
            continue;
        }
        out += text[i];
    }
    return out;
}

std::string page_text(FPDF_DOCUMENT doc, int index) {
    std::unique_ptr<void, PageCloser> page(FPDF_LoadPage(doc, index));
    if (!page) {
        Logger::warn("PDF: page " + std::to_string(index + 1) + " could not be loaded");
        return "";
    }

    std::unique_ptr<void, TextPageCloser> text_page(
        FPDFText_LoadPage(static_cast<FPDF_PAGE>(page.get())));
    if (!text_page) {
        Logger::warn("PDF: no text layer on page " + std::to_string(index + 1));
        return "";
    }

    auto tp    = static_cast<FPDF_TEXTPAGE>(text_page.get());
    int  count = FPDFText_CountChars(tp);
    if (count <= 0)
        return "";

    std::vector<unsigned short> buffer(static_cast<size_t>(count) + 1, 0);
    int written = FPDFText_GetText(tp, 0, count, buffer.data());
    if (written <= 0)
        return "";

    // `written` includes the terminating NUL.
    return normalize_line_ends(utf16_to_utf8(buffer, static_cast<size_t>(written - 1)));
}

}  // namespace

std::vector<std::string> PdfTransformer::extract_pages(const std::string& bytes) {
    std::lock_guard<std::mutex> lock(pdfium_mutex());
    ensure_library();

    if (bytes.empty())
        throw PdfParseError("Failed to parse PDF: empty document");

    std::unique_ptr<void, DocumentCloser> doc(
        FPDF_LoadMemDocument64(bytes.data(), bytes.size(), nullptr));
    if (!doc)
        throw PdfParseError("Failed to parse PDF: " + describe_error(FPDF_GetLastError()));

    auto handle     = static_cast<FPDF_DOCUMENT>(doc.get());
    int  page_count = FPDF_GetPageCount(handle);

    std::vector<std::string> pages;
    pages.reserve(page_count > 0 ? static_cast<size_t>(page_count) : 0);
    for (int i = 0; i < page_count; ++i)
        pages.push_back(page_text(handle, i));

    Logger::debug("PDF: extracted " + std::to_string(page_count) + " pages");
    return pages;
}

std::string PdfTransformer::to_markdown(const std::string& bytes) {
    auto pages = extract_pages(bytes);

    std::string markdown;
    for (size_t i = 0; i < pages.size(); ++i) {
        markdown += "\n\n# Page " + std::to_string(i + 1) + "\n\n";
        markdown += pages[i];
    }
    return Utils::Text::trim(markdown);
}

}  // namespace Transform
}  // namespace Reader
