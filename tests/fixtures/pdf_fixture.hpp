#pragma once
#include <cstdio>
#include <string>
#include <vector>

namespace Reader {
namespace Testing {

// Builds a small valid PDF, one page per entry, each page showing its string
// in Helvetica. Cross-reference offsets are computed as the file is written.
inline std::string make_pdf(const std::vector<std::string>& pages) {
    std::string         out = "%PDF-1.4\n";
    std::vector<size_t> offsets;

    auto add_object = [&](const std::string& body) {
        offsets.push_back(out.size());
        out += std::to_string(offsets.size()) + " 0 obj\n" + body + "\nendobj\n";
    };

    std::string kids;
    for (size_t i = 0; i < pages.size(); ++i)
        kids += std::to_string(4 + 2 * i) + " 0 R ";

    add_object("<< /Type /Catalog /Pages 2 0 R >>");
    add_object("<< /Type /Pages /Kids [" + kids + "] /Count " + std::to_string(pages.size())
               + " >>");
    add_object("<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica >>");

    for (size_t i = 0; i < pages.size(); ++i) {
        std::string content = "BT /F1 24 Tf 72 720 Td (" + pages[i] + ") Tj ET";
        add_object("<< /Type /Page /Parent 2 0 R /MediaBox [0 0 612 792] "
                   "/Resources << /Font << /F1 3 0 R >> >> /Contents "
                   + std::to_string(5 + 2 * i) + " 0 R >>");
        add_object("<< /Length " + std::to_string(content.size()) + " >>\nstream\n" + content
                   + "\nendstream");
    }

    size_t xref = out.size();
    out += "xref\n0 " + std::to_string(offsets.size() + 1) + "\n";
    out += "0000000000 65535 f \n";
    for (size_t offset : offsets) {
        char entry[21];
        std::snprintf(entry, sizeof(entry), "%010zu 00000 n \n", offset);
        out += entry;
    }
    out += "trailer\n<< /Size " + std::to_string(offsets.size() + 1) + " /Root 1 0 R >>\n";
    out += "startxref\n" + std::to_string(xref) + "\n%%EOF\n";
    return out;
}

}  // namespace Testing
}  // namespace Reader
