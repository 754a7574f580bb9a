#include "string_utils.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace Reader {
namespace Utils {
namespace Text {

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n\f\v");
    if (std::string::npos == first) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r\n\f\v");
    return str.substr(first, (last - first + 1));
}

std::string to_lower(const std::string& str) {
    std::string lower = str;
    std::transform(
        lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    return lower;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    return str.rfind(prefix, 0) == 0;
}

bool ends_with(const std::string& str, const std::string& suffix) {
    if (suffix.size() > str.size())
        return false;
    return std::equal(suffix.rbegin(), suffix.rend(), str.rbegin());
}

bool contains_icase(const std::string& haystack, const std::string& needle) {
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

std::string replace_icase(const std::string& str,
                          const std::string& needle,
                          const std::string& replacement) {
    if (needle.empty())
        return str;

    const std::string lower_str    = to_lower(str);
    const std::string lower_needle = to_lower(needle);

    std::string result;
    size_t      pos = 0;
    while (true) {
        size_t hit = lower_str.find(lower_needle, pos);
        if (hit == std::string::npos)
            break;
        result.append(str, pos, hit - pos);
        result += replacement;
        pos = hit + needle.size();
    }
    result.append(str, pos, std::string::npos);
    return result;
}

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    std::stringstream        ss(str);
    std::string              part;
    while (std::getline(ss, part, delimiter)) {
        parts.push_back(part);
    }
    return parts;
}

}  // namespace Text
}  // namespace Utils
}  // namespace Reader
