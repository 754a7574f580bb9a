#pragma once

#include <string>
#include <vector>

namespace Reader {
namespace Utils {
namespace Text {

std::string trim(const std::string& str);
std::string to_lower(const std::string& str);
bool        starts_with(const std::string& str, const std::string& prefix);
bool        ends_with(const std::string& str, const std::string& suffix);
bool        contains_icase(const std::string& haystack, const std::string& needle);

// Replaces every case-insensitive occurrence of `needle` with `replacement`.
std::string replace_icase(const std::string& str,
                          const std::string& needle,
                          const std::string& replacement);

std::vector<std::string> split(const std::string& str, char delimiter);

}  // namespace Text
}  // namespace Utils
}  // namespace Reader
