#include "string_utils.hpp"
#include <algorithm>
#include <cctype>

namespace Spindle {
namespace Utils {
namespace Text {

std::string trim(std::string_view str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r\n");
    return std::string(str.substr(first, last - first + 1));
}

std::string to_lower(std::string_view str) {
    std::string lower(str);
    std::transform(
        lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    return lower;
}

bool starts_with(std::string_view str, std::string_view prefix) {
    return str.substr(0, prefix.size()) == prefix;
}

bool ends_with(std::string_view str, std::string_view suffix) {
    if (suffix.size() > str.size())
        return false;
    return str.substr(str.size() - suffix.size()) == suffix;
}

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size()
           && std::equal(a.begin(), a.end(), b.begin(), [](char c1, char c2) {
                  return std::tolower(static_cast<unsigned char>(c1))
                         == std::tolower(static_cast<unsigned char>(c2));
              });
}

std::string strip_comment(std::string_view line) {
    std::string trimmed = trim(line);
    if (starts_with(trimmed, "#"))
        return "";
    return trimmed;
}

}  // namespace Text
}  // namespace Utils
}  // namespace Spindle
