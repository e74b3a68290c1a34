#pragma once

#include <string>
#include <string_view>

namespace Spindle {
namespace Utils {
namespace Text {

std::string trim(std::string_view str);
std::string to_lower(std::string_view str);
bool        starts_with(std::string_view str, std::string_view prefix);
bool        ends_with(std::string_view str, std::string_view suffix);
bool        iequals(std::string_view a, std::string_view b);

// Trimmed line, or empty when the line is blank or a '#' comment.
std::string strip_comment(std::string_view line);

}  // namespace Text
}  // namespace Utils
}  // namespace Spindle
