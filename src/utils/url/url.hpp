#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace Spindle {
namespace Utils {

struct UrlParsed {
    std::string scheme;
    std::string userinfo;
    std::string host;
    std::string port;
    std::string path;
    std::string query;
    std::string fragment;
    bool        has_scheme    = false;
    bool        has_authority = false;
    bool        has_query     = false;
    bool        has_fragment  = false;
};

// RFC 3986 building blocks. Nothing here allocates shared state or throws on
// bad input; invalid components come back as std::nullopt.
class UrlSyntax {
public:
    static UrlParsed   parse(std::string_view text);
    static std::string strip_whitespace(std::string_view raw);
    static bool        is_valid_scheme(std::string_view scheme);
    static std::string remove_dot_segments(const std::string& path);
    static std::string merge_paths(const UrlParsed& base, const std::string& relative_path);
    static std::string normalize_escapes(std::string_view component);

    static std::optional<std::string> normalize_host(std::string_view host);
    static std::optional<int>         parse_port(std::string_view port);
};

}  // namespace Utils
}  // namespace Spindle
