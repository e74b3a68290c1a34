#include "url.hpp"
#include <cctype>
#include "../text/string_utils.hpp"

namespace Spindle {
namespace Utils {

namespace {

constexpr const char* HEX_DIGITS = "0123456789ABCDEF";

bool is_ascii_alpha(unsigned char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool is_ascii_alnum(unsigned char c) {
    return is_ascii_alpha(c) || (c >= '0' && c <= '9');
}

bool is_ascii_hex(unsigned char c) {
    return std::isxdigit(c) != 0;
}

bool needs_escape(unsigned char c) {
    return c <= 0x20 || c >= 0x7F || c == '"' || c == '<' || c == '>' || c == '`';
}

void drop_last_segment(std::string& output) {
    size_t slash = output.rfind('/');
    if (slash == std::string::npos)
        output.clear();
    else
        output.erase(slash);
}

std::optional<std::string> normalize_ip_literal(std::string_view host) {
    if (host.size() < 3 || host.back() != ']')
        return std::nullopt;

    std::string_view inner = host.substr(1, host.size() - 2);
    if (inner.find(':') == std::string_view::npos)
        return std::nullopt;

    std::string out = "[";
    for (unsigned char c : inner) {
        if (!(is_ascii_alnum(c) || c == ':' || c == '.' || c == '%' || c == '-' || c == '_'))
            return std::nullopt;
        out += static_cast<char>(std::tolower(c));
    }
    out += ']';
    return out;
}

}  // namespace

UrlParsed UrlSyntax::parse(std::string_view sv) {
    UrlParsed parsed;

    size_t colon = sv.find(':');
    if (colon != std::string_view::npos && colon > 0 && is_valid_scheme(sv.substr(0, colon))) {
        parsed.scheme     = Text::to_lower(std::string(sv.substr(0, colon)));
        parsed.has_scheme = true;
        sv.remove_prefix(colon + 1);
    }

    if (sv.size() >= 2 && sv[0] == '/' && sv[1] == '/') {
        sv.remove_prefix(2);
        parsed.has_authority = true;

        size_t           end_auth  = sv.find_first_of("/?#");
        std::string_view authority = sv.substr(0, end_auth);
        sv = (end_auth == std::string_view::npos) ? std::string_view{} : sv.substr(end_auth);

        size_t           at        = authority.rfind('@');
        std::string_view host_port = authority;
        if (at != std::string_view::npos) {
            parsed.userinfo = std::string(authority.substr(0, at));
            host_port       = authority.substr(at + 1);
        }

        if (!host_port.empty() && host_port[0] == '[') {
            size_t end_bracket = host_port.find(']');
            if (end_bracket == std::string_view::npos) {
                parsed.host = std::string(host_port);
            }
            else {
                std::string_view rest = host_port.substr(end_bracket + 1);
                if (rest.empty()) {
                    parsed.host = std::string(host_port);
                }
                else if (rest[0] == ':') {
                    parsed.host = std::string(host_port.substr(0, end_bracket + 1));
                    parsed.port = std::string(rest.substr(1));
                }
                else {
                    // Junk after the bracket; keep it so host validation rejects it.
                    parsed.host = std::string(host_port);
                }
            }
        }
        else {
            size_t p_colon = host_port.rfind(':');
            if (p_colon != std::string_view::npos) {
                parsed.host = std::string(host_port.substr(0, p_colon));
                parsed.port = std::string(host_port.substr(p_colon + 1));
            }
            else {
                parsed.host = std::string(host_port);
            }
        }
    }

    size_t h_pos = sv.find('#');
    if (h_pos != std::string_view::npos) {
        parsed.fragment     = std::string(sv.substr(h_pos + 1));
        parsed.has_fragment = true;
        sv                  = sv.substr(0, h_pos);
    }

    size_t q_pos = sv.find('?');
    if (q_pos != std::string_view::npos) {
        parsed.query     = std::string(sv.substr(q_pos + 1));
        parsed.has_query = true;
        sv               = sv.substr(0, q_pos);
    }

    parsed.path = std::string(sv);
    return parsed;
}

std::string UrlSyntax::strip_whitespace(std::string_view raw) {
    std::string out;
    out.reserve(raw.size());
    for (char c : raw) {
        if (c == '\t' || c == '\r' || c == '\n')
            continue;
        out += c;
    }

    size_t first = 0;
    while (first < out.size() && static_cast<unsigned char>(out[first]) <= 0x20)
        ++first;
    size_t last = out.size();
    while (last > first && static_cast<unsigned char>(out[last - 1]) <= 0x20)
        --last;
    return out.substr(first, last - first);
}

bool UrlSyntax::is_valid_scheme(std::string_view scheme) {
    if (scheme.empty() || !is_ascii_alpha(static_cast<unsigned char>(scheme[0])))
        return false;
    for (unsigned char c : scheme) {
        if (!(is_ascii_alnum(c) || c == '+' || c == '-' || c == '.'))
            return false;
    }
    return true;
}

// RFC 3986 section 5.2.4.
std::string UrlSyntax::remove_dot_segments(const std::string& path) {
    std::string input = path;
    std::string output;

    while (!input.empty()) {
        if (Text::starts_with(input, "../")) {
            input.erase(0, 3);
        }
        else if (Text::starts_with(input, "./")) {
            input.erase(0, 2);
        }
        else if (Text::starts_with(input, "/./")) {
            input.erase(0, 2);
        }
        else if (input == "/.") {
            input = "/";
        }
        else if (Text::starts_with(input, "/../")) {
            input.erase(0, 3);
            drop_last_segment(output);
        }
        else if (input == "/..") {
            input = "/";
            drop_last_segment(output);
        }
        else if (input == "." || input == "..") {
            input.clear();
        }
        else {
            size_t start = (input[0] == '/') ? 1 : 0;
            size_t next  = input.find('/', start);
            if (next == std::string::npos)
                next = input.size();
            output.append(input, 0, next);
            input.erase(0, next);
        }
    }
    return output;
}

std::string UrlSyntax::merge_paths(const UrlParsed& base, const std::string& relative_path) {
    if (base.has_authority && base.path.empty())
        return "/" + relative_path;

    size_t last_slash = base.path.rfind('/');
    if (last_slash == std::string::npos)
        return relative_path;
    return base.path.substr(0, last_slash + 1) + relative_path;
}

std::string UrlSyntax::normalize_escapes(std::string_view component) {
    std::string out;
    out.reserve(component.size());

    for (size_t i = 0; i < component.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(component[i]);
        if (c == '%') {
            if (i + 2 < component.size() && is_ascii_hex(static_cast<unsigned char>(component[i + 1]))
                && is_ascii_hex(static_cast<unsigned char>(component[i + 2]))) {
                out += '%';
                out += static_cast<char>(std::toupper(static_cast<unsigned char>(component[i + 1])));
                out += static_cast<char>(std::toupper(static_cast<unsigned char>(component[i + 2])));
                i += 2;
            }
            else {
                out += "%25";
            }
        }
        else if (needs_escape(c)) {
            out += '%';
            out += HEX_DIGITS[c >> 4];
            out += HEX_DIGITS[c & 0x0F];
        }
        else {
            out += static_cast<char>(c);
        }
    }
    return out;
}

std::optional<std::string> UrlSyntax::normalize_host(std::string_view host) {
    if (host.empty())
        return std::nullopt;

    if (host[0] == '[')
        return normalize_ip_literal(host);

    // One trailing dot marks the root label; any more is an empty label.
    if (host.back() == '.')
        host.remove_suffix(1);
    if (host.empty() || host.size() > 253 || host.back() == '.')
        return std::nullopt;

    std::string out;
    out.reserve(host.size());
    char prev = '.';
    for (unsigned char c : host) {
        if (c == '.' && prev == '.')
            return std::nullopt;  // empty label
        // No IDNA; raw non-ASCII hosts are rejected rather than passed through.
        if (!(is_ascii_alnum(c) || c == '-' || c == '.' || c == '_' || c == '~' || c == '%'))
            return std::nullopt;
        out += static_cast<char>(std::tolower(c));
        prev = static_cast<char>(c);
    }
    return out;
}

std::optional<int> UrlSyntax::parse_port(std::string_view port) {
    if (port.empty())
        return 0;
    if (port.size() > 5)
        return std::nullopt;

    int value = 0;
    for (char c : port) {
        if (c < '0' || c > '9')
            return std::nullopt;
        value = value * 10 + (c - '0');
    }
    if (value < 1 || value > 65535)
        return std::nullopt;
    return value;
}

}  // namespace Utils
}  // namespace Spindle
