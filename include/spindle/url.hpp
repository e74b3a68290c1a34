#pragma once
#include <cstddef>
#include <functional>
#include <optional>
#include <ostream>
#include <string>

namespace Spindle {

/**
 * Absolute, canonical http(s) URL.
 *
 * Canonical form: lower-case scheme and host, no trailing dot on the host,
 * no default port, no userinfo, no fragment, a path that starts with '/' and
 * has no dot segments, upper-case percent escapes. A trailing slash is kept
 * as part of the path, so "/a" and "/a/" are different URLs. An empty query
 * ("?") is dropped.
 */
class Url {
public:
    Url() = default;

    static std::optional<Url> parse(const std::string& text);
    static std::optional<Url> from_parts(const std::string& scheme,
                                         const std::string& host,
                                         const std::string& port,
                                         const std::string& path,
                                         const std::string& query);

    const std::string& str() const {
        return canonical_;
    }
    const std::string& scheme() const {
        return scheme_;
    }
    const std::string& host() const {
        return host_;
    }
    int port() const {
        return port_;
    }
    const std::string& path() const {
        return path_;
    }
    const std::string& query() const {
        return query_;
    }
    bool empty() const {
        return canonical_.empty();
    }

    int         effective_port() const;
    std::string authority() const;
    std::string target() const;
    std::string registrable_domain() const;

    bool operator==(const Url& other) const {
        return canonical_ == other.canonical_;
    }
    bool operator!=(const Url& other) const {
        return canonical_ != other.canonical_;
    }
    bool operator<(const Url& other) const {
        return canonical_ < other.canonical_;
    }

private:
    std::string scheme_;
    std::string host_;
    int         port_ = 0;  // 0 = scheme default
    std::string path_;
    std::string query_;
    std::string canonical_;
};

inline std::ostream& operator<<(std::ostream& os, const Url& url) {
    return os << url.str();
}

}  // namespace Spindle

namespace std {
template <>
struct hash<Spindle::Url> {
    size_t operator()(const Spindle::Url& u) const noexcept {
        return std::hash<std::string>{}(u.str());
    }
};
}  // namespace std
