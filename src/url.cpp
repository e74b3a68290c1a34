#include "spindle/url.hpp"
#include "spindle/constants.hpp"
#include "utils/text/string_utils.hpp"
#include "utils/url/domain.hpp"
#include "utils/url/url.hpp"

namespace Spindle {

using Utils::UrlSyntax;

std::optional<Url> Url::parse(const std::string& text) {
    std::string cleaned = UrlSyntax::strip_whitespace(text);
    if (cleaned.empty() || cleaned.size() > Core::Constants::MAX_URL_LENGTH)
        return std::nullopt;

    auto parsed = UrlSyntax::parse(cleaned);
    if (!parsed.has_scheme || !parsed.has_authority)
        return std::nullopt;
    return from_parts(parsed.scheme, parsed.host, parsed.port, parsed.path, parsed.query);
}

std::optional<Url> Url::from_parts(const std::string& scheme,
                                   const std::string& host,
                                   const std::string& port,
                                   const std::string& path,
                                   const std::string& query) {
    std::string lower_scheme = Utils::Text::to_lower(scheme);
    if (lower_scheme != "http" && lower_scheme != "https")
        return std::nullopt;

    auto normalized_host = UrlSyntax::normalize_host(host);
    if (!normalized_host)
        return std::nullopt;

    auto port_number = UrlSyntax::parse_port(port);
    if (!port_number)
        return std::nullopt;

    Url url;
    url.scheme_ = lower_scheme;
    url.host_   = *normalized_host;
    url.port_   = *port_number;
    if ((url.scheme_ == "http" && url.port_ == 80) || (url.scheme_ == "https" && url.port_ == 443))
        url.port_ = 0;

    std::string raw_path = path.empty() || path[0] != '/' ? "/" + path : path;
    url.path_            = UrlSyntax::normalize_escapes(UrlSyntax::remove_dot_segments(raw_path));
    if (url.path_.empty())
        url.path_ = "/";
    url.query_ = UrlSyntax::normalize_escapes(query);

    url.canonical_ = url.scheme_ + "://" + url.authority() + url.target();
    return url;
}

int Url::effective_port() const {
    if (port_ != 0)
        return port_;
    return scheme_ == "https" ? 443 : 80;
}

std::string Url::authority() const {
    if (port_ == 0)
        return host_;
    return host_ + ":" + std::to_string(port_);
}

std::string Url::target() const {
    if (query_.empty())
        return path_;
    return path_ + "?" + query_;
}

std::string Url::registrable_domain() const {
    return Utils::Domain::registrable_domain(host_);
}

}  // namespace Spindle
