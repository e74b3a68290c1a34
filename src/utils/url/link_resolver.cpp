#include "link_resolver.hpp"
#include "spindle/constants.hpp"
#include "url.hpp"
#include <utility>

namespace Spindle {
namespace Utils {

namespace {

LinkResult from_parts_or_malformed(const std::string& scheme,
                                   const std::string& host,
                                   const std::string& port,
                                   const std::string& path,
                                   const std::string& query) {
    auto url = Url::from_parts(scheme, host, port, path, query);
    if (!url)
        return LinkResult::rejected(LinkError::Malformed);
    return LinkResult::accepted(std::move(*url));
}

bool is_http_scheme(const std::string& scheme) {
    return scheme == "http" || scheme == "https";
}

}  // namespace

LinkResolver::LinkResolver(Scope scope) : scope_(std::move(scope)) {
}

LinkResult LinkResolver::resolve(const Url& base, const std::string& raw) const {
    LinkResult result = resolve_reference(base, raw);
    if (result.ok() && !scope_.contains(result.url))
        return LinkResult::rejected(LinkError::OutOfScope);
    return result;
}

LinkResult LinkResolver::resolve_reference(const Url& base, const std::string& raw) {
    if (raw.size() > Core::Constants::MAX_URL_LENGTH)
        return LinkResult::rejected(LinkError::Malformed);

    std::string cleaned = UrlSyntax::strip_whitespace(raw);
    UrlParsed   ref     = UrlSyntax::parse(cleaned);

    if (ref.has_scheme) {
        if (!is_http_scheme(ref.scheme))
            return LinkResult::rejected(LinkError::Unsupported);
        if (!ref.has_authority)
            return LinkResult::rejected(LinkError::Malformed);
        return from_parts_or_malformed(ref.scheme, ref.host, ref.port, ref.path, ref.query);
    }

    if (base.empty())
        return LinkResult::rejected(LinkError::Malformed);

    if (ref.has_authority)
        return from_parts_or_malformed(base.scheme(), ref.host, ref.port, ref.path, ref.query);

    std::string base_port = base.port() == 0 ? "" : std::to_string(base.port());

    if (ref.path.empty()) {
        const std::string& query = ref.has_query ? ref.query : base.query();
        return from_parts_or_malformed(base.scheme(), base.host(), base_port, base.path(), query);
    }

    if (ref.path[0] == '/')
        return from_parts_or_malformed(base.scheme(), base.host(), base_port, ref.path, ref.query);

    UrlParsed base_parts;
    base_parts.has_authority = true;
    base_parts.path          = base.path();
    return from_parts_or_malformed(base.scheme(),
                                   base.host(),
                                   base_port,
                                   UrlSyntax::merge_paths(base_parts, ref.path),
                                   ref.query);
}

}  // namespace Utils
}  // namespace Spindle
