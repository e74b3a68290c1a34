#pragma once
#include <string>

#include "scope.hpp"
#include "spindle/observer.hpp"
#include "spindle/url.hpp"

namespace Spindle {
namespace Utils {

/**
 * Turns a raw href into a canonical, in-scope URL.
 *
 * Resolution follows RFC 3986 section 5.2 against `base`. The result is an
 * error value, never an exception: non-http(s) schemes are Unsupported,
 * anything that cannot form a valid http(s) URL is Malformed, and valid URLs
 * rejected by the scope are OutOfScope. Holds no mutable state, so one
 * instance can be shared by all workers.
 */
class LinkResolver {
public:
    explicit LinkResolver(Scope scope);

    LinkResult resolve(const Url& base, const std::string& raw) const;

    // Resolution and normalization only, no scope check.
    static LinkResult resolve_reference(const Url& base, const std::string& raw);

private:
    Scope scope_;
};

}  // namespace Utils
}  // namespace Spindle
