#include "scope.hpp"
#include <utility>

namespace Spindle {
namespace Utils {

Scope::Scope(ScopePolicy policy, const std::vector<Url>& seeds, ScopePredicate predicate)
    : policy_(policy), predicate_(std::move(predicate)) {
    for (const auto& seed : seeds) {
        hosts_.insert(seed.host());
        domains_.insert(seed.registrable_domain());
    }
}

Scope Scope::unrestricted() {
    return Scope(ScopePolicy::Any, {});
}

bool Scope::contains(const Url& url) const {
    if (predicate_)
        return predicate_(url);

    switch (policy_) {
        case ScopePolicy::Any: return true;
        case ScopePolicy::SameHost: return hosts_.count(url.host()) > 0;
        case ScopePolicy::SameDomain: return domains_.count(url.registrable_domain()) > 0;
    }
    return false;
}

}  // namespace Utils
}  // namespace Spindle
