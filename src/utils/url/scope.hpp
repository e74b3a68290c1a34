#pragma once
#include <string>
#include <unordered_set>
#include <vector>

#include "spindle/crawl_config.hpp"
#include "spindle/url.hpp"

namespace Spindle {
namespace Utils {

// Decides whether a canonical URL belongs to the crawl, relative to its seeds.
class Scope {
public:
    Scope(ScopePolicy policy, const std::vector<Url>& seeds, ScopePredicate predicate = {});

    static Scope unrestricted();

    bool contains(const Url& url) const;

private:
    ScopePolicy                     policy_;
    ScopePredicate                  predicate_;
    std::unordered_set<std::string> hosts_;
    std::unordered_set<std::string> domains_;
};

}  // namespace Utils
}  // namespace Spindle
