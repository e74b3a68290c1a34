#pragma once
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "spindle/constants.hpp"
#include "spindle/observer.hpp"
#include "spindle/url.hpp"

namespace Spindle {

enum class ScopePolicy { SameHost, SameDomain, Any };

enum class PolitenessMode { Global, PerHost, PerWorker };

enum class Transport { Beast, Curl };

using ScopePredicate = std::function<bool(const Url&)>;

/**
 * Settings for one crawl run. Copied into the crawler when the run is
 * created and never modified afterwards.
 */
struct CrawlConfig {
    // Unset means Core::default_concurrency().
    std::optional<int>        concurrency;
    std::chrono::milliseconds delay{0};
    std::string               user_agent = Core::Constants::USER_AGENT;

    ScopePolicy    scope = ScopePolicy::SameDomain;
    ScopePredicate scope_predicate;  // overrides `scope` when set
    PolitenessMode politeness = PolitenessMode::Global;

    int         max_depth      = Core::Constants::UNLIMITED_DEPTH;
    std::size_t max_body_bytes = 0;  // 0 = unlimited

    std::chrono::milliseconds connect_timeout{Core::Constants::CONNECT_TIMEOUT_MS};
    std::chrono::seconds      request_timeout{Core::Constants::REQUEST_TIMEOUT_SECONDS};
    Transport                 transport = Transport::Beast;

    std::shared_ptr<CrawlObserver> observer;

    int resolved_concurrency() const {
        return concurrency ? *concurrency : Core::default_concurrency();
    }
};

struct CrawlSummary {
    std::size_t               pages_fetched = 0;
    std::size_t               errors        = 0;
    std::size_t               unique_urls   = 0;
    std::size_t               links_found   = 0;
    bool                      cancelled     = false;
    std::chrono::milliseconds elapsed{0};
};

}  // namespace Spindle
