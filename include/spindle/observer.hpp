#pragma once
#include <chrono>
#include <cstddef>
#include <string>
#include <utility>

#include "spindle/http_client.hpp"
#include "spindle/url.hpp"

namespace Spindle {

enum class LinkError { None, Malformed, Unsupported, OutOfScope };

const char* to_string(LinkError error);

struct LinkResult {
    Url       url;
    LinkError error = LinkError::None;

    bool ok() const {
        return error == LinkError::None;
    }

    static LinkResult accepted(Url url) {
        return LinkResult{std::move(url), LinkError::None};
    }
    static LinkResult rejected(LinkError error) {
        return LinkResult{Url{}, error};
    }
};

struct PageResult {
    Url         url;
    int         depth = 0;
    Url         referrer;
    std::string effective_url;

    // When the politeness gate released this request.
    std::chrono::steady_clock::time_point requested_at{};

    long        status_code = 0;
    std::string content_type;
    std::string body;
    std::size_t links_found    = 0;
    std::size_t links_enqueued = 0;

    FetchError  error_type = FetchError::None;
    std::string error;

    bool ok() const {
        return error_type == FetchError::None;
    }
};

/**
 * Crawl event sink. The engine never calls two observer methods at the same
 * time, so implementations do not need their own locking. Calls come from
 * worker threads, not from the thread that started the crawl.
 */
class CrawlObserver {
public:
    virtual ~CrawlObserver() = default;

    // Once per raw link found on `source`, whether or not it was accepted.
    virtual void on_link_found(const Url&         source,
                               const std::string& raw,
                               const LinkResult&  outcome) {
        (void)source;
        (void)raw;
        (void)outcome;
    }

    // Once per completed fetch, successful or not.
    virtual void on_page_result(const PageResult& result) {
        (void)result;
    }
};

}  // namespace Spindle
