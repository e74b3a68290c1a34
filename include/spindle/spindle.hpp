#pragma once
#include <memory>
#include <string>
#include <vector>

#include "spindle/constants.hpp"
#include "spindle/crawl_config.hpp"
#include "spindle/http_client.hpp"
#include "spindle/link_extractor.hpp"
#include "spindle/observer.hpp"
#include "spindle/url.hpp"

namespace Spindle {

/**
 * Crawls outward from `seed_urls` until no in-scope, unvisited URL remains
 * and returns once every worker has stopped.
 *
 * Configuration problems (no seeds, an invalid seed, non-positive
 * concurrency, negative delay or timeouts) throw std::invalid_argument before
 * any request is made. Per-page failures never abort the run; they are
 * reported through the observer and counted in the summary.
 */
CrawlSummary crawl(const std::vector<std::string>& seed_urls, const CrawlConfig& config);

// Same, with a caller-supplied transport and link extractor.
CrawlSummary crawl(const std::vector<std::string>&      seed_urls,
                   const CrawlConfig&                   config,
                   Network::Http::ClientFactory         client_factory,
                   std::shared_ptr<const LinkExtractor> extractor);

}  // namespace Spindle
