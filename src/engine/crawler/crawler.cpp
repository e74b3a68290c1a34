#include "crawler.hpp"
#include <algorithm>
#include <stdexcept>
#include "../../core/logger/logger.hpp"
#include "../../network/http/client_factory.hpp"
#include "../../utils/text/html_link_extractor.hpp"
#include "spindle/spindle.hpp"

namespace Spindle {
namespace Engine {

using namespace Spindle::Core;

namespace {

int io_threads_for(int workers) {
    return std::clamp(workers, 1, hardware_parallelism());
}

}  // namespace

Crawler::Crawler(CrawlConfig config)
    : Crawler(config,
              Network::Http::make_client_factory(config.transport),
              std::make_shared<Utils::Text::HtmlLinkExtractor>()) {
}

Crawler::Crawler(CrawlConfig                          config,
                 ClientFactory                        client_factory,
                 std::shared_ptr<const LinkExtractor> extractor)
    : config_(std::move(config)),
      num_workers_(config_.resolved_concurrency()),
      num_io_threads_(io_threads_for(num_workers_)),
      client_factory_(std::move(client_factory)),
      extractor_(std::move(extractor)),
      shared_gate_(config_.delay),
      parse_pool_(static_cast<size_t>(io_threads_for(num_workers_))) {
    validate_config();
}

Crawler::~Crawler() {
    shutdown();
    for (auto& t : io_threads_) {
        if (t.joinable())
            t.join();
    }
    parse_pool_.stop();
    parse_pool_.join();
}

void Crawler::validate_config() const {
    if (config_.concurrency && *config_.concurrency < 1)
        throw std::invalid_argument("concurrency must be at least 1, got "
                                    + std::to_string(*config_.concurrency));
    if (config_.delay.count() < 0)
        throw std::invalid_argument("delay must not be negative");
    if (config_.connect_timeout.count() < 0)
        throw std::invalid_argument("connect timeout must not be negative");
    if (config_.request_timeout.count() < 0)
        throw std::invalid_argument("request timeout must not be negative");
    if (config_.max_depth < Constants::UNLIMITED_DEPTH)
        throw std::invalid_argument("max depth must be -1 (unlimited) or greater");
    if (!client_factory_)
        throw std::invalid_argument("no HTTP client factory");
    if (!extractor_)
        throw std::invalid_argument("no link extractor");
}

std::vector<Url> Crawler::parse_seeds(const std::vector<std::string>& seed_urls) const {
    if (seed_urls.empty())
        throw std::invalid_argument("at least one seed URL is required");

    std::vector<Url> seeds;
    seeds.reserve(seed_urls.size());
    for (const auto& raw : seed_urls) {
        auto url = Url::parse(raw);
        if (!url)
            throw std::invalid_argument("invalid seed URL: " + raw);
        seeds.push_back(std::move(*url));
    }
    return seeds;
}

void Crawler::seed_frontier(const std::vector<Url>& seeds) {
    for (const auto& seed : seeds) {
        if (!visited_.try_claim(seed)) {
            Logger::info("Duplicate seed ignored: " + seed.str());
            continue;
        }
        frontier_.push(CrawlTask{seed, 0, Url{}});
    }
}

std::unique_ptr<HttpClient> Crawler::create_client() {
    auto client = client_factory_();
    if (!client)
        throw std::runtime_error("HTTP client factory returned no client");

    client->set_connect_timeout(config_.connect_timeout);
    client->set_request_timeout(config_.request_timeout);
    client->set_max_body_bytes(effective_body_limit(config_.max_body_bytes));
    return client;
}

// All clients exist before any worker runs, so a broken factory fails the
// run up front instead of leaving the seeds unfetched.
std::vector<std::unique_ptr<HttpClient>> Crawler::create_clients() {
    std::vector<std::unique_ptr<HttpClient>> clients;
    clients.reserve(static_cast<size_t>(num_workers_));
    for (int i = 0; i < num_workers_; ++i)
        clients.push_back(create_client());
    return clients;
}

void Crawler::shutdown() {
    if (!started_ || frontier_.closed())
        return;

    cancelled_ = true;
    Logger::info("Crawler: Shutdown requested");
    frontier_.close();
}

void Crawler::pause() {
    if (frontier_.paused())
        return;
    frontier_.pause();
    Logger::info("Crawler: Paused");
}

void Crawler::resume() {
    if (!frontier_.paused())
        return;
    frontier_.resume();
    Logger::info("Crawler: Resumed");
}

}  // namespace Engine

CrawlSummary crawl(const std::vector<std::string>& seed_urls, const CrawlConfig& config) {
    Engine::Crawler crawler(config);
    return crawler.start(seed_urls);
}

CrawlSummary crawl(const std::vector<std::string>&      seed_urls,
                   const CrawlConfig&                   config,
                   Network::Http::ClientFactory         client_factory,
                   std::shared_ptr<const LinkExtractor> extractor) {
    Engine::Crawler crawler(config, std::move(client_factory), std::move(extractor));
    return crawler.start(seed_urls);
}

}  // namespace Spindle
