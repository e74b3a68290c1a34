#pragma once
#include <atomic>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "../../utils/url/link_resolver.hpp"
#include "../frontier/frontier_queue.hpp"
#include "../politeness/politeness_gate.hpp"
#include "../visited/visited_set.hpp"
#include "spindle/crawl_config.hpp"
#include "spindle/http_client.hpp"
#include "spindle/link_extractor.hpp"
#include "spindle/observer.hpp"

namespace Spindle {
namespace Engine {

using Network::Http::ClientFactory;
using Network::Http::HttpClient;

/**
 * One crawl run.
 *
 * start() seeds the frontier, spawns `concurrency` worker coroutines on an
 * io_context and blocks until the frontier drains or shutdown() is called.
 * A Crawler runs once; independent runs use independent instances and share
 * nothing. shutdown(), pause() and resume() may be called from any thread,
 * including from inside observer callbacks.
 */
class Crawler {
public:
    // Throws std::invalid_argument on an invalid configuration.
    explicit Crawler(CrawlConfig config);
    Crawler(CrawlConfig                          config,
            ClientFactory                        client_factory,
            std::shared_ptr<const LinkExtractor> extractor);
    ~Crawler();

    Crawler(const Crawler&)            = delete;
    Crawler& operator=(const Crawler&) = delete;

    // Throws std::invalid_argument for missing or invalid seeds,
    // std::runtime_error when the client factory fails and
    // std::logic_error when called a second time.
    CrawlSummary start(const std::vector<std::string>& seed_urls);

    void shutdown();
    void pause();
    void resume();

    bool running() const {
        return running_;
    }
    int concurrency() const {
        return num_workers_;
    }

private:
    CrawlConfig                          config_;
    int                                  num_workers_;
    int                                  num_io_threads_;
    ClientFactory                        client_factory_;
    std::shared_ptr<const LinkExtractor> extractor_;
    std::unique_ptr<Utils::LinkResolver> resolver_;

    FrontierQueue  frontier_;
    VisitedSet     visited_;
    PolitenessGate shared_gate_;

    boost::asio::io_context  ioc_;
    std::vector<std::thread> io_threads_;
    boost::asio::thread_pool parse_pool_;

    std::mutex observer_mutex_;

    std::atomic<size_t> pages_fetched_{0};
    std::atomic<size_t> errors_{0};
    std::atomic<size_t> links_found_{0};
    std::atomic<bool>   started_{false};
    std::atomic<bool>   running_{false};
    std::atomic<bool>   cancelled_{false};

    void             validate_config() const;
    std::vector<Url> parse_seeds(const std::vector<std::string>& seed_urls) const;
    void             seed_frontier(const std::vector<Url>& seeds);

    void         spawn_workers(std::vector<std::unique_ptr<HttpClient>> clients);
    void         init_io_services();
    void         await_completion();
    CrawlSummary make_summary(std::chrono::steady_clock::time_point started_at) const;

    std::unique_ptr<HttpClient>              create_client();
    std::vector<std::unique_ptr<HttpClient>> create_clients();

    boost::asio::awaitable<void> worker_loop(int worker_id, std::unique_ptr<HttpClient> client);
    boost::asio::awaitable<void> process_task(HttpClient&     client,
                                              PolitenessGate& gate,
                                              CrawlTask       task);
    boost::asio::awaitable<FetchResult> fetch_page(HttpClient& client, const CrawlTask& task);
    boost::asio::awaitable<std::vector<std::string>> extract_links(const std::string& body);

    void enqueue_links(const CrawlTask&                task,
                       const Url&                      base,
                       const std::vector<std::string>& links,
                       PageResult&                     page);

    void notify_link_found(const Url& source, const std::string& raw, const LinkResult& outcome);
    void notify_page_result(const PageResult& page);
};

}  // namespace Engine
}  // namespace Spindle
