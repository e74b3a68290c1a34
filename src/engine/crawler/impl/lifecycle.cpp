#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <stdexcept>
#include "../../../core/logger/logger.hpp"
#include "../crawler.hpp"

namespace Spindle {
namespace Engine {

using namespace Spindle::Core;

CrawlSummary Crawler::start(const std::vector<std::string>& seed_urls) {
    if (started_)
        throw std::logic_error("Crawler::start called twice; use a new Crawler per run");

    std::vector<Url> seeds = parse_seeds(seed_urls);
    resolver_ = std::make_unique<Utils::LinkResolver>(
        Utils::Scope(config_.scope, seeds, config_.scope_predicate));
    auto clients = create_clients();

    auto started_at = std::chrono::steady_clock::now();
    started_        = true;
    running_        = true;

    Logger::info("Crawler: Starting for " + std::to_string(seeds.size()) + " seed(s)");
    seed_frontier(seeds);

    spawn_workers(std::move(clients));
    init_io_services();
    await_completion();

    running_ = false;
    CrawlSummary summary = make_summary(started_at);
    Logger::success("Crawl finished: " + std::to_string(summary.pages_fetched) + " fetched, "
                    + std::to_string(summary.errors) + " failed, "
                    + std::to_string(summary.unique_urls) + " unique URLs in "
                    + std::to_string(summary.elapsed.count()) + "ms");
    return summary;
}

void Crawler::spawn_workers(std::vector<std::unique_ptr<HttpClient>> clients) {
    for (int i = 0; i < num_workers_; ++i) {
        auto worker = worker_loop(i, std::move(clients[static_cast<size_t>(i)]));
        boost::asio::co_spawn(ioc_, std::move(worker), [i](std::exception_ptr e) {
            if (!e)
                return;
            try {
                std::rethrow_exception(e);
            } catch (const std::exception& ex) {
                Logger::error("Worker " + std::to_string(i) + " stopped: " + ex.what());
            }
        });
    }
}

// The workers are the io_context's only work, so run() returns on every
// thread once the last worker coroutine exits.
void Crawler::init_io_services() {
    for (int i = 0; i < num_io_threads_; ++i) {
        io_threads_.emplace_back([this]() {
            try {
                ioc_.run();
            } catch (const std::exception& e) {
                Logger::error("IO Thread Exception: " + std::string(e.what()));
            }
        });
    }
    Logger::info("Started " + std::to_string(num_io_threads_) + " IO threads.");
    Logger::info("Concurrency: " + std::to_string(num_workers_) + " workers.");
}

void Crawler::await_completion() {
    for (auto& t : io_threads_) {
        if (t.joinable())
            t.join();
    }
    io_threads_.clear();

    // Every worker has exited; if any died early the frontier may still hold
    // tasks nobody will process.
    frontier_.close();
}

CrawlSummary Crawler::make_summary(std::chrono::steady_clock::time_point started_at) const {
    CrawlSummary summary;
    summary.pages_fetched = pages_fetched_;
    summary.errors        = errors_;
    summary.unique_urls   = visited_.size();
    summary.links_found   = links_found_;
    summary.cancelled     = cancelled_;
    summary.elapsed       = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_at);
    return summary;
}

}  // namespace Engine
}  // namespace Spindle
