#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>
#include "../../../core/logger/logger.hpp"
#include "../crawler.hpp"

namespace Spindle {
namespace Engine {

using namespace Spindle::Core;

namespace {

// Marks the popped task finished however processing ends.
struct TaskGuard {
    FrontierQueue& frontier;
    explicit TaskGuard(FrontierQueue& f) : frontier(f) {
    }
    ~TaskGuard() {
        frontier.task_done();
    }
};

bool is_success_status(long status) {
    return status >= 200 && status < 300;
}

}  // namespace

boost::asio::awaitable<void> Crawler::worker_loop(int                         worker_id,
                                                  std::unique_ptr<HttpClient> client) {
    std::unique_ptr<PolitenessGate> own_gate;
    if (config_.politeness == PolitenessMode::PerWorker)
        own_gate = std::make_unique<PolitenessGate>(config_.delay);
    PolitenessGate& gate = own_gate ? *own_gate : shared_gate_;

    while (true) {
        auto task = co_await frontier_.pop();
        if (!task)
            break;

        TaskGuard guard(frontier_);
        try {
            co_await process_task(*client, gate, std::move(*task));
        } catch (const std::exception& e) {
            Logger::error("Worker " + std::to_string(worker_id) + ": " + e.what());
        }
    }
}

boost::asio::awaitable<void>
Crawler::process_task(HttpClient& client, PolitenessGate& gate, CrawlTask task) {
    const std::string gate_key =
        config_.politeness == PolitenessMode::PerHost ? task.url.host() : std::string();
    auto granted_at = co_await gate.wait_turn(gate_key);

    FetchResult res = co_await fetch_page(client, task);

    PageResult page;
    page.url           = task.url;
    page.depth         = task.depth;
    page.referrer      = task.referrer;
    page.requested_at  = granted_at;
    page.effective_url = res.effective_url.empty() ? task.url.str() : res.effective_url;
    page.status_code   = res.status_code;
    page.content_type  = res.content_type;
    page.error_type    = res.error_type;
    page.error         = res.error;

    if (!page.ok()) {
        errors_++;
        Logger::warn("Failed: " + task.url.str() + " [" + to_string(page.error_type) + "] "
                     + page.error);
        notify_page_result(page);
        co_return;
    }

    pages_fetched_++;
    Logger::success("Fetched: " + task.url.str() + " (HTTP " + std::to_string(res.status_code)
                    + ")");

    if (is_html_content_type(res.content_type)) {
        std::vector<std::string> links;
        try {
            links = co_await extract_links(res.body);
        } catch (const std::exception& e) {
            Logger::warn("Link extraction failed for " + task.url.str() + ": " + e.what());
        }

        auto base = Url::parse(page.effective_url);
        enqueue_links(task, base ? *base : task.url, links, page);
    }

    page.body = std::move(res.body);
    notify_page_result(page);
}

boost::asio::awaitable<FetchResult> Crawler::fetch_page(HttpClient& client, const CrawlTask& task) {
    Logger::info("Fetching: " + task.url.str() + " (Depth " + std::to_string(task.depth) + ")");

    FetchResult res;
    try {
        res = co_await client.fetch(task.url.str(), config_.user_agent);
    } catch (const std::exception& e) {
        res            = FetchResult{};
        res.error_type = FetchError::Connection;
        res.error      = e.what();
    }

    if (res.ok() && !is_success_status(res.status_code)) {
        res.error_type = FetchError::Status;
        res.error      = "HTTP " + std::to_string(res.status_code);
    }
    co_return res;
}

// Parsing is CPU-bound; keep it off the io threads.
boost::asio::awaitable<std::vector<std::string>> Crawler::extract_links(const std::string& body) {
    co_return co_await boost::asio::co_spawn(
        parse_pool_,
        [this, &body]() -> boost::asio::awaitable<std::vector<std::string>> {
            co_return extractor_->extract_links(body);
        },
        boost::asio::use_awaitable);
}

void Crawler::enqueue_links(const CrawlTask&                task,
                            const Url&                      base,
                            const std::vector<std::string>& links,
                            PageResult&                     page) {
    const bool at_depth_limit =
        config_.max_depth != Constants::UNLIMITED_DEPTH && task.depth >= config_.max_depth;

    for (const auto& raw : links) {
        links_found_++;
        page.links_found++;

        LinkResult outcome = resolver_->resolve(base, raw);
        notify_link_found(task.url, raw, outcome);

        if (!outcome.ok() || at_depth_limit)
            continue;
        if (!visited_.try_claim(outcome.url))
            continue;
        if (frontier_.push(CrawlTask{outcome.url, task.depth + 1, task.url}))
            page.links_enqueued++;
    }
}

void Crawler::notify_link_found(const Url&         source,
                                const std::string& raw,
                                const LinkResult&  outcome) {
    if (!config_.observer)
        return;

    std::lock_guard<std::mutex> lock(observer_mutex_);
    try {
        config_.observer->on_link_found(source, raw, outcome);
    } catch (const std::exception& e) {
        Logger::error("Observer on_link_found threw: " + std::string(e.what()));
    }
}

void Crawler::notify_page_result(const PageResult& page) {
    if (!config_.observer)
        return;

    std::lock_guard<std::mutex> lock(observer_mutex_);
    try {
        config_.observer->on_page_result(page);
    } catch (const std::exception& e) {
        Logger::error("Observer on_page_result threw: " + std::string(e.what()));
    }
}

}  // namespace Engine
}  // namespace Spindle
