#pragma once
#include <atomic>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <deque>
#include <mutex>
#include <optional>

#include "spindle/constants.hpp"
#include "spindle/url.hpp"

namespace Spindle {
namespace Engine {

struct CrawlTask {
    Url url;
    int depth = 0;
    Url referrer;  // empty for seeds
};

/**
 * FIFO of pending crawl tasks plus the count of tasks handed out but not yet
 * finished.
 *
 * Every successful pop must be paired with exactly one task_done(). The queue
 * closes itself when it is empty and nothing is in flight, since no worker
 * can produce further work at that point. After close() every pop returns
 * std::nullopt and pushes are dropped.
 */
class FrontierQueue {
public:
    FrontierQueue() = default;

    FrontierQueue(const FrontierQueue&)            = delete;
    FrontierQueue& operator=(const FrontierQueue&) = delete;

    bool push(CrawlTask task);

    // Non-blocking. Counts the returned task as in flight.
    std::optional<CrawlTask> try_pop();

    // Waits until a task is available or the queue closes.
    boost::asio::awaitable<std::optional<CrawlTask>> pop(
        std::chrono::milliseconds poll_interval =
            std::chrono::milliseconds(Core::Constants::FRONTIER_POLL_INTERVAL_MS));

    void task_done();
    void close();

    // Paused queues hold their tasks; pops wait until resume() or close().
    void pause();
    void resume();

    bool   closed() const;
    bool   paused() const;
    bool   empty() const;
    size_t size() const;
    size_t in_flight() const;

private:
    mutable std::mutex      mutex_;
    std::deque<CrawlTask>   tasks_;
    size_t                  in_flight_ = 0;
    bool                    closed_    = false;
    std::atomic<bool>       paused_{false};

    void close_locked();
};

}  // namespace Engine
}  // namespace Spindle
