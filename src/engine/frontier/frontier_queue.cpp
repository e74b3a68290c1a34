#include "frontier_queue.hpp"
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace Spindle {
namespace Engine {

bool FrontierQueue::push(CrawlTask task) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_)
        return false;
    tasks_.push_back(std::move(task));
    return true;
}

std::optional<CrawlTask> FrontierQueue::try_pop() {
    if (paused_)
        return std::nullopt;

    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || tasks_.empty())
        return std::nullopt;

    CrawlTask task = std::move(tasks_.front());
    tasks_.pop_front();
    in_flight_++;
    return task;
}

boost::asio::awaitable<std::optional<CrawlTask>>
FrontierQueue::pop(std::chrono::milliseconds poll_interval) {
    boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);

    while (!closed()) {
        if (auto task = try_pop())
            co_return task;

        timer.expires_after(poll_interval);
        boost::system::error_code ec;
        co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }
    co_return std::nullopt;
}

void FrontierQueue::task_done() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (in_flight_ > 0)
        in_flight_--;
    if (in_flight_ == 0 && tasks_.empty())
        close_locked();
}

void FrontierQueue::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    close_locked();
}

void FrontierQueue::close_locked() {
    closed_ = true;
}

void FrontierQueue::pause() {
    paused_ = true;
}

void FrontierQueue::resume() {
    paused_ = false;
}

bool FrontierQueue::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

bool FrontierQueue::paused() const {
    return paused_;
}

bool FrontierQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.empty();
}

size_t FrontierQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

size_t FrontierQueue::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
}

}  // namespace Engine
}  // namespace Spindle
