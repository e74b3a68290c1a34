#include "politeness_gate.hpp"
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <optional>

namespace Spindle {
namespace Engine {

PolitenessGate::PolitenessGate(std::chrono::milliseconds delay) : delay_(delay) {
}

bool PolitenessGate::try_acquire(const std::string& key,
                                 Clock::time_point  now,
                                 Clock::duration&   wait) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = last_grant_.find(key);
    if (it != last_grant_.end() && now - it->second < delay_) {
        wait = it->second + delay_ - now;
        return false;
    }
    last_grant_[key] = now;
    wait             = Clock::duration::zero();
    return true;
}

boost::asio::awaitable<PolitenessGate::Clock::time_point>
PolitenessGate::wait_turn(const std::string& key) {
    if (delay_.count() <= 0)
        co_return Clock::now();

    std::optional<boost::asio::steady_timer> timer;
    while (true) {
        Clock::time_point now = Clock::now();
        Clock::duration   wait;
        if (try_acquire(key, now, wait))
            co_return now;

        if (!timer)
            timer.emplace(co_await boost::asio::this_coro::executor);
        timer->expires_after(wait);
        boost::system::error_code ec;
        co_await timer->async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }
}

}  // namespace Engine
}  // namespace Spindle
