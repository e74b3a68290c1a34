#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

namespace Spindle {
namespace Engine {

/**
 * Spaces out request starts. Two grants for the same key are always at least
 * `delay` apart; grants for different keys are independent. The crawler uses
 * one key ("") for a global gate, the host name for per-host politeness, and
 * a private gate per worker for per-worker politeness.
 */
class PolitenessGate {
public:
    using Clock = std::chrono::steady_clock;

    explicit PolitenessGate(std::chrono::milliseconds delay);

    PolitenessGate(const PolitenessGate&)            = delete;
    PolitenessGate& operator=(const PolitenessGate&) = delete;

    // Resumes once the caller may start its request; returns the grant time.
    boost::asio::awaitable<Clock::time_point> wait_turn(const std::string& key = "");

    // Grants immediately if allowed, otherwise reports how long to wait.
    bool try_acquire(const std::string& key, Clock::time_point now, Clock::duration& wait);

    std::chrono::milliseconds delay() const {
        return delay_;
    }

private:
    std::chrono::milliseconds                          delay_;
    std::mutex                                         mutex_;
    std::unordered_map<std::string, Clock::time_point> last_grant_;
};

}  // namespace Engine
}  // namespace Spindle
