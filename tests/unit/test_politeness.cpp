#include <gtest/gtest.h>
#include <algorithm>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <mutex>
#include <thread>
#include <vector>
#include "../../src/engine/politeness/politeness_gate.hpp"

using namespace Spindle::Engine;
using Clock = PolitenessGate::Clock;

namespace {

// Runs `waiters` coroutines per key on `threads` threads; returns grant times.
std::vector<Clock::time_point> run_waiters(PolitenessGate&                 gate,
                                           const std::vector<std::string>& keys,
                                           int                             threads = 4) {
    boost::asio::io_context        ioc;
    std::mutex                     mutex;
    std::vector<Clock::time_point> grants;

    for (const auto& key : keys) {
        boost::asio::co_spawn(
            ioc,
            [&gate, &mutex, &grants, key]() -> boost::asio::awaitable<void> {
                auto granted = co_await gate.wait_turn(key);
                std::lock_guard<std::mutex> lock(mutex);
                grants.push_back(granted);
            },
            boost::asio::detached);
    }

    std::vector<std::thread> pool;
    for (int i = 0; i < threads; ++i)
        pool.emplace_back([&ioc]() { ioc.run(); });
    for (auto& t : pool)
        t.join();

    std::sort(grants.begin(), grants.end());
    return grants;
}

}  // namespace

TEST(PolitenessGateTest, ZeroDelayGrantsImmediately) {
    PolitenessGate gate(std::chrono::milliseconds(0));
    auto           start  = Clock::now();
    auto           grants = run_waiters(gate, {"", "", "", "", ""});
    ASSERT_EQ(grants.size(), 5u);
    EXPECT_LT(Clock::now() - start, std::chrono::milliseconds(50));
}

TEST(PolitenessGateTest, SameKeyGrantsAreSpaced) {
    PolitenessGate gate(std::chrono::milliseconds(40));
    auto           grants = run_waiters(gate, {"", "", "", "", ""});

    ASSERT_EQ(grants.size(), 5u);
    for (size_t i = 1; i < grants.size(); ++i)
        EXPECT_GE(grants[i] - grants[i - 1], std::chrono::milliseconds(40));
}

TEST(PolitenessGateTest, DifferentKeysAreIndependent) {
    PolitenessGate gate(std::chrono::milliseconds(200));
    auto           start  = Clock::now();
    auto           grants = run_waiters(gate, {"a.test", "b.test", "c.test"});

    ASSERT_EQ(grants.size(), 3u);
    EXPECT_LT(grants.back() - start, std::chrono::milliseconds(150));
}

TEST(PolitenessGateTest, TryAcquireReportsRemainingWait) {
    PolitenessGate    gate(std::chrono::milliseconds(100));
    Clock::time_point now = Clock::now();
    Clock::duration   wait;

    EXPECT_TRUE(gate.try_acquire("host", now, wait));
    EXPECT_EQ(wait, Clock::duration::zero());

    EXPECT_FALSE(gate.try_acquire("host", now + std::chrono::milliseconds(30), wait));
    EXPECT_EQ(wait, std::chrono::milliseconds(70));

    EXPECT_TRUE(gate.try_acquire("host", now + std::chrono::milliseconds(100), wait));
    EXPECT_TRUE(gate.try_acquire("other", now, wait));
}
