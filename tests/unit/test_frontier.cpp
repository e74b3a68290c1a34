#include <gtest/gtest.h>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <thread>
#include "../../src/engine/frontier/frontier_queue.hpp"

using namespace Spindle;
using namespace Spindle::Engine;

namespace {

CrawlTask task(const std::string& url, int depth = 0) {
    return CrawlTask{*Url::parse(url), depth, Url{}};
}

}  // namespace

TEST(FrontierQueueTest, FifoOrder) {
    FrontierQueue frontier;
    frontier.push(task("http://example.com/1"));
    frontier.push(task("http://example.com/2"));

    EXPECT_EQ(frontier.size(), 2u);
    EXPECT_EQ(frontier.try_pop()->url.str(), "http://example.com/1");
    EXPECT_EQ(frontier.try_pop()->url.str(), "http://example.com/2");
    EXPECT_FALSE(frontier.try_pop());
    EXPECT_EQ(frontier.in_flight(), 2u);
}

TEST(FrontierQueueTest, ClosesWhenDrained) {
    FrontierQueue frontier;
    frontier.push(task("http://example.com/"));

    auto first = frontier.try_pop();
    ASSERT_TRUE(first);
    EXPECT_FALSE(frontier.closed());

    // Work produced while a task is in flight keeps the queue open.
    frontier.push(task("http://example.com/child", 1));
    frontier.task_done();
    EXPECT_FALSE(frontier.closed());

    auto second = frontier.try_pop();
    ASSERT_TRUE(second);
    EXPECT_EQ(second->depth, 1);
    frontier.task_done();

    EXPECT_TRUE(frontier.closed());
    EXPECT_EQ(frontier.in_flight(), 0u);
}

TEST(FrontierQueueTest, ClosedQueueRejectsWork) {
    FrontierQueue frontier;
    frontier.push(task("http://example.com/a"));
    frontier.close();

    EXPECT_TRUE(frontier.closed());
    EXPECT_FALSE(frontier.push(task("http://example.com/b")));
    EXPECT_FALSE(frontier.try_pop());
}

TEST(FrontierQueueTest, PauseHoldsTasks) {
    FrontierQueue frontier;
    frontier.push(task("http://example.com/"));
    frontier.pause();
    EXPECT_TRUE(frontier.paused());
    EXPECT_FALSE(frontier.try_pop());

    frontier.resume();
    EXPECT_TRUE(frontier.try_pop());
}

TEST(FrontierQueueTest, AwaitingPopSeesLatePush) {
    boost::asio::io_context  ioc;
    FrontierQueue            frontier;
    std::optional<CrawlTask> received;

    // Keep one task in flight so the empty queue stays open.
    frontier.push(task("http://example.com/first"));
    auto first = frontier.try_pop();
    ASSERT_TRUE(first);

    boost::asio::co_spawn(
        ioc,
        [&]() -> boost::asio::awaitable<void> {
            received = co_await frontier.pop(std::chrono::milliseconds(5));
        },
        boost::asio::detached);

    boost::asio::co_spawn(
        ioc,
        [&]() -> boost::asio::awaitable<void> {
            boost::asio::steady_timer timer(ioc, std::chrono::milliseconds(30));
            co_await timer.async_wait(boost::asio::use_awaitable);
            frontier.push(task("http://example.com/late"));
            frontier.task_done();
        },
        boost::asio::detached);

    ioc.run();
    ASSERT_TRUE(received);
    EXPECT_EQ(received->url.str(), "http://example.com/late");
}

TEST(FrontierQueueTest, AwaitingPopEndsOnClose) {
    boost::asio::io_context ioc;
    FrontierQueue           frontier;
    bool                    finished = false;
    bool                    got_task = true;

    frontier.push(task("http://example.com/"));
    ASSERT_TRUE(frontier.try_pop());

    boost::asio::co_spawn(
        ioc,
        [&]() -> boost::asio::awaitable<void> {
            auto t   = co_await frontier.pop(std::chrono::milliseconds(5));
            got_task = t.has_value();
            finished = true;
        },
        boost::asio::detached);

    std::thread closer([&frontier]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        frontier.close();
    });
    ioc.run();
    closer.join();

    EXPECT_TRUE(finished);
    EXPECT_FALSE(got_task);
}

TEST(FrontierQueueTest, TaskDoneOnAnotherThreadCloses) {
    FrontierQueue frontier;
    frontier.push(task("http://example.com/"));
    ASSERT_TRUE(frontier.try_pop());
    EXPECT_FALSE(frontier.closed());

    std::thread worker([&frontier]() { frontier.task_done(); });
    worker.join();
    EXPECT_TRUE(frontier.closed());
    EXPECT_EQ(frontier.in_flight(), 0u);
}
