#include "client/async_mutex.hpp"

#include <gtest/gtest.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using namespace std::chrono_literals;
using respc::client::AsyncMutex;
namespace asio = boost::asio;

// Suspend the calling coroutine for `d`.
asio::awaitable<void> sleep_for(std::chrono::milliseconds d) {
    asio::steady_timer timer(co_await asio::this_coro::executor, d);
    boost::system::error_code ec;
    co_await timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
}

class AsyncMutexTest : public ::testing::Test {
protected:
    asio::io_context ioc_;
    AsyncMutex mutex_{ioc_.get_executor()};
};

// Uncontended lock succeeds at once; unlock frees it.
TEST_F(AsyncMutexTest, UncontendedLockAndUnlock) {
    bool acquired = false;

    asio::co_spawn(ioc_, [&]() -> asio::awaitable<void> {
        acquired = co_await mutex_.lock();
        EXPECT_TRUE(mutex_.locked());
        mutex_.unlock();
    }, asio::detached);

    ioc_.run();
    EXPECT_TRUE(acquired);
    EXPECT_FALSE(mutex_.locked());
    EXPECT_EQ(mutex_.waiter_count(), 0u);
}

// Waiters acquire in the order they asked.
TEST_F(AsyncMutexTest, WaitersAreServedFifo) {
    std::vector<std::string> order;

    for (const std::string name : {"A", "B", "C", "D", "E"}) {
        asio::co_spawn(ioc_, [&, name]() -> asio::awaitable<void> {
            if (!co_await mutex_.lock()) co_return;
            AsyncMutex::Guard guard(mutex_);
            order.push_back(name);
            co_await sleep_for(2ms);
        }, asio::detached);
    }

    ioc_.run();
    EXPECT_EQ(order, (std::vector<std::string>{"A", "B", "C", "D", "E"}));
    EXPECT_FALSE(mutex_.locked());
}

// No two holders are ever inside the critical section at once, even when
// the holder suspends inside it.
TEST_F(AsyncMutexTest, CriticalSectionsNeverOverlap) {
    int inside = 0;
    int max_inside = 0;
    int completed = 0;

    for (int i = 0; i < 20; ++i) {
        asio::co_spawn(ioc_, [&, i]() -> asio::awaitable<void> {
            if (!co_await mutex_.lock()) co_return;
            AsyncMutex::Guard guard(mutex_);
            ++inside;
            max_inside = std::max(max_inside, inside);
            co_await sleep_for(std::chrono::milliseconds{i % 3});
            --inside;
            ++completed;
        }, asio::detached);
    }

    ioc_.run();
    EXPECT_EQ(completed, 20);
    EXPECT_EQ(max_inside, 1);
}

// abort_waiters() fails queued waiters but leaves the holder alone.
TEST_F(AsyncMutexTest, AbortWaitersFailsQueuedWaiters) {
    bool holder_acquired = false;
    bool holder_still_locked = false;
    std::vector<bool> waiter_results;

    asio::co_spawn(ioc_, [&]() -> asio::awaitable<void> {
        holder_acquired = co_await mutex_.lock();
        co_await sleep_for(30ms);
        holder_still_locked = mutex_.locked();
        mutex_.unlock();
    }, asio::detached);

    for (int i = 0; i < 2; ++i) {
        asio::co_spawn(ioc_, [&]() -> asio::awaitable<void> {
            const bool ok = co_await mutex_.lock();
            waiter_results.push_back(ok);
            if (ok) mutex_.unlock();
        }, asio::detached);
    }

    asio::co_spawn(ioc_, [&]() -> asio::awaitable<void> {
        co_await sleep_for(5ms);
        EXPECT_EQ(mutex_.waiter_count(), 2u);
        mutex_.abort_waiters();
        EXPECT_EQ(mutex_.waiter_count(), 0u);
    }, asio::detached);

    ioc_.run();
    EXPECT_TRUE(holder_acquired);
    EXPECT_TRUE(holder_still_locked);
    EXPECT_EQ(waiter_results, (std::vector<bool>{false, false}));
    EXPECT_FALSE(mutex_.locked());
}

// Guard releases the mutex when the critical section throws.
TEST_F(AsyncMutexTest, GuardUnlocksOnException) {
    bool caught = false;

    asio::co_spawn(ioc_, [&]() -> asio::awaitable<void> {
        try {
            if (!co_await mutex_.lock()) co_return;
            AsyncMutex::Guard guard(mutex_);
            throw std::runtime_error("boom");
        } catch (const std::runtime_error&) {
            caught = true;
        }
        EXPECT_FALSE(mutex_.locked());
    }, asio::detached);

    ioc_.run();
    EXPECT_TRUE(caught);
}

// A waiter queued after an abort can still acquire normally.
TEST_F(AsyncMutexTest, UsableAfterAbort) {
    bool late_acquired = false;

    asio::co_spawn(ioc_, [&]() -> asio::awaitable<void> {
        (void)co_await mutex_.lock();
        mutex_.abort_waiters();
        mutex_.unlock();
        late_acquired = co_await mutex_.lock();
        mutex_.unlock();
    }, asio::detached);

    ioc_.run();
    EXPECT_TRUE(late_acquired);
    EXPECT_FALSE(mutex_.locked());
}

} // namespace
