#pragma once

#include <utility>  // needed before Boost.Asio 1.74 headers (std::exchange)
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

#include <cstddef>
#include <deque>
#include <memory>
#include <utility>

namespace respc::client {

// ── AsyncMutex ────────────────────────────────────────────────────────────────
//
// Mutual exclusion for coroutines.  A coroutine that finds the mutex held
// suspends (instead of blocking the thread) until the holder unlocks:
//
//   1. Holder A owns the mutex; B calls lock() → B is queued and suspends
//   2. A calls unlock() → ownership passes straight to B and B resumes
//   3. B runs its critical section, then unlock()s for the next waiter
//
// Waiters are served FIFO.  Each waiter parks on a steady_timer that never
// expires by itself; unlock() and abort_waiters() wake it by cancelling the
// timer, and the `granted` flag tells the two apart.
//
// NOT thread-safe: use on a single strand.

class AsyncMutex {
public:
    explicit AsyncMutex(boost::asio::any_io_executor executor)
        : executor_(std::move(executor))
    {}

    AsyncMutex(const AsyncMutex&)            = delete;
    AsyncMutex& operator=(const AsyncMutex&) = delete;

    // Acquire the mutex.  Returns true once owned, false if the wait was
    // aborted via abort_waiters().
    [[nodiscard]] boost::asio::awaitable<bool> lock();

    // Release the mutex, handing it to the longest-waiting coroutine.
    void unlock();

    // Wake every queued waiter with failure (e.g. the connection closed).
    // The current holder, if any, keeps the mutex until it unlocks.
    void abort_waiters();

    [[nodiscard]] bool locked() const noexcept { return locked_; }

    [[nodiscard]] std::size_t waiter_count() const noexcept { return waiters_.size(); }

    // Releases the mutex when it goes out of scope.  Construct only after a
    // successful lock().
    class Guard {
    public:
        explicit Guard(AsyncMutex& mutex) noexcept : mutex_(mutex) {}
        ~Guard() { mutex_.unlock(); }

        Guard(const Guard&)            = delete;
        Guard& operator=(const Guard&) = delete;

    private:
        AsyncMutex& mutex_;
    };

private:
    struct Waiter {
        explicit Waiter(const boost::asio::any_io_executor& executor)
            : timer(executor, boost::asio::steady_timer::time_point::max())
        {}

        boost::asio::steady_timer timer;
        bool granted = false;
    };

    boost::asio::any_io_executor executor_;
    std::deque<std::shared_ptr<Waiter>> waiters_;
    bool locked_ = false;
};

} // namespace respc::client
