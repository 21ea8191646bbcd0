#include "client/async_mutex.hpp"

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>

namespace respc::client {

using boost::asio::awaitable;
using boost::asio::redirect_error;
using boost::asio::use_awaitable;

awaitable<bool> AsyncMutex::lock() {
    if (!locked_) {
        locked_ = true;
        co_return true;
    }

    auto waiter = std::make_shared<Waiter>(executor_);
    waiters_.push_back(waiter);

    // ec is operation_aborted whichever way we are woken; `granted` decides.
    boost::system::error_code ec;
    co_await waiter->timer.async_wait(redirect_error(use_awaitable, ec));

    if (waiter->granted) {
        co_return true;
    }

    // Aborted.  abort_waiters() already emptied the queue, but a timer can
    // also be torn down with its executor, so make sure we are gone.
    waiters_.erase(std::remove(waiters_.begin(), waiters_.end(), waiter), waiters_.end());
    co_return false;
}

void AsyncMutex::unlock() {
    if (waiters_.empty()) {
        locked_ = false;
        return;
    }

    // Hand over directly: locked_ stays true on behalf of the next waiter.
    auto next = std::move(waiters_.front());
    waiters_.pop_front();
    next->granted = true;
    next->timer.cancel();
}

void AsyncMutex::abort_waiters() {
    auto aborted = std::move(waiters_);
    waiters_.clear();
    for (auto& waiter : aborted) {
        // granted stays false, so the waiter sees failure.
        waiter->timer.cancel();
    }
}

} // namespace respc::client
