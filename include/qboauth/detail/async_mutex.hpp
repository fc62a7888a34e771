/*

async_mutex.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <algorithm>
#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <stop_token>
#include <tuple>
#include <utility>

#include <qboauth/detail/asio_decl.hpp>
#include <qboauth/detail/cancellation.hpp>
#include <qboauth/detail/result.hpp>

namespace qboauth::detail
{

/// Coroutine mutex; waiters are parked on a timer that unlock() cancels
class async_mutex
{
public:
    class scoped_lock
    {
    public:
        scoped_lock() noexcept = default;

        scoped_lock(const scoped_lock&) = delete;
        scoped_lock& operator=(const scoped_lock&) = delete;

        scoped_lock(scoped_lock&& other) noexcept
            : mutex_(std::exchange(other.mutex_, nullptr))
        {
        }

        scoped_lock& operator=(scoped_lock&& other) noexcept
        {
            if (this != &other)
            {
                unlock();
                mutex_ = std::exchange(other.mutex_, nullptr);
            }
            return *this;
        }

        ~scoped_lock()
        {
            unlock();
        }

        [[nodiscard]] bool owns_lock() const noexcept { return mutex_ != nullptr; }

    private:
        friend class async_mutex;

        explicit scoped_lock(async_mutex& mutex) noexcept
            : mutex_(&mutex)
        {
        }

        void unlock() noexcept
        {
            if (mutex_ != nullptr)
            {
                mutex_->unlock();
                mutex_ = nullptr;
            }
        }

        async_mutex* mutex_{nullptr};
    };

    explicit async_mutex(qboauth::asio::any_io_executor executor)
        : executor_(qboauth::asio::make_strand(executor))
    {
    }

    async_mutex(const async_mutex&) = delete;
    async_mutex& operator=(const async_mutex&) = delete;

    /// Lock the mutex asynchronously, `cancelled` when the stop token fires while waiting
    qboauth::asio::awaitable<result<scoped_lock>> lock(std::stop_token stop = {})
    {
        if (stop.stop_requested())
            co_return detail::make_unexpected(cancelled_error("lock"));
        co_return co_await run_on(executor_, lock_on_strand(std::move(stop)));
    }

    [[nodiscard]] bool is_locked() const noexcept
    {
        return locked_.load(std::memory_order_acquire);
    }

private:
    struct waiter_t
    {
        explicit waiter_t(qboauth::asio::any_io_executor executor)
            : timer(std::move(executor))
        {
        }

        qboauth::asio::steady_timer timer;
        std::atomic<bool> ready{false};
    };

    /// Waiter timers are only touched on executor_
    qboauth::asio::awaitable<result<scoped_lock>> lock_on_strand(std::stop_token stop)
    {
        auto waiter = std::make_shared<waiter_t>(executor_);
        waiter->timer.expires_at(qboauth::asio::steady_timer::time_point::max());

        {
            std::lock_guard<std::mutex> guard(waiters_mutex_);
            bool expected = false;
            if (locked_.compare_exchange_strong(expected, true, std::memory_order_acquire))
                co_return scoped_lock(*this);
            waiters_.push_back(waiter);
        }

        qboauth::asio::error_code ec;
        {
            stop_guard on_stop(executor_, stop, [waiter]() { waiter->timer.cancel(); });
            std::tie(ec) = co_await waiter->timer.async_wait(qboauth::asio::use_nothrow_awaitable);
        }

        {
            // ownership may have been handed over while the wait was being cancelled
            std::lock_guard<std::mutex> guard(waiters_mutex_);
            if (!waiter->ready.load(std::memory_order_acquire))
            {
                auto it = std::find(waiters_.begin(), waiters_.end(), waiter);
                if (it != waiters_.end())
                    waiters_.erase(it);

                if (ec && ec != qboauth::asio::error::operation_aborted)
                    co_return detail::make_unexpected(make_error(errc::internal_error, "async_mutex wait failed", {}, ec));
                co_return detail::make_unexpected(cancelled_error("lock"));
            }
        }

        co_return scoped_lock(*this);
    }

    void unlock() noexcept
    {
        std::shared_ptr<waiter_t> waiter;
        {
            std::lock_guard<std::mutex> guard(waiters_mutex_);
            if (waiters_.empty())
            {
                locked_.store(false, std::memory_order_release);
                return;
            }

            waiter = waiters_.front();
            waiters_.pop_front();
            waiter->ready.store(true, std::memory_order_release);
        }

        qboauth::asio::dispatch(executor_, [waiter]()
        {
            // also completes a wait not started yet
            waiter->timer.expires_at(qboauth::asio::steady_timer::time_point::min());
        });
    }

    qboauth::asio::any_io_executor executor_;
    std::atomic<bool> locked_{false};
    mutable std::mutex waiters_mutex_;
    std::deque<std::shared_ptr<waiter_t>> waiters_;
};

} // namespace qboauth::detail
