/*

cancellation.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Bridge between std::stop_token and Asio cancellation: a stop request posts a
handler (usually timer.cancel() or socket.close()) to the owning executor. Give the
guard the strand the guarded object is used on, so the cancellation never overlaps
another operation on it.

*/

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>

#include <qboauth/detail/asio_decl.hpp>
#include <qboauth/detail/result.hpp>

namespace qboauth::detail
{

class stop_guard
{
public:
    stop_guard(qboauth::asio::any_io_executor executor, std::stop_token token, std::function<void()> on_stop)
        : state_(std::make_shared<state>(std::move(on_stop)))
    {
        if (token.stop_possible())
            callback_.emplace(std::move(token), poster{std::move(executor), state_});
    }

    stop_guard(const stop_guard&) = delete;
    stop_guard& operator=(const stop_guard&) = delete;

    /// Blocks while a posted handler is running, none starts afterwards
    ~stop_guard()
    {
        callback_.reset();
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->active = false;
    }

private:
    struct state
    {
        explicit state(std::function<void()> fn) : on_stop(std::move(fn)) {}

        std::function<void()> on_stop;
        std::mutex mutex;
        bool active = true;
    };

    struct poster
    {
        qboauth::asio::any_io_executor executor;
        std::shared_ptr<state> target;

        void operator()() const
        {
            qboauth::asio::post(executor, [s = target]()
            {
                std::lock_guard<std::mutex> lock(s->mutex);
                if (s->active && s->on_stop)
                    s->on_stop();
            });
        }
    };

    std::shared_ptr<state> state_;
    std::optional<std::stop_callback<poster>> callback_;
};

[[nodiscard]] inline error_info cancelled_error(std::string_view what,
    std::source_location where = std::source_location::current())
{
    return make_error(errc::cancelled, std::string(what) + " cancelled", {}, {}, where);
}

template<typename T>
qboauth::asio::awaitable<void> store_result(qboauth::asio::awaitable<T> op, std::optional<T>& out)
{
    out.emplace(co_await std::move(op));
}

/**
Run `op` on `executor`, usually a strand owning the I/O objects `op` touches.

The caller resumes on its own executor once `op` completes.
**/
template<typename T>
qboauth::asio::awaitable<T> run_on(qboauth::asio::any_io_executor executor, qboauth::asio::awaitable<T> op)
{
    std::optional<T> out;
    co_await qboauth::asio::co_spawn(std::move(executor), store_result(std::move(op), out),
        qboauth::asio::use_awaitable);
    co_return std::move(*out);
}

inline qboauth::asio::awaitable<void> run_on(qboauth::asio::any_io_executor executor, qboauth::asio::awaitable<void> op)
{
    co_await qboauth::asio::co_spawn(std::move(executor), std::move(op), qboauth::asio::use_awaitable);
}

/// Runs on a strand, shared with the cancellation handler
inline qboauth::asio::awaitable<result_void> sleep_on_strand(std::chrono::steady_clock::duration delay, std::stop_token stop)
{
    auto executor = co_await boost::asio::this_coro::executor;
    qboauth::asio::steady_timer timer(executor);
    timer.expires_after(delay);
    stop_guard guard(executor, stop, [&timer]() { timer.cancel(); });

    auto [ec] = co_await timer.async_wait(qboauth::asio::use_nothrow_awaitable);
    if (stop.stop_requested())
        co_return detail::make_unexpected(cancelled_error("wait"));
    if (ec && ec != qboauth::asio::error::operation_aborted)
        co_return detail::make_unexpected(make_error(errc::internal_error, "timer wait failed", {}, ec));
    co_return ok();
}

/// Sleep on the executor; returns `cancelled` if the stop token fires first
inline qboauth::asio::awaitable<result_void> async_sleep(std::chrono::steady_clock::duration delay, std::stop_token stop)
{
    if (stop.stop_requested())
        co_return detail::make_unexpected(cancelled_error("wait"));

    auto executor = co_await boost::asio::this_coro::executor;
    co_return co_await run_on(qboauth::asio::make_strand(executor), sleep_on_strand(delay, std::move(stop)));
}

} // namespace qboauth::detail
