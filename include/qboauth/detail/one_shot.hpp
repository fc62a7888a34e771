/*

one_shot.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Single-resolution signal awaited by one coroutine. The first resolve() wins,
later ones are ignored. Producers may run on any thread: the timer is only touched
on the signal's own strand.

*/

#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>

#include <qboauth/detail/asio_decl.hpp>
#include <qboauth/detail/cancellation.hpp>
#include <qboauth/detail/result.hpp>

namespace qboauth::detail
{

template<typename T>
class one_shot
{
public:
    explicit one_shot(qboauth::asio::any_io_executor executor)
        : state_(std::make_shared<state>(qboauth::asio::make_strand(executor)))
    {
    }

    one_shot(const one_shot&) = delete;
    one_shot& operator=(const one_shot&) = delete;

    /// @return true if this call resolved the signal
    bool resolve(T value)
    {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->value)
                return false;
            state_->value.emplace(std::move(value));
        }
        qboauth::asio::dispatch(state_->executor, [s = state_]()
        {
            // a wait started after this point completes at once
            s->timer.expires_at(qboauth::asio::steady_timer::time_point::min());
        });
        return true;
    }

    [[nodiscard]] bool is_resolved() const
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->value.has_value();
    }

    /**
    Wait for the value.

    @param timeout      Upper bound of the wait.
    @param stop         Stop token; a stop request ends the wait with `cancelled`.
    @param timeout_code Error code returned when the timeout elapses first.
    @param what         Operation name used in error messages.
    **/
    qboauth::asio::awaitable<result<T>> async_wait(std::chrono::steady_clock::duration timeout,
        std::stop_token stop, errc timeout_code, std::string_view what)
    {
        co_return co_await run_on(state_->executor, wait(state_, timeout, std::move(stop), timeout_code, std::string(what)));
    }

private:
    struct state
    {
        explicit state(qboauth::asio::any_io_executor strand)
            : executor(std::move(strand)), timer(executor)
        {
        }

        qboauth::asio::any_io_executor executor;
        qboauth::asio::steady_timer timer;
        std::mutex mutex;
        std::optional<T> value;
    };

    /// Runs on the strand
    static qboauth::asio::awaitable<result<T>> wait(std::shared_ptr<state> s, std::chrono::steady_clock::duration timeout,
        std::stop_token stop, errc timeout_code, std::string what)
    {
        {
            std::lock_guard<std::mutex> lock(s->mutex);
            if (s->value)
                co_return *s->value;
        }
        if (stop.stop_requested())
            co_return detail::make_unexpected(cancelled_error(what));

        s->timer.expires_after(timeout);
        {
            stop_guard on_stop(s->executor, stop, [s]() { s->timer.cancel(); });
            auto [ec] = co_await s->timer.async_wait(qboauth::asio::use_nothrow_awaitable);
            (void)ec;
        }

        std::lock_guard<std::mutex> lock(s->mutex);
        if (s->value)
            co_return *s->value;
        if (stop.stop_requested())
            co_return detail::make_unexpected(cancelled_error(what));
        co_return fail<T>(timeout_code, what + " timed out");
    }

    std::shared_ptr<state> state_;
};

} // namespace qboauth::detail
