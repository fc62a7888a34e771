/*

refresh_engine.hpp
------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <chrono>
#include <cmath>
#include <format>
#include <functional>
#include <stop_token>
#include <string>
#include <utility>

#include <qboauth/detail/asio_decl.hpp>
#include <qboauth/detail/cancellation.hpp>
#include <qboauth/detail/error_detail.hpp>
#include <qboauth/detail/log.hpp>
#include <qboauth/detail/result.hpp>
#include <qboauth/oauth2/token.hpp>
#include <qboauth/oauth2/token_client.hpp>

namespace qboauth::oauth2
{

/**
 * Retry policy for token refresh.
 * The delay after failed attempt `n` (1-based) is `base_delay * multiplier^n`,
 * so the defaults wait 2 s then 4 s between three attempts.
 */
struct retry_policy
{
    /// Total attempts, the first one included
    unsigned int max_attempts = 3;

    std::chrono::milliseconds base_delay{1000};

    double multiplier = 2.0;

    /// Invoked before each wait: failed attempt number (1-based), delay, failure
    std::function<void(unsigned int, std::chrono::milliseconds, const error_info&)> on_retry;

    /// Three attempts with 2 s and 4 s pauses
    static retry_policy defaults()
    {
        return retry_policy{};
    }

    /// Single attempt
    static retry_policy none()
    {
        retry_policy policy;
        policy.max_attempts = 1;
        return policy;
    }

    /// Same shape as defaults() with `unit` in place of one second
    static retry_policy scaled(std::chrono::milliseconds unit, unsigned int attempts = 3)
    {
        retry_policy policy;
        policy.max_attempts = attempts;
        policy.base_delay = unit;
        return policy;
    }

    /// Delay following failed attempt `attempt` (1-based)
    [[nodiscard]] std::chrono::milliseconds delay_for(unsigned int attempt) const
    {
        const double delay_ms = static_cast<double>(base_delay.count()) * std::pow(multiplier, static_cast<double>(attempt));
        return std::chrono::milliseconds(static_cast<long long>(delay_ms));
    }
};

/// Transient failures are retried; permanent rejection and cancellation end the loop at once
[[nodiscard]] inline bool is_retryable(const error_info& err) noexcept
{
    switch (err.kind())
    {
        case error_kind::auth_transient:
        case error_kind::protocol:
            return true;
        default:
            return false;
    }
}

class refresh_engine
{
public:
    refresh_engine(token_client& client, retry_policy policy = retry_policy::defaults())
        : client_(client), policy_(std::move(policy))
    {
    }

    [[nodiscard]] const retry_policy& policy() const noexcept { return policy_; }

    /**
    Exchange a refresh token for a new token pair.

    @return The reply, or the first non-retryable failure as is (`auth_reauthorization_required`,
            `cancelled`), or `auth_refresh_failed` carrying the last cause once attempts run out.
    **/
    qboauth::asio::awaitable<result<token_response>> refresh(std::string refresh_token, std::stop_token stop = {})
    {
        if (refresh_token.empty())
            co_return fail<token_response>(errc::invalid_argument, "no refresh token");

        const unsigned int attempts = policy_.max_attempts == 0 ? 1 : policy_.max_attempts;
        error_info last;
        for (unsigned int attempt = 1; attempt <= attempts; ++attempt)
        {
            if (stop.stop_requested())
                co_return detail::make_unexpected(detail::cancelled_error("token refresh"));

            auto reply = co_await client_.refresh(refresh_token, stop);
            if (reply)
            {
                if (attempt > 1)
                    QBOAUTH_INFO(std::format("Token refresh succeeded on attempt {}", attempt));
                co_return reply;
            }

            last = std::move(reply).error();
            if (!is_retryable(last))
            {
                if (last.kind() == error_kind::auth_permanent)
                    QBOAUTH_WARN(std::format("Refresh token rejected: {}", last.to_string()));
                co_return detail::make_unexpected(std::move(last));
            }
            if (attempt == attempts)
                break;

            const auto delay = policy_.delay_for(attempt);
            QBOAUTH_WARN(std::format("Token refresh attempt {}/{} failed: {}; retrying in {} ms",
                attempt, attempts, last.to_string(), delay.count()));
            if (policy_.on_retry)
                policy_.on_retry(attempt, delay, last);

            auto slept = co_await detail::async_sleep(delay, stop);
            if (!slept)
                co_return detail::make_unexpected(std::move(slept).error());
        }

        QBOAUTH_ERROR(std::format("Token refresh failed after {} attempts: {}", attempts, last.to_string()));
        detail::error_detail info;
        info.add_int("attempts", attempts);
        info.add_cause(last);
        co_return fail<token_response>(errc::auth_refresh_failed,
            std::format("token refresh failed after {} attempts: {}", attempts, last.message), info.str());
    }

private:
    token_client& client_;
    retry_policy policy_;
};

} // namespace qboauth::oauth2
