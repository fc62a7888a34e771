/*

token.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

OAuth2 token pair and token endpoint reply.

*/

#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace qboauth::oauth2
{

/// Safety margin applied by token::is_valid so a token does not expire mid-request
inline constexpr std::chrono::seconds VALIDITY_MARGIN{60};

struct token
{
    std::string access_token;
    std::string refresh_token;
    /// nullopt: never obtained
    std::optional<std::chrono::system_clock::time_point> expires_at;
    std::optional<std::chrono::system_clock::time_point> refresh_expires_at;

    /// Usable for a request: access token present and expiring strictly after now + margin
    [[nodiscard]] bool is_valid(std::chrono::system_clock::time_point now,
        std::chrono::seconds margin = VALIDITY_MARGIN) const noexcept
    {
        if (access_token.empty() || !expires_at)
            return false;
        return *expires_at > now + margin;
    }

    /// Plain expiry comparison, no margin
    [[nodiscard]] bool is_expired(std::chrono::system_clock::time_point now) const noexcept
    {
        return expires_at.has_value() && *expires_at <= now;
    }

    [[nodiscard]] bool has_tokens() const noexcept
    {
        return !access_token.empty() && !refresh_token.empty();
    }
};

/// Successful token endpoint reply
struct token_response
{
    std::string access_token;
    /// Absent when the provider does not rotate refresh tokens
    std::optional<std::string> refresh_token;
    std::chrono::seconds expires_in{0};
    std::optional<std::chrono::seconds> refresh_expires_in;
    std::string token_type;
};

} // namespace qboauth::oauth2
