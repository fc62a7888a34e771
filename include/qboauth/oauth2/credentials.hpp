/*

credentials.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <qboauth/detail/redact.hpp>

namespace qboauth::oauth2
{

inline constexpr std::string_view DEFAULT_REDIRECT_URI = "http://localhost:8080/callback/";
inline constexpr std::string_view DEFAULT_SCOPE = "com.intuit.quickbooks.accounting";
inline constexpr std::string_view AUTHORIZATION_ENDPOINT = "https://appcenter.intuit.com/connect/oauth2";
inline constexpr std::string_view TOKEN_ENDPOINT = "https://oauth.platform.intuit.com/oauth2/v1/tokens/bearer";

enum class environment
{
    sandbox,
    production
};

[[nodiscard]] constexpr std::string_view to_string(environment env) noexcept
{
    switch (env)
    {
        case environment::sandbox: return "sandbox";
        case environment::production: return "production";
    }
    return "sandbox";
}

/// Case-insensitive; nullopt for anything but "sandbox" or "production"
[[nodiscard]] inline std::optional<environment> parse_environment(std::string_view text) noexcept
{
    if (detail::iequals_ascii(text, "sandbox"))
        return environment::sandbox;
    if (detail::iequals_ascii(text, "production"))
        return environment::production;
    return std::nullopt;
}

/// Provider endpoints and requested scopes
struct endpoints
{
    std::string authorization{AUTHORIZATION_ENDPOINT};
    std::string token{TOKEN_ENDPOINT};
    std::vector<std::string> scopes{std::string(DEFAULT_SCOPE)};
};

/// Application registration, loaded once and immutable afterwards
struct credentials
{
    std::string client_id;
    /// Empty for public clients
    std::string client_secret;
    std::string redirect_uri{DEFAULT_REDIRECT_URI};
    environment env = environment::sandbox;
    /// Company (realm) id, captured from the first successful callback when unknown
    std::optional<std::string> realm_id;
    /// Provider page opened before the consent screen to pick the right account
    std::optional<std::string> prelogin_url;
};

} // namespace qboauth::oauth2
