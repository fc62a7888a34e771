/*

result.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Error handling types using std::expected (C++23).
No exceptions are thrown by qboauth operations - all errors are returned via result<T>.

*/

#pragma once

#include <cstdint>
#include <expected>
#include <format>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace qboauth
{

/// Concrete error codes for qboauth operations
enum class errc : std::uint16_t
{
    ok = 0,

    // Configuration (100-199)
    config_missing_client_id = 100,
    config_invalid_value = 101,

    // Authentication (200-299)
    auth_reauthorization_required = 200,
    auth_refresh_failed = 201,
    auth_exchange_failed = 202,
    auth_not_completed = 203,
    auth_state_mismatch = 204,
    auth_denied = 205,

    // Protocol (300-399)
    protocol_malformed_response = 300,
    http_status_error = 301,
    http_bad_url = 302,

    // Network (400-499)
    net_resolve_failed = 400,
    net_connect_failed = 401,
    net_connection_refused = 402,
    net_connection_reset = 403,
    net_timeout = 404,
    net_eof = 405,
    net_io_failed = 406,
    tls_handshake_failed = 407,
    tls_verify_failed = 408,

    // Local infrastructure (500-599)
    listener_bind_failed = 500,
    listener_timeout = 501,
    tunnel_start_failed = 502,
    tunnel_error = 503,
    tunnel_timeout = 504,
    browser_launch_failed = 505,

    // Storage (600-699)
    secret_store_failed = 600,
    settings_save_failed = 601,
    settings_load_failed = 602,

    // Misc (900-999)
    invalid_argument = 900,
    internal_error = 901,
    cancelled = 902,
};

/// Error taxonomy used by callers to branch on the nature of a failure
enum class error_kind : std::uint8_t
{
    none,
    configuration,
    auth_permanent,
    auth_transient,
    protocol,
    cancelled,
    infrastructure,
    internal
};

[[nodiscard]] constexpr std::string_view to_string(errc code) noexcept
{
    switch (code)
    {
        case errc::ok: return "ok";
        case errc::config_missing_client_id: return "config_missing_client_id";
        case errc::config_invalid_value: return "config_invalid_value";
        case errc::auth_reauthorization_required: return "auth_reauthorization_required";
        case errc::auth_refresh_failed: return "auth_refresh_failed";
        case errc::auth_exchange_failed: return "auth_exchange_failed";
        case errc::auth_not_completed: return "auth_not_completed";
        case errc::auth_state_mismatch: return "auth_state_mismatch";
        case errc::auth_denied: return "auth_denied";
        case errc::protocol_malformed_response: return "protocol_malformed_response";
        case errc::http_status_error: return "http_status_error";
        case errc::http_bad_url: return "http_bad_url";
        case errc::net_resolve_failed: return "net_resolve_failed";
        case errc::net_connect_failed: return "net_connect_failed";
        case errc::net_connection_refused: return "net_connection_refused";
        case errc::net_connection_reset: return "net_connection_reset";
        case errc::net_timeout: return "net_timeout";
        case errc::net_eof: return "net_eof";
        case errc::net_io_failed: return "net_io_failed";
        case errc::tls_handshake_failed: return "tls_handshake_failed";
        case errc::tls_verify_failed: return "tls_verify_failed";
        case errc::listener_bind_failed: return "listener_bind_failed";
        case errc::listener_timeout: return "listener_timeout";
        case errc::tunnel_start_failed: return "tunnel_start_failed";
        case errc::tunnel_error: return "tunnel_error";
        case errc::tunnel_timeout: return "tunnel_timeout";
        case errc::browser_launch_failed: return "browser_launch_failed";
        case errc::secret_store_failed: return "secret_store_failed";
        case errc::settings_save_failed: return "settings_save_failed";
        case errc::settings_load_failed: return "settings_load_failed";
        case errc::invalid_argument: return "invalid_argument";
        case errc::internal_error: return "internal_error";
        case errc::cancelled: return "cancelled";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view to_string(error_kind kind) noexcept
{
    switch (kind)
    {
        case error_kind::none: return "none";
        case error_kind::configuration: return "configuration";
        case error_kind::auth_permanent: return "auth_permanent";
        case error_kind::auth_transient: return "auth_transient";
        case error_kind::protocol: return "protocol";
        case error_kind::cancelled: return "cancelled";
        case error_kind::infrastructure: return "infrastructure";
        case error_kind::internal: return "internal";
    }
    return "unknown";
}

/// Map a concrete code onto the error taxonomy
[[nodiscard]] constexpr error_kind kind_of(errc code) noexcept
{
    if (code == errc::ok)
        return error_kind::none;
    if (code == errc::cancelled)
        return error_kind::cancelled;

    const auto c = static_cast<std::uint16_t>(code);
    if ((c >= 100 && c < 200) || code == errc::http_bad_url)
        return error_kind::configuration;
    if (code == errc::auth_reauthorization_required)
        return error_kind::auth_permanent;
    if (c >= 200 && c < 300)
        return error_kind::auth_transient;
    if (code == errc::protocol_malformed_response)
        return error_kind::protocol;
    if (c >= 300 && c < 500)
        return error_kind::auth_transient;
    if (c >= 500 && c < 700)
        return error_kind::infrastructure;
    return error_kind::internal;
}

struct error_info
{
    errc code{errc::ok};
    std::string message;
    std::string detail;
    std::error_code sys{};
    std::source_location where{};

    [[nodiscard]] error_kind kind() const noexcept { return kind_of(code); }

    [[nodiscard]] bool is(errc ec) const noexcept { return code == ec; }

    [[nodiscard]] bool is_cancelled() const noexcept { return code == errc::cancelled; }

    /// Format for logs; detail is expected to be redacted already
    [[nodiscard]] std::string to_string() const
    {
        std::string text = std::format("[{}] {}", qboauth::to_string(code), message);
        if (sys)
            text += std::format(" ({})", sys.message());
        return text;
    }
};

template<typename T>
using result = std::expected<T, error_info>;

using result_void = result<void>;

[[nodiscard]] inline error_info make_error(errc code, std::string message, std::string detail = {},
    std::error_code sys = {}, std::source_location where = std::source_location::current())
{
    if (message.empty())
        message = std::string(to_string(code));
    return error_info{code, std::move(message), std::move(detail), sys, where};
}

template<typename T>
[[nodiscard]] constexpr result<std::decay_t<T>> ok(T&& value)
{
    return result<std::decay_t<T>>(std::forward<T>(value));
}

[[nodiscard]] inline constexpr result_void ok()
{
    return result_void{};
}

template<typename T = void>
[[nodiscard]] inline result<T> fail(error_info err)
{
    return std::unexpected(std::move(err));
}

template<typename T = void>
[[nodiscard]] inline result<T> fail(errc code, std::string message = {}, std::string detail = {},
    std::source_location where = std::source_location::current())
{
    return std::unexpected(make_error(code, std::move(message), std::move(detail), {}, where));
}

[[nodiscard]] inline result_void fail_void(errc code, std::string message = {},
    std::source_location where = std::source_location::current())
{
    return std::unexpected(make_error(code, std::move(message), {}, {}, where));
}

namespace detail
{

[[nodiscard]] inline std::unexpected<error_info> make_unexpected(error_info err)
{
    return std::unexpected(std::move(err));
}

} // namespace detail

} // namespace qboauth
