/*

error_mapping.hpp
-----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Centralized mapping between Asio/Beast error codes and qboauth::errc for network I/O.

*/

#pragma once

#include <string_view>
#include <system_error>

#include <qboauth/detail/asio_decl.hpp>
#include <qboauth/detail/error_detail.hpp>
#include <qboauth/detail/result.hpp>

namespace qboauth::net
{

enum class io_stage
{
    resolve,
    connect,
    handshake,
    write,
    read,
    accept
};

[[nodiscard]] constexpr std::string_view stage_name(io_stage stage) noexcept
{
    switch (stage)
    {
        case io_stage::resolve: return "resolve";
        case io_stage::connect: return "connect";
        case io_stage::handshake: return "handshake";
        case io_stage::write: return "write";
        case io_stage::read: return "read";
        case io_stage::accept: return "accept";
    }
    return "unknown";
}

/**
Map a failed I/O step onto an errc.

@param stage             Step that failed.
@param ec                Error reported by Asio or Beast.
@param timeout_triggered Our own deadline fired.
@param stop_requested    The caller's stop token fired; aborted operations then map to `cancelled`.
**/
[[nodiscard]] inline errc map_net_error(io_stage stage, const qboauth::asio::error_code& ec, bool timeout_triggered,
    bool stop_requested = false) noexcept
{
    if (stop_requested && (ec == qboauth::asio::error::operation_aborted || ec == qboauth::asio::error::bad_descriptor))
        return errc::cancelled;
    if (timeout_triggered || ec == qboauth::asio::error::timed_out || ec == qboauth::beast::error::timeout)
        return errc::net_timeout;
    if (ec == qboauth::asio::error::operation_aborted)
        return stop_requested ? errc::cancelled : errc::net_io_failed;
    if (ec == qboauth::asio::error::eof || ec == qboauth::beast::http::error::end_of_stream)
        return errc::net_eof;
    if (ec == qboauth::asio::error::connection_refused)
        return errc::net_connection_refused;
    if (ec == qboauth::asio::error::connection_reset ||
        ec == qboauth::asio::error::broken_pipe)
        return errc::net_connection_reset;
    if (ec == qboauth::asio::error::host_not_found ||
        ec == qboauth::asio::error::host_not_found_try_again)
        return errc::net_resolve_failed;
    if (ec.category() == qboauth::asio::error::get_ssl_category())
        return stage == io_stage::handshake ? errc::tls_verify_failed : errc::net_io_failed;

    switch (stage)
    {
        case io_stage::resolve: return errc::net_resolve_failed;
        case io_stage::connect: return errc::net_connect_failed;
        case io_stage::handshake: return errc::tls_handshake_failed;
        case io_stage::write: return errc::net_io_failed;
        case io_stage::read: return errc::net_io_failed;
        case io_stage::accept: return errc::net_io_failed;
    }
    return errc::net_io_failed;
}

[[nodiscard]] inline detail::error_detail make_net_detail(
    std::string_view proto,
    std::string_view host,
    std::string_view service,
    io_stage stage,
    std::string_view op)
{
    detail::error_detail detail;
    detail.add("proto", proto);
    detail.add("host", host);
    detail.add("service", service);
    detail.add("stage", stage_name(stage));
    detail.add("op", op);
    return detail;
}

/// Build the error_info for a failed I/O step
[[nodiscard]] inline error_info make_net_error(io_stage stage, const qboauth::asio::error_code& ec, bool timeout_triggered,
    bool stop_requested, detail::error_detail detail,
    std::source_location where = std::source_location::current())
{
    const errc code = map_net_error(stage, ec, timeout_triggered, stop_requested);
    if (ec)
        detail.add_ec("ec", ec);
    std::string message = code == errc::cancelled
        ? std::string("operation cancelled")
        : std::string(stage_name(stage)) + " failed";
    return make_error(code, std::move(message), detail.str(), ec, where);
}

} // namespace qboauth::net
