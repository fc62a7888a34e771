/*

listener_permission.hpp
-----------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

OS permission to serve an HTTP prefix locally. On Windows this is the HTTP.sys URL
reservation (netsh http urlacl); on POSIX systems it is the privileged port range.

*/

#pragma once

#include <cstdint>
#include <format>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>

#if !defined(_WIN32)
#include <unistd.h>
#endif

#include <qboauth/detail/asio_decl.hpp>
#include <qboauth/detail/env.hpp>
#include <qboauth/detail/log.hpp>
#include <qboauth/detail/redact.hpp>
#include <qboauth/net/url.hpp>
#include <qboauth/platform/process.hpp>

namespace qboauth::platform
{

#if !defined(_WIN32)
/// First port an unprivileged process may bind, 1024 when the kernel does not say otherwise
[[nodiscard]] inline std::uint16_t unprivileged_port_start()
{
    std::ifstream in("/proc/sys/net/ipv4/ip_unprivileged_port_start");
    unsigned int value = 1024;
    if (in >> value && value <= 65535)
        return static_cast<std::uint16_t>(value);
    return 1024;
}
#endif

/**
Command that grants the permission, or frees the port, for a prefix that failed to bind.

@param prefix Listener prefix such as `http://localhost:8080/`.
@param ec     Bind error; `address_in_use` yields a command locating the current owner.
**/
[[nodiscard]] inline std::string remediation_command(std::string_view prefix, const qboauth::asio::error_code& ec = {})
{
    const auto parsed = net::parse_url(prefix);
    const std::uint16_t port = parsed ? parsed->port : 0;

    if (ec == qboauth::asio::error::address_in_use)
    {
#if defined(_WIN32)
        return std::format("netstat -ano | findstr :{}", port);
#else
        return std::format("lsof -nP -iTCP:{} -sTCP:LISTEN", port);
#endif
    }

#if defined(_WIN32)
    return std::format("netsh http add urlacl url={} user=%USERNAME%", prefix);
#else
    return std::format("sudo sysctl -w net.ipv4.ip_unprivileged_port_start={}", port);
#endif
}

/// Advisory: true when the current user may serve the prefix
inline bool check_listener_permission(std::string_view prefix)
{
#if defined(_WIN32)
    auto shown = run_command("netsh", {"http", "show", "urlacl", "url=" + std::string(prefix)});
    if (!shown)
    {
        QBOAUTH_DEBUG(std::format("URL ACL check for {} failed: {}", prefix, shown.error().to_string()));
        return false;
    }
    return detail::contains_ci(shown->output, prefix);
#else
    const auto parsed = net::parse_url(prefix);
    if (!parsed)
    {
        QBOAUTH_DEBUG(std::format("Listener permission check skipped for '{}': {}", prefix, parsed.error().message));
        return false;
    }
    if (parsed->port >= unprivileged_port_start())
        return true;
    return ::geteuid() == 0;
#endif
}

/**
Advisory: try to acquire the permission to serve the prefix.

Never fails hard; the bind that follows reports the real outcome with its remediation.
**/
inline bool grant_listener_permission(std::string_view prefix)
{
    if (check_listener_permission(prefix))
        return true;

#if defined(_WIN32)
    const auto user = detail::getenv_nonempty("USERNAME").value_or("Everyone");
    auto added = run_command("netsh", {"http", "add", "urlacl", "url=" + std::string(prefix), "user=" + user});
    if (!added || added->exit_code != 0)
    {
        QBOAUTH_WARN(std::format("Could not reserve {} (run as administrator: {})", prefix, remediation_command(prefix)));
        return false;
    }
    QBOAUTH_INFO(std::format("Reserved URL ACL for {}", prefix));
    return true;
#else
    QBOAUTH_WARN(std::format("Binding {} needs elevated privileges: {}", prefix, remediation_command(prefix)));
    return false;
#endif
}

} // namespace qboauth::platform
