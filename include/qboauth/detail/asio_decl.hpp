/*

asio_decl.hpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Centralized Boost.Asio / Boost.Beast declarations for qboauth.
This header simplifies async notation throughout the library.

*/

#pragma once

#include <boost/asio/version.hpp>
#if BOOST_ASIO_VERSION < 102100 // Boost.Asio 1.21.0
#error "Boost.Asio version 1.21.0 or higher is required (Boost 1.78+)"
#endif

#include <boost/asio.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/ssl.hpp>

#if defined(BOOST_ASIO_HAS_CO_AWAIT)
#include <boost/asio/as_tuple.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

namespace qboauth::asio
{
    // Core types
    using boost::asio::awaitable;
    using boost::asio::buffer;
    using boost::asio::co_spawn;
    using boost::asio::detached;
    using boost::asio::use_awaitable;
    using boost::asio::io_context;
    using boost::asio::any_io_executor;
    using boost::asio::steady_timer;
    using boost::asio::redirect_error;
    using boost::asio::post;
    using boost::asio::dispatch;
    using boost::asio::make_strand;
    using boost::asio::socket_base;

    // IP networking
    namespace ip = boost::asio::ip;
    using tcp = boost::asio::ip::tcp;

    // Async operations
    using boost::asio::async_read_until;
    using boost::asio::async_connect;
    using boost::asio::dynamic_buffer;
    using boost::asio::get_lowest_layer;

    namespace ssl = boost::asio::ssl;
    namespace error = boost::asio::error;

    /// Non-throwing awaitable for use with std::expected
    inline constexpr auto use_nothrow_awaitable = boost::asio::as_tuple(boost::asio::use_awaitable);

    using error_code = boost::system::error_code;
    using system_error = boost::system::system_error;

} // namespace qboauth::asio

namespace qboauth::beast
{
    using boost::beast::flat_buffer;
    using boost::beast::tcp_stream;
    using boost::beast::ssl_stream;
    using boost::beast::get_lowest_layer;

    namespace http = boost::beast::http;
    namespace error = boost::beast::error;

} // namespace qboauth::beast

#else
#error "qboauth requires coroutine support (C++20) and Boost.Asio 1.21+ (Boost 1.78+)"
#endif

// Common chrono literals
namespace qboauth
{
    using namespace std::literals::chrono_literals;
    using std::chrono::steady_clock;
    using std::chrono::system_clock;
}
