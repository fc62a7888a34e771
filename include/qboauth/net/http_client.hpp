/*

http_client.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

One-shot HTTP/1.1 client over Beast, plain TCP or TLS depending on the URL scheme.
Each request opens a connection, sends `Connection: close` and reads one response.

*/

#pragma once

#include <chrono>
#include <cstddef>
#include <format>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <qboauth/codec/percent.hpp>
#include <qboauth/detail/asio_decl.hpp>
#include <qboauth/detail/cancellation.hpp>
#include <qboauth/detail/log.hpp>
#include <qboauth/detail/redact.hpp>
#include <qboauth/detail/result.hpp>
#include <qboauth/net/error_mapping.hpp>
#include <qboauth/net/tls_options.hpp>
#include <qboauth/net/url.hpp>

namespace qboauth::net
{

using header_list = std::vector<std::pair<std::string, std::string>>;

[[nodiscard]] inline std::string_view to_string_view(boost::beast::string_view text) noexcept
{
    return std::string_view(text.data(), text.size());
}

struct http_client_options
{
    /// Applies to connect, handshake, write and read separately
    std::chrono::steady_clock::duration timeout = std::chrono::seconds{30};
    std::size_t body_limit = 1024 * 1024;
    std::string user_agent = "qboauth/1.0";
    tls_options tls;
};

struct http_request
{
    qboauth::beast::http::verb method = qboauth::beast::http::verb::get;
    std::string url;
    header_list headers;
    std::string body;
    std::string content_type;
};

struct http_response
{
    unsigned int status = 0;
    std::string body;
    std::string content_type;

    [[nodiscard]] bool is_success() const noexcept { return status >= 200 && status < 300; }
};

class http_client
{
public:
    explicit http_client(http_client_options options = {})
        : options_(std::move(options))
    {
    }

    [[nodiscard]] const http_client_options& options() const noexcept { return options_; }

    qboauth::asio::awaitable<result<http_response>> get(std::string_view url, header_list headers = {},
        std::stop_token stop = {})
    {
        http_request request;
        request.method = qboauth::beast::http::verb::get;
        request.url = std::string(url);
        request.headers = std::move(headers);
        co_return co_await send(request, stop);
    }

    /// POST an application/x-www-form-urlencoded body
    qboauth::asio::awaitable<result<http_response>> post_form(std::string_view url, const codec::form_fields& fields,
        header_list headers = {}, std::stop_token stop = {})
    {
        http_request request;
        request.method = qboauth::beast::http::verb::post;
        request.url = std::string(url);
        request.headers = std::move(headers);
        request.content_type = "application/x-www-form-urlencoded";
        request.body = codec::form_encode(fields);
        co_return co_await send(request, stop);
    }

    /**
    Perform one request.

    Any HTTP status is a successful result; only transport failures are errors.
    A stop request closes the connection and yields `cancelled`.
    **/
    qboauth::asio::awaitable<result<http_response>> send(const http_request& request, std::stop_token stop = {})
    {
        auto executor = co_await boost::asio::this_coro::executor;
        co_return co_await detail::run_on(qboauth::asio::make_strand(executor), perform(request, std::move(stop)));
    }

private:
    /// Runs on a strand of its own, shared with the cancellation handlers
    qboauth::asio::awaitable<result<http_response>> perform(const http_request& request, std::stop_token stop)
    {
        namespace http = qboauth::beast::http;
        using qboauth::asio::use_nothrow_awaitable;

        auto target = parse_url(request.url);
        if (!target)
            co_return detail::make_unexpected(std::move(target).error());
        if (stop.stop_requested())
            co_return detail::make_unexpected(detail::cancelled_error("HTTP request"));

        auto executor = co_await boost::asio::this_coro::executor;

        qboauth::asio::tcp::resolver resolver(executor);
        qboauth::asio::tcp::resolver::results_type endpoints;
        {
            detail::stop_guard on_stop(executor, stop, [&resolver]() { resolver.cancel(); });
            auto [ec, found] = co_await resolver.async_resolve(target->host, target->service(), use_nothrow_awaitable);
            if (ec)
                co_return detail::make_unexpected(make_net_error(io_stage::resolve, ec, false, stop.stop_requested(),
                    make_net_detail(target->scheme, target->host, target->service(), io_stage::resolve, "async_resolve")));
            endpoints = std::move(found);
        }

        http::request<http::string_body> req{request.method, target->target(), 11};
        req.set(http::field::host, target->host_header());
        req.set(http::field::user_agent, options_.user_agent);
        req.set(http::field::connection, "close");
        for (const auto& [name, value] : request.headers)
            req.set(name, value);
        if (!request.content_type.empty())
            req.set(http::field::content_type, request.content_type);
        if (request.method != http::verb::get || !request.body.empty())
        {
            req.body() = request.body;
            req.prepare_payload();
        }
        trace_request(req);

        if (target->is_https())
        {
            qboauth::asio::ssl::context ctx(qboauth::asio::ssl::context::tls_client);
            auto configured = configure_context(ctx, options_.tls);
            if (!configured)
                co_return detail::make_unexpected(std::move(configured).error());

            qboauth::beast::ssl_stream<qboauth::beast::tcp_stream> stream(executor, ctx);
            auto prepared = prepare_client_stream(stream, target->host, options_.tls);
            if (!prepared)
                co_return detail::make_unexpected(std::move(prepared).error());

            detail::stop_guard on_stop(executor, stop, [&stream]() { qboauth::beast::get_lowest_layer(stream).cancel(); });
            auto& lowest = qboauth::beast::get_lowest_layer(stream);

            lowest.expires_after(options_.timeout);
            auto [cec, connected] = co_await lowest.async_connect(endpoints, use_nothrow_awaitable);
            (void)connected;
            if (cec)
                co_return detail::make_unexpected(failure(io_stage::connect, cec, stop, *target, "async_connect"));

            lowest.expires_after(options_.timeout);
            auto [hec] = co_await stream.async_handshake(qboauth::asio::ssl::stream_base::client, use_nothrow_awaitable);
            if (hec)
                co_return detail::make_unexpected(failure(io_stage::handshake, hec, stop, *target, "async_handshake"));

            auto response = co_await exchange(stream, lowest, req, stop, *target);
            if (!response)
                co_return response;

            lowest.expires_after(options_.timeout);
            auto [sec] = co_await stream.async_shutdown(use_nothrow_awaitable);
            if (sec && sec != qboauth::asio::ssl::error::stream_truncated && sec != qboauth::asio::error::eof)
                QBOAUTH_DEBUG(std::format("TLS shutdown with {}: {}", target->host, sec.message()));
            co_return response;
        }

        qboauth::beast::tcp_stream stream(executor);
        detail::stop_guard on_stop(executor, stop, [&stream]() { stream.cancel(); });

        stream.expires_after(options_.timeout);
        auto [cec, connected] = co_await stream.async_connect(endpoints, use_nothrow_awaitable);
        (void)connected;
        if (cec)
            co_return detail::make_unexpected(failure(io_stage::connect, cec, stop, *target, "async_connect"));

        auto response = co_await exchange(stream, stream, req, stop, *target);

        qboauth::asio::error_code sec;
        stream.socket().shutdown(qboauth::asio::tcp::socket::shutdown_both, sec);
        if (sec && sec != qboauth::asio::error::not_connected)
            QBOAUTH_DEBUG(std::format("TCP shutdown with {}: {}", target->host, sec.message()));
        co_return response;
    }

    template<typename Stream>
    qboauth::asio::awaitable<result<http_response>> exchange(Stream& stream, qboauth::beast::tcp_stream& lowest,
        qboauth::beast::http::request<qboauth::beast::http::string_body>& req, const std::stop_token& stop, const url& target)
    {
        namespace http = qboauth::beast::http;
        using qboauth::asio::use_nothrow_awaitable;

        lowest.expires_after(options_.timeout);
        auto [wec, written] = co_await http::async_write(stream, req, use_nothrow_awaitable);
        (void)written;
        if (wec)
            co_return detail::make_unexpected(failure(io_stage::write, wec, stop, target, "async_write"));

        qboauth::beast::flat_buffer buffer;
        http::response_parser<http::string_body> parser;
        parser.body_limit(options_.body_limit);
        lowest.expires_after(options_.timeout);
        auto [rec, read] = co_await http::async_read(stream, buffer, parser, use_nothrow_awaitable);
        (void)read;
        if (rec)
            co_return detail::make_unexpected(failure(io_stage::read, rec, stop, target, "async_read"));

        auto res = parser.release();
        http_response response;
        response.status = res.result_int();
        response.content_type = std::string(to_string_view(res[http::field::content_type]));
        response.body = std::move(res.body());

        QBOAUTH_TRACE_RECV("HTTP", std::format("{} {}", response.status, detail::redact_json(response.body)));
        QBOAUTH_DEBUG(std::format("{} {}{} -> {}", to_string_view(http::to_string(req.method())),
            target.host, target.path, response.status));
        co_return response;
    }

    [[nodiscard]] static error_info failure(io_stage stage, const qboauth::asio::error_code& ec,
        const std::stop_token& stop, const url& target, std::string_view op)
    {
        return make_net_error(stage, ec, false, stop.stop_requested(),
            make_net_detail(target.scheme, target.host, target.service(), stage, op));
    }

    static void trace_request(const qboauth::beast::http::request<qboauth::beast::http::string_body>& req)
    {
        if (!log::logger::instance().is_trace_enabled())
            return;

        std::string text = std::format("{} {}", to_string_view(qboauth::beast::http::to_string(req.method())),
            detail::redact_target(to_string_view(req.target())));
        for (const auto& field : req)
        {
            text += "\n";
            text += detail::redact_header_line(std::format("{}: {}", to_string_view(field.name_string()),
                to_string_view(field.value())));
        }
        if (!req.body().empty())
        {
            text += "\n\n";
            text += detail::redact_form(req.body());
        }
        QBOAUTH_TRACE_SEND("HTTP", text);
    }

    http_client_options options_;
};

} // namespace qboauth::net
