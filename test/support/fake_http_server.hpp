/*

fake_http_server.hpp
--------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

In-process HTTP server on 127.0.0.1 serving scripted replies, plus helpers to drive
coroutine tests to completion.

*/

#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <exception>
#include <format>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <mutex>
#include <string_view>
#include <thread>
#include <vector>

#include <qboauth/detail/asio_decl.hpp>
#include <qboauth/net/http_client.hpp>

namespace qboauth::test
{

struct recorded_request
{
    std::string method;
    std::string target;
    std::string body;
    std::map<std::string, std::string> headers;
    std::chrono::steady_clock::time_point received_at;
};

struct canned_response
{
    unsigned int status = 200;
    std::string body;
    std::string content_type{"application/json"};
    /// Held back this long after the request was read
    std::chrono::milliseconds delay{0};
};

/// Replies are served in order; the last one repeats once the queue is down to it
class fake_http_server
{
public:
    explicit fake_http_server(qboauth::asio::io_context& ioc)
        : state_(std::make_shared<shared_state>(ioc))
    {
        using qboauth::asio::tcp;
        const tcp::endpoint endpoint(qboauth::asio::ip::make_address_v4("127.0.0.1"), 0);
        state_->acceptor.open(endpoint.protocol());
        state_->acceptor.set_option(tcp::acceptor::reuse_address(true));
        state_->acceptor.bind(endpoint);
        state_->acceptor.listen();
        state_->port = state_->acceptor.local_endpoint().port();
        qboauth::asio::co_spawn(ioc, accept_loop(state_), qboauth::asio::detached);
    }

    fake_http_server(const fake_http_server&) = delete;
    fake_http_server& operator=(const fake_http_server&) = delete;

    ~fake_http_server()
    {
        stop();
    }

    void enqueue(canned_response response)
    {
        state_->replies.push_back(std::move(response));
    }

    [[nodiscard]] std::uint16_t port() const
    {
        return state_->port;
    }

    [[nodiscard]] std::string url(std::string_view path = "/") const
    {
        return std::format("http://127.0.0.1:{}{}", port(), path);
    }

    [[nodiscard]] const std::vector<recorded_request>& requests() const
    {
        return state_->requests;
    }

    void stop()
    {
        qboauth::asio::error_code ignored;
        state_->acceptor.close(ignored);
    }

private:
    struct shared_state
    {
        explicit shared_state(qboauth::asio::io_context& ioc)
            : acceptor(ioc)
        {
        }

        qboauth::asio::tcp::acceptor acceptor;
        std::uint16_t port = 0;
        std::deque<canned_response> replies;
        std::vector<recorded_request> requests;
    };

    static qboauth::asio::awaitable<void> accept_loop(std::shared_ptr<shared_state> state)
    {
        while (true)
        {
            auto [ec, socket] = co_await state->acceptor.async_accept(qboauth::asio::use_nothrow_awaitable);
            if (ec)
                co_return;
            co_await serve(state, std::move(socket));
        }
    }

    static qboauth::asio::awaitable<void> serve(std::shared_ptr<shared_state> state, qboauth::asio::tcp::socket socket)
    {
        namespace http = qboauth::beast::http;
        using qboauth::asio::use_nothrow_awaitable;

        qboauth::beast::tcp_stream stream(std::move(socket));
        qboauth::beast::flat_buffer buffer;
        http::request<http::string_body> req;
        auto [read_ec, read] = co_await http::async_read(stream, buffer, req, use_nothrow_awaitable);
        (void)read;
        if (read_ec)
            co_return;

        recorded_request record;
        record.method = std::string(net::to_string_view(req.method_string()));
        record.target = std::string(net::to_string_view(req.target()));
        record.body = req.body();
        record.received_at = std::chrono::steady_clock::now();
        for (const auto& field : req)
            record.headers[std::string(net::to_string_view(field.name_string()))] = std::string(net::to_string_view(field.value()));
        state->requests.push_back(std::move(record));

        canned_response reply{404, "{}", "application/json"};
        if (!state->replies.empty())
        {
            reply = state->replies.front();
            if (state->replies.size() > 1)
                state->replies.pop_front();
        }

        if (reply.delay.count() > 0)
        {
            qboauth::asio::steady_timer timer(stream.get_executor(), reply.delay);
            auto [timer_ec] = co_await timer.async_wait(use_nothrow_awaitable);
            (void)timer_ec;
        }

        http::response<http::string_body> res{static_cast<http::status>(reply.status), 11};
        res.set(http::field::content_type, reply.content_type);
        res.set(http::field::connection, "close");
        res.body() = reply.body;
        res.prepare_payload();
        auto [write_ec, written] = co_await http::async_write(stream, res, use_nothrow_awaitable);
        (void)write_ec;
        (void)written;

        qboauth::asio::error_code ignored;
        stream.socket().shutdown(qboauth::asio::tcp::socket::shutdown_both, ignored);
    }

    std::shared_ptr<shared_state> state_;
};

/// A port that was free a moment ago on 127.0.0.1
[[nodiscard]] inline std::uint16_t free_port()
{
    qboauth::asio::io_context ioc;
    qboauth::asio::tcp::acceptor acceptor(ioc,
        qboauth::asio::tcp::endpoint(qboauth::asio::ip::make_address_v4("127.0.0.1"), 0));
    return acceptor.local_endpoint().port();
}

/// Run `body` on `ctx` until it completes, then stop the context; exceptions are rethrown
inline void run_coroutine(qboauth::asio::io_context& ctx, std::function<qboauth::asio::awaitable<void>()> body)
{
    std::exception_ptr failure;
    qboauth::asio::co_spawn(ctx, body(),
        [&](std::exception_ptr e)
        {
            failure = e;
            ctx.stop();
        });
    ctx.run();
    if (failure)
        std::rethrow_exception(failure);
}

/**
run_coroutine with `threads` threads running `ctx`.

Boost.Test assertions are not thread-safe: record outcomes in the body and check them
once this returns.
**/
inline void run_coroutine_threaded(qboauth::asio::io_context& ctx, std::size_t threads,
    std::function<qboauth::asio::awaitable<void>()> body)
{
    std::mutex failure_mutex;
    std::exception_ptr failure;
    qboauth::asio::co_spawn(ctx, body(),
        [&](std::exception_ptr e)
        {
            {
                std::lock_guard<std::mutex> lock(failure_mutex);
                failure = e;
            }
            ctx.stop();
        });

    std::vector<std::thread> pool;
    for (std::size_t i = 1; i < threads; ++i)
        pool.emplace_back([&ctx]() { ctx.run(); });
    ctx.run();
    for (auto& t : pool)
        t.join();
    if (failure)
        std::rethrow_exception(failure);
}

} // namespace qboauth::test
