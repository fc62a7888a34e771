/*

test_refresh_engine.cpp
-----------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE refresh_engine_test

#include <boost/test/unit_test.hpp>

#include <chrono>
#include <stop_token>
#include <string>
#include <vector>

#include <qboauth/detail/asio_decl.hpp>
#include <qboauth/net/http_client.hpp>
#include <qboauth/oauth2/refresh_engine.hpp>
#include <qboauth/oauth2/token_client.hpp>
#include "support/fake_http_server.hpp"

using namespace std::chrono_literals;
using qboauth::test::canned_response;
using qboauth::test::fake_http_server;

namespace
{

const std::string TOKEN_REPLY =
    R"({"access_token":"fresh-access","refresh_token":"fresh-refresh","expires_in":3600,"token_type":"bearer"})";

} // namespace


BOOST_AUTO_TEST_CASE(retry_policy_delays)
{
    const auto policy = qboauth::oauth2::retry_policy::defaults();
    BOOST_TEST(policy.max_attempts == 3u);
    BOOST_TEST(policy.delay_for(1).count() == 2000);
    BOOST_TEST(policy.delay_for(2).count() == 4000);

    const auto fast = qboauth::oauth2::retry_policy::scaled(10ms);
    BOOST_TEST(fast.delay_for(1).count() == 20);
    BOOST_TEST(fast.delay_for(2).count() == 40);
}

BOOST_AUTO_TEST_CASE(bad_request_is_not_retried)
{
    qboauth::asio::io_context ctx;
    fake_http_server server(ctx);
    server.enqueue(canned_response{400, R"({"error":"invalid_grant"})"});

    qboauth::net::http_client http;
    qboauth::oauth2::token_client client(http, server.url("/tokens"), "client", "secret");
    unsigned int retries = 0;
    auto policy = qboauth::oauth2::retry_policy::scaled(10ms);
    policy.on_retry = [&](unsigned int, std::chrono::milliseconds, const qboauth::error_info&) { ++retries; };
    qboauth::oauth2::refresh_engine engine(client, policy);

    qboauth::test::run_coroutine(ctx, [&]() -> qboauth::asio::awaitable<void>
    {
        auto reply = co_await engine.refresh("stale-refresh");
        BOOST_TEST(!reply.has_value());
        BOOST_TEST(reply.error().is(qboauth::errc::auth_reauthorization_required));
        BOOST_TEST(reply.error().detail.find("invalid_grant") != std::string::npos);
        co_return;
    });

    BOOST_TEST(server.requests().size() == 1u);
    BOOST_TEST(retries == 0u);
}

BOOST_AUTO_TEST_CASE(request_shape)
{
    qboauth::asio::io_context ctx;
    fake_http_server server(ctx);
    server.enqueue(canned_response{200, TOKEN_REPLY});

    qboauth::net::http_client http;
    qboauth::oauth2::token_client client(http, server.url("/tokens"), "client", "secret");
    qboauth::oauth2::refresh_engine engine(client, qboauth::oauth2::retry_policy::none());

    qboauth::test::run_coroutine(ctx, [&]() -> qboauth::asio::awaitable<void>
    {
        auto reply = co_await engine.refresh("old-refresh");
        BOOST_TEST(reply.has_value());
        BOOST_TEST(reply->access_token == "fresh-access");
        BOOST_TEST(reply->refresh_token.value_or("") == "fresh-refresh");
        BOOST_TEST(reply->expires_in.count() == 3600);
        co_return;
    });

    BOOST_TEST_REQUIRE(server.requests().size() == 1u);
    const auto& request = server.requests().front();
    BOOST_TEST(request.method == "POST");
    BOOST_TEST(request.target == "/tokens");
    BOOST_TEST(request.body == "grant_type=refresh_token&refresh_token=old-refresh");
    // base64("client:secret")
    BOOST_TEST(request.headers.at("Authorization") == "Basic Y2xpZW50OnNlY3JldA==");
    BOOST_TEST(request.headers.at("Content-Type") == "application/x-www-form-urlencoded");
}

BOOST_AUTO_TEST_CASE(server_errors_back_off_exponentially)
{
    qboauth::asio::io_context ctx;
    fake_http_server server(ctx);
    server.enqueue(canned_response{500, "{}"});
    server.enqueue(canned_response{500, "{}"});
    server.enqueue(canned_response{200, TOKEN_REPLY});

    qboauth::net::http_client http;
    qboauth::oauth2::token_client client(http, server.url("/tokens"), "client", "secret");
    std::vector<long long> delays;
    auto policy = qboauth::oauth2::retry_policy::defaults();
    policy.on_retry = [&](unsigned int, std::chrono::milliseconds delay, const qboauth::error_info& err)
    {
        BOOST_TEST(err.is(qboauth::errc::http_status_error));
        delays.push_back(delay.count());
    };
    qboauth::oauth2::refresh_engine engine(client, policy);

    const auto started = std::chrono::steady_clock::now();
    qboauth::test::run_coroutine(ctx, [&]() -> qboauth::asio::awaitable<void>
    {
        auto reply = co_await engine.refresh("old-refresh");
        BOOST_TEST(reply.has_value());
        co_return;
    });
    const auto elapsed = std::chrono::steady_clock::now() - started;

    BOOST_TEST(server.requests().size() == 3u);
    BOOST_TEST((delays == std::vector<long long>{2000, 4000}));
    BOOST_TEST((elapsed >= 6s));
}

BOOST_AUTO_TEST_CASE(attempts_exhausted)
{
    qboauth::asio::io_context ctx;
    fake_http_server server(ctx);
    server.enqueue(canned_response{503, "{}"});

    qboauth::net::http_client http;
    qboauth::oauth2::token_client client(http, server.url("/tokens"), "client", "secret");
    qboauth::oauth2::refresh_engine engine(client, qboauth::oauth2::retry_policy::scaled(5ms));

    qboauth::test::run_coroutine(ctx, [&]() -> qboauth::asio::awaitable<void>
    {
        auto reply = co_await engine.refresh("old-refresh");
        BOOST_TEST(!reply.has_value());
        BOOST_TEST(reply.error().is(qboauth::errc::auth_refresh_failed));
        BOOST_TEST(reply.error().detail.find("attempts=3") != std::string::npos);
        co_return;
    });
    BOOST_TEST(server.requests().size() == 3u);
}

BOOST_AUTO_TEST_CASE(malformed_reply_is_retried)
{
    qboauth::asio::io_context ctx;
    fake_http_server server(ctx);
    server.enqueue(canned_response{200, "not json"});
    server.enqueue(canned_response{200, TOKEN_REPLY});

    qboauth::net::http_client http;
    qboauth::oauth2::token_client client(http, server.url("/tokens"), "client", "secret");
    qboauth::oauth2::refresh_engine engine(client, qboauth::oauth2::retry_policy::scaled(5ms));

    qboauth::test::run_coroutine(ctx, [&]() -> qboauth::asio::awaitable<void>
    {
        auto reply = co_await engine.refresh("old-refresh");
        BOOST_TEST(reply.has_value());
        co_return;
    });
    BOOST_TEST(server.requests().size() == 2u);
}

BOOST_AUTO_TEST_CASE(stop_during_backoff)
{
    qboauth::asio::io_context ctx;
    fake_http_server server(ctx);
    server.enqueue(canned_response{500, "{}"});

    qboauth::net::http_client http;
    qboauth::oauth2::token_client client(http, server.url("/tokens"), "client", "secret");
    std::stop_source source;
    auto policy = qboauth::oauth2::retry_policy::scaled(10s);
    policy.on_retry = [&](unsigned int, std::chrono::milliseconds, const qboauth::error_info&) { source.request_stop(); };
    qboauth::oauth2::refresh_engine engine(client, policy);

    const auto started = std::chrono::steady_clock::now();
    qboauth::test::run_coroutine(ctx, [&]() -> qboauth::asio::awaitable<void>
    {
        auto reply = co_await engine.refresh("old-refresh", source.get_token());
        BOOST_TEST(!reply.has_value());
        BOOST_TEST(reply.error().is_cancelled());
        co_return;
    });
    BOOST_TEST((std::chrono::steady_clock::now() - started < 10s));
    BOOST_TEST(server.requests().size() == 1u);
}

BOOST_AUTO_TEST_CASE(empty_refresh_token)
{
    qboauth::asio::io_context ctx;
    qboauth::net::http_client http;
    qboauth::oauth2::token_client client(http, "http://127.0.0.1:9/tokens", "client", "secret");
    qboauth::oauth2::refresh_engine engine(client);

    qboauth::test::run_coroutine(ctx, [&]() -> qboauth::asio::awaitable<void>
    {
        auto reply = co_await engine.refresh("");
        BOOST_TEST(!reply.has_value());
        BOOST_TEST(reply.error().is(qboauth::errc::invalid_argument));
        co_return;
    });
}
