/*

test_tunnel_supervisor.cpp
--------------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE tunnel_supervisor_test

#include <boost/test/unit_test.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include <boost/filesystem/operations.hpp>

#include <qboauth/detail/asio_decl.hpp>
#include <qboauth/detail/cancellation.hpp>
#include <qboauth/detail/env.hpp>
#include <qboauth/tunnel/tunnel_supervisor.hpp>
#include "support/fake_http_server.hpp"

using namespace std::chrono_literals;
using qboauth::tunnel::tunnel_options;
using qboauth::tunnel::tunnel_supervisor;

namespace
{

/// Shell scripts standing in for cloudflared; every start appends a line to `starts`
struct script_dir
{
    script_dir()
        : path(std::filesystem::temp_directory_path() /
            boost::filesystem::unique_path("qboauth-tunnel-%%%%-%%%%").string()),
          starts(path / "starts")
    {
        std::filesystem::create_directories(path);
    }

    ~script_dir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::string write(const std::string& name, const std::string& body) const
    {
        const auto file = path / name;
        {
            std::ofstream out(file);
            out << "#!/bin/sh\n" << "echo started >> '" << starts.string() << "'\n" << body << "\n";
        }
        std::filesystem::permissions(file, std::filesystem::perms::owner_all);
        return file.string();
    }

    std::size_t start_count() const
    {
        std::ifstream in(starts);
        std::size_t lines = 0;
        std::string line;
        while (std::getline(in, line))
            ++lines;
        return lines;
    }

    std::filesystem::path path;
    std::filesystem::path starts;
};

tunnel_options options_for(const std::string& executable)
{
    tunnel_options options;
    options.executable = executable;
    options.readiness_ceiling = 10s;
    return options;
}

} // namespace


BOOST_AUTO_TEST_CASE(command_line)
{
    tunnel_options options;
    options.target_port = 7300;
    options.extra_args = {"--protocol", "http2"};
    BOOST_TEST(options.target_url() == "https://localhost:7300");
    const std::vector<std::string> expected{"tunnel", "--no-autoupdate", "--loglevel", "info", "--url",
        "https://localhost:7300", "--protocol", "http2"};
    BOOST_TEST((options.arguments() == expected));
}

BOOST_AUTO_TEST_CASE(options_from_environment)
{
    auto options = tunnel_options::from_env(qboauth::map_env({
        {"CLOUDFLARED_EXE", "/opt/cf/cloudflared"},
        {"CLOUDFLARED_ARGS", "  --edge-ip-version 4   --protocol quic "},
        {"WEBHOOKS_PORT", "8443"}
    }));
    BOOST_TEST(options.executable == "/opt/cf/cloudflared");
    const std::vector<std::string> extra{"--edge-ip-version", "4", "--protocol", "quic"};
    BOOST_TEST((options.extra_args == extra));
    BOOST_TEST(options.target_port == 8443);

    auto defaults = tunnel_options::from_env(qboauth::map_env({{"WEBHOOKS_PORT", "not-a-port"}}));
    BOOST_TEST(defaults.executable == "cloudflared");
    BOOST_TEST(defaults.extra_args.empty());
    BOOST_TEST(defaults.target_port == qboauth::tunnel::DEFAULT_WEBHOOKS_PORT);

    auto out_of_range = tunnel_options::from_env(qboauth::map_env({{"WEBHOOKS_PORT", "70000"}}));
    BOOST_TEST(out_of_range.target_port == qboauth::tunnel::DEFAULT_WEBHOOKS_PORT);
}

BOOST_AUTO_TEST_CASE(concurrent_callers_share_one_process)
{
    script_dir dir;
    const auto exe = dir.write("cloudflared",
        "sleep 0.3\n"
        "echo '2025-01-01T00:00:00Z INF |  https://quiet-lake-42.trycloudflare.com  |' >&2\n"
        "exec sleep 30");

    qboauth::asio::io_context ctx;
    tunnel_supervisor supervisor(ctx, options_for(exe));
    int ready = 0;

    qboauth::test::run_coroutine(ctx, [&]() -> qboauth::asio::awaitable<void>
    {
        const auto deadline = std::chrono::steady_clock::now() + 10s;
        bool second = false;
        bool second_done = false;
        qboauth::asio::co_spawn(ctx, [&]() -> qboauth::asio::awaitable<void>
        {
            second = co_await supervisor.ensure_tunnel(deadline);
            second_done = true;
        }, qboauth::asio::detached);

        const bool first = co_await supervisor.ensure_tunnel(deadline);
        for (int i = 0; i < 500 && !second_done; ++i)
            (void)co_await qboauth::detail::async_sleep(10ms, {});

        ready = static_cast<int>(first) + static_cast<int>(second);
    });

    BOOST_TEST(ready == 2);
    BOOST_TEST(supervisor.spawn_count() == 1u);
    BOOST_TEST(dir.start_count() == 1u);
    BOOST_TEST(supervisor.is_running());
    BOOST_TEST(supervisor.public_url().value_or("") == "https://quiet-lake-42.trycloudflare.com");

    supervisor.shutdown();
    BOOST_TEST(!supervisor.is_running());
    BOOST_TEST(!supervisor.public_url().has_value());
}

BOOST_AUTO_TEST_CASE(live_process_is_reused)
{
    script_dir dir;
    const auto exe = dir.write("cloudflared",
        "echo 'INF +-- https://bright-sun-7.trycloudflare.com --+'\n"
        "exec sleep 30");

    qboauth::asio::io_context ctx;
    tunnel_supervisor supervisor(ctx, options_for(exe));

    qboauth::test::run_coroutine(ctx, [&]() -> qboauth::asio::awaitable<void>
    {
        const bool first = co_await supervisor.ensure_tunnel(std::chrono::steady_clock::now() + 10s);
        BOOST_TEST(first);
        const bool reused = co_await supervisor.ensure_tunnel(std::chrono::steady_clock::now() + 10s);
        BOOST_TEST(reused);
    });
    BOOST_TEST(supervisor.spawn_count() == 1u);
    BOOST_TEST(dir.start_count() == 1u);
}

BOOST_AUTO_TEST_CASE(error_line_stops_the_process)
{
    script_dir dir;
    const auto exe = dir.write("cloudflared",
        "echo 'ERR Failed to create new quick Tunnel error=\"dial tcp: lookup api.trycloudflare.com\"' >&2\n"
        "exec sleep 30");

    qboauth::asio::io_context ctx;
    tunnel_supervisor supervisor(ctx, options_for(exe));

    qboauth::test::run_coroutine(ctx, [&]() -> qboauth::asio::awaitable<void>
    {
        const bool ready = co_await supervisor.ensure_tunnel(std::chrono::steady_clock::now() + 10s);
        BOOST_TEST(!ready);
    });
    BOOST_TEST(supervisor.spawn_count() == 1u);
    BOOST_TEST(!supervisor.is_running());
}

BOOST_AUTO_TEST_CASE(missing_executable)
{
    script_dir dir;
    qboauth::asio::io_context ctx;
    tunnel_supervisor supervisor(ctx, options_for((dir.path / "no-such-cloudflared").string()));

    qboauth::test::run_coroutine(ctx, [&]() -> qboauth::asio::awaitable<void>
    {
        const bool ready = co_await supervisor.ensure_tunnel(std::chrono::steady_clock::now() + 5s);
        BOOST_TEST(!ready);
    });
    BOOST_TEST(supervisor.spawn_count() == 0u);
    BOOST_TEST(!supervisor.is_running());
}

BOOST_AUTO_TEST_CASE(slow_process_is_kept_after_timeout)
{
    script_dir dir;
    const auto exe = dir.write("cloudflared",
        "sleep 2\n"
        "echo 'https://late-river-3.trycloudflare.com'\n"
        "exec sleep 30");

    qboauth::asio::io_context ctx;
    tunnel_supervisor supervisor(ctx, options_for(exe));

    qboauth::test::run_coroutine(ctx, [&]() -> qboauth::asio::awaitable<void>
    {
        const auto started = std::chrono::steady_clock::now();
        const bool early = co_await supervisor.ensure_tunnel(started + 200ms);
        BOOST_TEST(!early);
        BOOST_TEST((std::chrono::steady_clock::now() - started < 2s));
        BOOST_TEST(supervisor.is_running());

        // the process from the first call is still alive and gets reused
        const bool later = co_await supervisor.ensure_tunnel(std::chrono::steady_clock::now() + 10s);
        BOOST_TEST(later);
    });
    BOOST_TEST(supervisor.spawn_count() == 1u);
    BOOST_TEST(dir.start_count() == 1u);
}

BOOST_AUTO_TEST_CASE(exited_process_is_replaced)
{
    script_dir dir;
    const auto exe = dir.write("cloudflared", "echo 'https://short-lived-1.trycloudflare.com'\nexit 0");

    qboauth::asio::io_context ctx;
    tunnel_supervisor supervisor(ctx, options_for(exe));

    qboauth::test::run_coroutine(ctx, [&]() -> qboauth::asio::awaitable<void>
    {
        const bool ready = co_await supervisor.ensure_tunnel(std::chrono::steady_clock::now() + 10s);
        BOOST_TEST(ready);
        for (int i = 0; i < 200 && supervisor.is_running(); ++i)
            (void)co_await qboauth::detail::async_sleep(10ms, {});
        BOOST_TEST(!supervisor.is_running());

        (void)co_await supervisor.ensure_tunnel(std::chrono::steady_clock::now() + 10s);
    });
    BOOST_TEST(supervisor.spawn_count() == 2u);
}

BOOST_AUTO_TEST_CASE(deadline_already_passed)
{
    script_dir dir;
    const auto exe = dir.write("cloudflared", "exec sleep 30");

    qboauth::asio::io_context ctx;
    tunnel_supervisor supervisor(ctx, options_for(exe));

    qboauth::test::run_coroutine(ctx, [&]() -> qboauth::asio::awaitable<void>
    {
        const bool ready = co_await supervisor.ensure_tunnel(std::chrono::steady_clock::now() - 1s);
        BOOST_TEST(!ready);
    });
    BOOST_TEST(supervisor.spawn_count() == 0u);
    BOOST_TEST(dir.start_count() == 0u);
    BOOST_TEST(!supervisor.is_running());
}

BOOST_AUTO_TEST_CASE(error_after_timeout_is_not_reused)
{
    script_dir dir;
    const auto exe = dir.write("cloudflared",
        "sleep 1\n"
        "echo 'ERR Failed to create new quick Tunnel error=\"context deadline exceeded\"' >&2\n"
        "exec sleep 30");

    qboauth::asio::io_context ctx;
    tunnel_supervisor supervisor(ctx, options_for(exe));

    qboauth::test::run_coroutine(ctx, [&]() -> qboauth::asio::awaitable<void>
    {
        const bool early = co_await supervisor.ensure_tunnel(std::chrono::steady_clock::now() + 200ms);
        BOOST_TEST(!early);
        BOOST_TEST(supervisor.is_usable());

        // the error line arrives while nobody waits
        (void)co_await qboauth::detail::async_sleep(1500ms, {});
        BOOST_TEST(supervisor.is_running());
        BOOST_TEST(!supervisor.is_usable());

        // the errored process is replaced; its successor fails the same way
        const bool later = co_await supervisor.ensure_tunnel(std::chrono::steady_clock::now() + 5s);
        BOOST_TEST(!later);
    });
    BOOST_TEST(supervisor.spawn_count() == 2u);
    BOOST_TEST(dir.start_count() == 2u);
    BOOST_TEST(!supervisor.is_running());
}

BOOST_AUTO_TEST_CASE(cancellation_on_several_threads)
{
    script_dir dir;
    const auto exe = dir.write("cloudflared",
        "sleep 0.2\n"
        "echo 'INF |  https://many-hands-5.trycloudflare.com  |' >&2\n"
        "exec sleep 30");

    qboauth::asio::io_context ctx;
    tunnel_supervisor supervisor(ctx, options_for(exe));

    constexpr int rounds = 25;
    constexpr int callers = 4;
    std::atomic<int> finished{0};
    bool settled = false;

    qboauth::test::run_coroutine_threaded(ctx, 4, [&]() -> qboauth::asio::awaitable<void>
    {
        for (int round = 0; round < rounds; ++round)
        {
            std::stop_source source;
            std::atomic<int> done{0};
            for (int i = 0; i < callers; ++i)
            {
                qboauth::asio::co_spawn(ctx, [&, token = source.get_token()]() -> qboauth::asio::awaitable<void>
                {
                    (void)co_await supervisor.ensure_tunnel(std::chrono::steady_clock::now() + 10s, token);
                    done.fetch_add(1, std::memory_order_acq_rel);
                }, qboauth::asio::detached);
            }
            (void)co_await qboauth::detail::async_sleep(std::chrono::milliseconds(round % 5), {});
            source.request_stop();
            for (int i = 0; i < 500 && done.load(std::memory_order_acquire) < callers; ++i)
                (void)co_await qboauth::detail::async_sleep(10ms, {});
            finished.fetch_add(done.load(std::memory_order_acquire), std::memory_order_acq_rel);
        }
        settled = co_await supervisor.ensure_tunnel(std::chrono::steady_clock::now() + 10s);
    });

    BOOST_TEST(finished.load() == rounds * callers);
    BOOST_TEST(settled);
    BOOST_TEST(supervisor.spawn_count() == 1u);
    BOOST_TEST(dir.start_count() == 1u);
}
