/*

callback_listener.hpp
---------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Local HTTP endpoint receiving the authorization redirect. Prefixes follow the
`http://host:port/path/` form; one acceptor is opened per distinct host and port.

*/

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/algorithm/string/predicate.hpp>

#include <qboauth/detail/asio_decl.hpp>
#include <qboauth/detail/cancellation.hpp>
#include <qboauth/detail/error_detail.hpp>
#include <qboauth/detail/log.hpp>
#include <qboauth/detail/one_shot.hpp>
#include <qboauth/detail/redact.hpp>
#include <qboauth/detail/result.hpp>
#include <qboauth/net/http_client.hpp>
#include <qboauth/net/url.hpp>
#include <qboauth/platform/listener_permission.hpp>

namespace qboauth::net
{

/// One inbound request that matched a listener prefix; the connection stays open until respond()
class callback_exchange
{
public:
    callback_exchange(std::shared_ptr<qboauth::beast::tcp_stream> stream, std::string target, std::string path,
        query_map query, bool query_valid)
        : stream_(std::move(stream)), target_(std::move(target)), path_(std::move(path)),
          query_(std::move(query)), query_valid_(query_valid)
    {
    }

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

    [[nodiscard]] const std::string& target() const noexcept { return target_; }

    [[nodiscard]] const query_map& query() const noexcept { return query_; }

    /// False when the query string had a malformed percent escape
    [[nodiscard]] bool query_valid() const noexcept { return query_valid_; }

    [[nodiscard]] std::optional<std::string> param(std::string_view name) const
    {
        auto it = query_.find(name);
        if (it == query_.end())
            return std::nullopt;
        return it->second;
    }

    /// Send an HTML page and close the connection
    qboauth::asio::awaitable<result_void> respond(unsigned int status, std::string html)
    {
        namespace http = qboauth::beast::http;

        if (!stream_)
            co_return fail(errc::invalid_argument, "callback already answered");

        http::response<http::string_body> res{static_cast<http::status>(status), 11};
        res.set(http::field::content_type, "text/html; charset=utf-8");
        res.set(http::field::cache_control, "no-store");
        res.set(http::field::connection, "close");
        res.body() = std::move(html);
        res.prepare_payload();

        auto stream = std::move(stream_);
        auto executor = stream->get_executor();
        co_return co_await detail::run_on(std::move(executor), write_page(std::move(stream), std::move(res)));
    }

private:
    /// Runs on the listener strand the stream belongs to
    static qboauth::asio::awaitable<result_void> write_page(std::shared_ptr<qboauth::beast::tcp_stream> stream,
        qboauth::beast::http::response<qboauth::beast::http::string_body> res)
    {
        stream->expires_after(std::chrono::seconds{10});
        auto [ec, written] = co_await qboauth::beast::http::async_write(*stream, res, qboauth::asio::use_nothrow_awaitable);
        (void)written;

        qboauth::asio::error_code ignored;
        stream->socket().shutdown(qboauth::asio::tcp::socket::shutdown_both, ignored);
        if (ec)
            co_return fail(make_net_error(io_stage::write, ec, false, false,
                make_net_detail("http", "callback", {}, io_stage::write, "async_write")));
        co_return ok();
    }

    std::shared_ptr<qboauth::beast::tcp_stream> stream_;
    std::string target_;
    std::string path_;
    query_map query_;
    bool query_valid_ = true;
};

class callback_listener
{
public:
    explicit callback_listener(qboauth::asio::any_io_executor executor)
        : state_(std::make_shared<shared_state>(std::move(executor)))
    {
    }

    callback_listener(const callback_listener&) = delete;
    callback_listener& operator=(const callback_listener&) = delete;

    ~callback_listener()
    {
        stop();
    }

    /**
    Register a prefix to serve.

    @return true if registered, false if skipped (not `http`, or a host a local socket cannot serve),
            `http_bad_url` if the prefix does not parse.
    **/
    result<bool> add_prefix(std::string_view prefix)
    {
        auto parsed = parse_url(prefix);
        if (!parsed)
            return detail::make_unexpected(std::move(parsed).error());

        if (parsed->scheme != "http")
        {
            QBOAUTH_WARN(std::format("Skipping listener prefix {}: only http prefixes can be served locally", prefix));
            return false;
        }

        auto address = loopback_address(parsed->host);
        if (!address)
        {
            QBOAUTH_WARN(std::format("Skipping listener prefix {}: host is not a loopback address", prefix));
            return false;
        }

        std::string path = parsed->path;
        if (path.empty() || path.back() != '/')
            path.push_back('/');

        const qboauth::asio::tcp::endpoint endpoint(*address, parsed->port);
        for (auto& existing : bindings_)
        {
            if (existing.endpoint == endpoint)
            {
                for (const auto& p : existing.paths)
                {
                    if (boost::algorithm::iequals(p, path))
                        return true;
                }
                existing.paths.push_back(path);
                existing.prefixes.emplace_back(prefix);
                return true;
            }
        }
        bindings_.push_back(binding{endpoint, {path}, {std::string(prefix)}});
        return true;
    }

    [[nodiscard]] std::vector<std::string> prefixes() const
    {
        std::vector<std::string> all;
        for (const auto& b : bindings_)
            all.insert(all.end(), b.prefixes.begin(), b.prefixes.end());
        return all;
    }

    /**
    Bind and listen on every registered endpoint, then start accepting.

    A failed bind releases everything bound so far and returns `listener_bind_failed`
    whose detail carries the command that fixes it.
    **/
    result_void start()
    {
        if (bindings_.empty())
            return fail(errc::listener_bind_failed, "no usable listener prefix");
        if (!state_->acceptors.empty())
            return fail(errc::invalid_argument, "listener already started");

        for (const auto& b : bindings_)
        {
            auto acceptor = std::make_unique<qboauth::asio::tcp::acceptor>(state_->executor);
            qboauth::asio::error_code ec;
            acceptor->open(b.endpoint.protocol(), ec);
            if (!ec)
                acceptor->set_option(qboauth::asio::tcp::acceptor::reuse_address(true), ec);
            if (!ec)
                acceptor->bind(b.endpoint, ec);
            if (!ec)
                acceptor->listen(qboauth::asio::socket_base::max_listen_connections, ec);
            if (ec)
            {
                close_acceptors(*state_);
                state_->acceptors.clear();
                const std::string& prefix = b.prefixes.front();
                const std::string remedy = platform::remediation_command(prefix, ec);
                QBOAUTH_ERROR(std::format("Cannot listen on {}: {}. To fix, run: {}", prefix, ec.message(), remedy));

                detail::error_detail info;
                info.add("prefix", prefix);
                info.add("endpoint", std::format("{}:{}", b.endpoint.address().to_string(), b.endpoint.port()));
                info.add_ec("ec", ec);
                info.add("remediation", remedy);
                return fail(make_error(errc::listener_bind_failed,
                    std::format("Failed to bind callback listener on {}. Run: {}", prefix, remedy), info.str(), ec));
            }
            QBOAUTH_DEBUG(std::format("Listening on {}:{}", b.endpoint.address().to_string(), acceptor->local_endpoint(ec).port()));
            state_->acceptors.push_back(std::move(acceptor));
        }

        state_->stopped.store(false, std::memory_order_release);
        for (std::size_t i = 0; i < bindings_.size(); ++i)
        {
            qboauth::asio::co_spawn(state_->executor,
                accept_loop(state_, state_->acceptors[i].get(), bindings_[i].paths), qboauth::asio::detached);
        }
        return ok();
    }

    [[nodiscard]] bool is_listening() const noexcept
    {
        return !state_->acceptors.empty() && !state_->stopped.load(std::memory_order_acquire);
    }

    /// Ports actually bound, in registration order
    [[nodiscard]] std::vector<std::uint16_t> local_ports() const
    {
        std::vector<std::uint16_t> ports;
        for (const auto& acceptor : state_->acceptors)
        {
            qboauth::asio::error_code ec;
            const auto ep = acceptor->local_endpoint(ec);
            if (!ec)
                ports.push_back(ep.port());
        }
        return ports;
    }

    /// First request under a registered prefix, `listener_timeout` if none arrives in time
    qboauth::asio::awaitable<result<callback_exchange>> next_request(std::chrono::steady_clock::duration timeout,
        std::stop_token stop = {})
    {
        if (state_->acceptors.empty())
            co_return fail<callback_exchange>(errc::invalid_argument, "listener not started");
        co_return co_await state_->first.async_wait(timeout, stop, errc::listener_timeout, "callback wait");
    }

    /// Close all acceptors on the listener strand; pending accepts end with operation_aborted
    void stop() noexcept
    {
        state_->stopped.store(true, std::memory_order_release);
        qboauth::asio::dispatch(state_->executor, [state = state_]() { close_acceptors(*state); });
    }

    /// stop(), resuming once the acceptors are closed and their ports free again
    qboauth::asio::awaitable<void> close()
    {
        state_->stopped.store(true, std::memory_order_release);
        co_await detail::run_on(state_->executor, close_on_strand(state_));
    }

private:
    struct binding
    {
        qboauth::asio::tcp::endpoint endpoint;
        std::vector<std::string> paths;
        std::vector<std::string> prefixes;
    };

    /// Acceptors and sessions all run on `executor`, a strand
    struct shared_state
    {
        explicit shared_state(qboauth::asio::any_io_executor ex)
            : executor(qboauth::asio::make_strand(ex)), first(executor)
        {
        }

        qboauth::asio::any_io_executor executor;
        std::vector<std::unique_ptr<qboauth::asio::tcp::acceptor>> acceptors;
        detail::one_shot<callback_exchange> first;
        std::atomic<bool> stopped{true};
    };

    static void close_acceptors(shared_state& state) noexcept
    {
        for (auto& acceptor : state.acceptors)
        {
            qboauth::asio::error_code ignored;
            acceptor->close(ignored);
        }
    }

    static qboauth::asio::awaitable<void> close_on_strand(std::shared_ptr<shared_state> state)
    {
        close_acceptors(*state);
        co_return;
    }

    [[nodiscard]] static std::optional<qboauth::asio::ip::address> loopback_address(const std::string& host)
    {
        if (boost::algorithm::iequals(host, "localhost"))
            return qboauth::asio::ip::make_address_v4("127.0.0.1");

        qboauth::asio::error_code ec;
        const auto address = qboauth::asio::ip::make_address(host, ec);
        if (ec || !address.is_loopback())
            return std::nullopt;
        return address;
    }

    [[nodiscard]] static bool matches(const std::vector<std::string>& paths, std::string_view path)
    {
        for (const auto& prefix : paths)
        {
            if (detail::starts_with_ci(path, prefix))
                return true;
            // "/callback" is served by "/callback/"
            if (path.size() + 1 == prefix.size() && detail::starts_with_ci(prefix, path))
                return true;
        }
        return false;
    }

    static qboauth::asio::awaitable<void> accept_loop(std::shared_ptr<shared_state> state,
        qboauth::asio::tcp::acceptor* acceptor, std::vector<std::string> paths)
    {
        using qboauth::asio::use_nothrow_awaitable;

        while (!state->stopped.load(std::memory_order_acquire))
        {
            auto [ec, socket] = co_await acceptor->async_accept(use_nothrow_awaitable);
            if (ec)
            {
                if (ec == qboauth::asio::error::operation_aborted || state->stopped.load(std::memory_order_acquire))
                    co_return;
                QBOAUTH_WARN(std::format("Callback listener accept failed: {}", ec.message()));
                continue;
            }
            qboauth::asio::co_spawn(state->executor, serve(state, std::move(socket), paths), qboauth::asio::detached);
        }
    }

    static qboauth::asio::awaitable<void> serve(std::shared_ptr<shared_state> state,
        qboauth::asio::tcp::socket socket, std::vector<std::string> paths)
    {
        namespace http = qboauth::beast::http;
        using qboauth::asio::use_nothrow_awaitable;

        auto stream = std::make_shared<qboauth::beast::tcp_stream>(std::move(socket));
        stream->expires_after(std::chrono::seconds{30});

        qboauth::beast::flat_buffer buffer;
        http::request<http::string_body> req;
        auto [ec, read] = co_await http::async_read(*stream, buffer, req, use_nothrow_awaitable);
        (void)read;
        if (ec)
        {
            QBOAUTH_DEBUG(std::format("Callback listener dropped a connection: {}", ec.message()));
            co_return;
        }

        std::string target(to_string_view(req.target()));
        const auto q = target.find('?');
        std::string path = target.substr(0, q);
        QBOAUTH_TRACE_RECV("HTTP", std::format("{} {}", to_string_view(req.method_string()), detail::redact_target(target)));

        if (!matches(paths, path) || state->first.is_resolved() || state->stopped.load(std::memory_order_acquire))
        {
            callback_exchange other(stream, target, path, {}, true);
            auto answered = co_await other.respond(404, "<html><body><h2>Not Found</h2></body></html>");
            if (!answered)
                QBOAUTH_DEBUG(std::format("Could not answer {}: {}", path, answered.error().to_string()));
            co_return;
        }

        bool query_valid = true;
        query_map query;
        if (q != std::string::npos)
        {
            auto parsed = parse_query(std::string_view(target).substr(q + 1));
            if (parsed)
                query = std::move(*parsed);
            else
                query_valid = false;
        }
        callback_exchange exchange(stream, std::move(target), std::move(path), std::move(query), query_valid);
        if (state->first.resolve(exchange))
            co_return;

        // lost the race against another callback
        auto answered = co_await exchange.respond(404, "<html><body><h2>Not Found</h2></body></html>");
        if (!answered)
            QBOAUTH_DEBUG(std::format("Could not answer {}: {}", exchange.path(), answered.error().to_string()));
    }

    std::shared_ptr<shared_state> state_;
    std::vector<binding> bindings_;
};

} // namespace qboauth::net
