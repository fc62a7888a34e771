/*

coordinator.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Entry point of the library: owns the token state and composes credential resolution,
refresh, interactive authorization and the connectivity probe.

*/

#pragma once

#include <atomic>
#include <chrono>
#include <format>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <qboauth/api/data_api.hpp>
#include <qboauth/detail/asio_decl.hpp>
#include <qboauth/detail/async_mutex.hpp>
#include <qboauth/detail/cancellation.hpp>
#include <qboauth/detail/env.hpp>
#include <qboauth/detail/error_detail.hpp>
#include <qboauth/detail/log.hpp>
#include <qboauth/detail/redact.hpp>
#include <qboauth/detail/result.hpp>
#include <qboauth/net/http_client.hpp>
#include <qboauth/oauth2/authorization_flow.hpp>
#include <qboauth/oauth2/credentials.hpp>
#include <qboauth/oauth2/refresh_engine.hpp>
#include <qboauth/oauth2/token_client.hpp>
#include <qboauth/oauth2/token_state.hpp>
#include <qboauth/platform/listener_permission.hpp>
#include <qboauth/secrets/secret_resolver.hpp>
#include <qboauth/secrets/secret_store.hpp>
#include <qboauth/settings/settings_store.hpp>
#include <qboauth/tunnel/tunnel_supervisor.hpp>

namespace qboauth::lifecycle
{

struct lifecycle_options
{
    oauth2::endpoints endpoints;
    oauth2::flow_options flow;
    /// nullopt: read from CLOUDFLARED_EXE, CLOUDFLARED_ARGS and WEBHOOKS_PORT
    std::optional<tunnel::tunnel_options> tunnel;
    oauth2::retry_policy retry = oauth2::retry_policy::defaults();
    net::http_client_options http;
    api::data_api_options data_api;
};

enum class connection_state
{
    no_tokens,
    expired,
    connected,
    connection_test_failed
};

[[nodiscard]] constexpr std::string_view to_string(connection_state state) noexcept
{
    switch (state)
    {
        case connection_state::no_tokens: return "Not connected - no tokens available";
        case connection_state::expired: return "Not connected - tokens expired";
        case connection_state::connected: return "Connected and ready";
        case connection_state::connection_test_failed: return "Connection test failed";
    }
    return "unknown";
}

struct connection_status
{
    connection_state state = connection_state::no_tokens;
    std::string message{to_string(connection_state::no_tokens)};
    /// Realm of the connected company
    std::optional<std::string> company;

    [[nodiscard]] bool is_connected() const noexcept { return state == connection_state::connected; }

    static connection_status of(connection_state state, std::optional<std::string> company = std::nullopt)
    {
        return connection_status{state, std::string(to_string(state)), std::move(company)};
    }
};

/// Secret names, priority order; the environment variable derives from the first one
namespace secret_names
{
inline const std::vector<std::string> CLIENT_ID{"QBO-CLIENT-ID", "QuickBooks-ClientId"};
inline const std::vector<std::string> CLIENT_SECRET{"QBO-CLIENT-SECRET", "QuickBooks-ClientSecret"};
inline const std::vector<std::string> REALM_ID{"QBO-REALM-ID", "QuickBooks-RealmId"};
inline const std::vector<std::string> REDIRECT_URI{"QBO-REDIRECT-URI"};
inline const std::vector<std::string> ENVIRONMENT{"QBO-ENVIRONMENT"};
inline const std::vector<std::string> PRELOGIN_URL{"QBO-PRELOGIN-URL"};
} // namespace secret_names

/**
Credential lifecycle of one QuickBooks application.

All operations are coroutines that may be awaited from any executor of the io_context
given at construction, which may be run by several threads. They hop onto the
coordinator's strand and resume the caller on its own executor.
**/
class coordinator
{
public:
    /**
    @param ioc      Context running the listener, the tunnel readers and the HTTP calls.
    @param settings Persistence of the token pair.
    @param store    Optional secret store, consulted before the environment.
    @param data     Optional data API; a `qbo_data_api` over the internal HTTP client when null.
    @param options  Endpoints, timeouts and policies.
    @param env      Environment lookup, the process environment by default.
    **/
    coordinator(qboauth::asio::io_context& ioc, settings::settings_store& settings, secrets::secret_store* store = nullptr,
        api::data_api* data = nullptr, lifecycle_options options = {}, env_lookup env = process_env())
        : ioc_(ioc), strand_(qboauth::asio::make_strand(ioc)), options_(std::move(options)), env_(std::move(env)), store_(store),
          tokens_(settings), http_(options_.http), own_api_(http_, options_.data_api),
          data_api_(data != nullptr ? data : &own_api_),
          tunnel_(ioc, options_.tunnel ? *options_.tunnel : tunnel::tunnel_options::from_env(env_)),
          init_gate_(strand_), token_gate_(strand_)
    {
        auto loaded = tokens_.load();
        if (!loaded)
            QBOAUTH_WARN(std::format("Starting without persisted tokens: {}", loaded.error().to_string()));
    }

    coordinator(const coordinator&) = delete;
    coordinator& operator=(const coordinator&) = delete;

    ~coordinator()
    {
        tunnel_.shutdown();
    }

    /**
    Resolve the application credentials, once per coordinator.

    Concurrent callers wait behind one gate and see the same outcome. A missing client id
    fails with `config_missing_client_id`, and every later call returns that failure.
    **/
    qboauth::asio::awaitable<result_void> ensure_initialized(std::stop_token stop = {})
    {
        co_return co_await detail::run_on(strand_, initialize(std::move(stop)));
    }

    /**
    Make the access token usable.

    A valid token is left alone. Without a refresh token the interactive flow runs and its
    failure becomes `auth_not_completed`. Otherwise the refresh token is exchanged; when that
    fails for any reason but cancellation the token state is cleared.
    **/
    qboauth::asio::awaitable<result_void> ensure_token_valid(std::stop_token stop = {})
    {
        co_return co_await detail::run_on(strand_, make_token_valid(std::move(stop)));
    }

    /// Run the interactive flow now, whatever the token state
    qboauth::asio::awaitable<result_void> authorize(std::stop_token stop = {})
    {
        co_return co_await detail::run_on(strand_, authorize_now(std::move(stop)));
    }

    /// Refresh now, even if the access token is still valid
    qboauth::asio::awaitable<result_void> refresh_token(std::stop_token stop = {})
    {
        co_return co_await detail::run_on(strand_, refresh_now(std::move(stop)));
    }

    /**
    Initialize, make the token valid, then probe the data API.

    @return true when the probe succeeds, false on any failure but cancellation, which is
            returned as `cancelled`.
    **/
    qboauth::asio::awaitable<result<bool>> connect(std::stop_token stop = {})
    {
        co_return co_await detail::run_on(strand_, connect_now(std::move(stop)));
    }

    /// Forget the tokens and the realm once no refresh or flow is running; the provider is not told
    qboauth::asio::awaitable<result_void> disconnect(std::stop_token stop = {})
    {
        co_return co_await detail::run_on(strand_, disconnect_now(std::move(stop)));
    }

    /**
    Describe the connection without changing anything.

    Expiry is compared with the current instant without the validity margin, so a token in
    its last minute reads as connected here while is_valid() already rejects it.
    **/
    qboauth::asio::awaitable<result<connection_status>> status(std::stop_token stop = {})
    {
        co_return co_await detail::run_on(strand_, describe(std::move(stop)));
    }

    /// Probe the data API with the current token; no refresh
    qboauth::asio::awaitable<result<bool>> test_connection(std::stop_token stop = {})
    {
        co_return co_await detail::run_on(strand_, test_connection_now(std::move(stop)));
    }

    /// Tokens present, unexpired, and the probe succeeds
    qboauth::asio::awaitable<result<bool>> is_connected(std::stop_token stop = {})
    {
        const auto current = tokens_.snapshot();
        if (!current.has_tokens() || !current.expires_at || current.is_expired(std::chrono::system_clock::now()))
            co_return false;
        co_return co_await test_connection(std::move(stop));
    }

    [[nodiscard]] bool has_valid_access_token() const
    {
        return tokens_.is_valid();
    }

    /// Advisory check that the redirect prefix can be served locally
    [[nodiscard]] bool check_listener_permission() const
    {
        const auto creds = credentials();
        const std::string redirect = creds ? creds->redirect_uri : std::string(oauth2::DEFAULT_REDIRECT_URI);
        const auto prefixes = oauth2::listener_prefixes(redirect, {});
        return !prefixes.empty() && platform::check_listener_permission(prefixes.front());
    }

    [[nodiscard]] std::optional<std::string> realm_id() const
    {
        std::lock_guard<std::mutex> guard(mutex_);
        return realm_id_;
    }

    /// nullopt until initialization succeeded
    [[nodiscard]] std::optional<oauth2::credentials> credentials() const
    {
        std::lock_guard<std::mutex> guard(mutex_);
        return credentials_;
    }

    [[nodiscard]] const oauth2::token_state& tokens() const noexcept { return tokens_; }

    [[nodiscard]] tunnel::tunnel_supervisor& tunnel() noexcept { return tunnel_; }

    /// Number of credential resolution passes performed
    [[nodiscard]] std::size_t resolution_count() const noexcept
    {
        return resolutions_.load(std::memory_order_acquire);
    }

    /// State of the last interactive flow, `idle` if none ran
    [[nodiscard]] oauth2::flow_state last_flow_state() const noexcept
    {
        return last_flow_state_.load(std::memory_order_acquire);
    }

private:
    // The operations below run on strand_.

    qboauth::asio::awaitable<result_void> initialize(std::stop_token stop)
    {
        if (initialized_.load(std::memory_order_acquire))
            co_return init_outcome();

        auto lock = co_await init_gate_.lock(stop);
        if (!lock)
            co_return detail::make_unexpected(std::move(lock).error());
        if (initialized_.load(std::memory_order_acquire))
            co_return init_outcome();

        secrets::secret_resolver resolver(store_, env_);
        resolutions_.fetch_add(1, std::memory_order_acq_rel);

        auto client_id = co_await resolver.resolve_any(secret_names::CLIENT_ID);
        if (!client_id)
        {
            auto err = make_error(errc::config_missing_client_id,
                "QBO_CLIENT_ID not found in the secret store or environment variables");
            QBOAUTH_ERROR(err.to_string());
            finish_initialization(std::move(err));
            co_return init_outcome();
        }

        oauth2::credentials creds;
        creds.client_id = std::move(*client_id);
        creds.client_secret = (co_await resolver.resolve_any(secret_names::CLIENT_SECRET)).value_or("");
        creds.realm_id = co_await resolver.resolve_any(secret_names::REALM_ID);
        if (auto redirect = co_await resolver.resolve_any(secret_names::REDIRECT_URI))
            creds.redirect_uri = std::move(*redirect);
        if (auto env_tag = co_await resolver.resolve_any(secret_names::ENVIRONMENT))
        {
            if (auto parsed = oauth2::parse_environment(*env_tag))
                creds.env = *parsed;
            else
                QBOAUTH_WARN(std::format("Unknown environment '{}', using {}", *env_tag, oauth2::to_string(creds.env)));
        }
        creds.prelogin_url = co_await resolver.resolve_any(secret_names::PRELOGIN_URL);

        QBOAUTH_INFO(std::format("QuickBooks credentials initialized - ClientId: {}, RealmId: {}, Environment: {}",
            detail::mask_prefix(creds.client_id, 8), creds.realm_id.value_or("<unknown>"), oauth2::to_string(creds.env)));

        {
            std::lock_guard<std::mutex> guard(mutex_);
            realm_id_ = creds.realm_id;
            credentials_ = std::move(creds);
            token_client_.emplace(http_, options_.endpoints.token, credentials_->client_id, credentials_->client_secret);
            refresh_engine_.emplace(*token_client_, options_.retry);
        }
        finish_initialization(std::nullopt);
        co_return ok();
    }

    qboauth::asio::awaitable<result_void> make_token_valid(std::stop_token stop)
    {
        auto init = co_await initialize(stop);
        if (!init)
            co_return init;
        if (tokens_.is_valid())
            co_return ok();

        auto lock = co_await token_gate_.lock(stop);
        if (!lock)
            co_return detail::make_unexpected(std::move(lock).error());
        if (tokens_.is_valid())
            co_return ok();

        if (tokens_.refresh_token().empty())
        {
            auto flow = co_await run_flow(stop);
            if (flow)
                co_return ok();
            if (flow.error().is_cancelled())
                co_return detail::make_unexpected(std::move(flow).error());

            detail::error_detail info;
            info.add_cause(flow.error());
            co_return fail(errc::auth_not_completed, "QuickBooks authorization was not completed.", info.str());
        }

        co_return co_await refresh_locked(stop);
    }

    qboauth::asio::awaitable<result_void> authorize_now(std::stop_token stop)
    {
        auto init = co_await initialize(stop);
        if (!init)
            co_return init;

        auto lock = co_await token_gate_.lock(stop);
        if (!lock)
            co_return detail::make_unexpected(std::move(lock).error());

        auto flow = co_await run_flow(stop);
        if (!flow)
            co_return detail::make_unexpected(std::move(flow).error());
        co_return ok();
    }

    qboauth::asio::awaitable<result_void> refresh_now(std::stop_token stop)
    {
        auto init = co_await initialize(stop);
        if (!init)
            co_return init;

        auto lock = co_await token_gate_.lock(stop);
        if (!lock)
            co_return detail::make_unexpected(std::move(lock).error());
        co_return co_await refresh_locked(stop);
    }

    qboauth::asio::awaitable<result<bool>> connect_now(std::stop_token stop)
    {
        auto ready = co_await make_token_valid(stop);
        if (!ready)
        {
            if (ready.error().is_cancelled())
            {
                QBOAUTH_INFO("QuickBooks connection was cancelled");
                co_return detail::make_unexpected(std::move(ready).error());
            }
            QBOAUTH_ERROR(std::format("Failed to connect to QuickBooks: {}", ready.error().to_string()));
            co_return false;
        }

        auto probe = co_await probe_connectivity(stop);
        if (!probe)
        {
            QBOAUTH_INFO("QuickBooks connection was cancelled");
            co_return detail::make_unexpected(std::move(probe).error());
        }
        if (*probe)
            QBOAUTH_INFO("Successfully connected to QuickBooks");
        else
            QBOAUTH_WARN("Connection test failed");
        co_return *probe;
    }

    qboauth::asio::awaitable<result_void> disconnect_now(std::stop_token stop)
    {
        if (stop.stop_requested())
            co_return detail::make_unexpected(detail::cancelled_error("disconnect"));

        // a refresh in flight would otherwise commit after the clear
        auto lock = co_await token_gate_.lock(stop);
        if (!lock)
            co_return detail::make_unexpected(std::move(lock).error());

        {
            std::lock_guard<std::mutex> guard(mutex_);
            realm_id_.reset();
        }
        auto cleared = tokens_.clear();
        if (!cleared)
        {
            QBOAUTH_ERROR(std::format("Failed to disconnect from QuickBooks: {}", cleared.error().to_string()));
            co_return cleared;
        }
        QBOAUTH_INFO("Successfully disconnected from QuickBooks");
        co_return ok();
    }

    qboauth::asio::awaitable<result<connection_status>> describe(std::stop_token stop)
    {
        if (stop.stop_requested())
            co_return detail::make_unexpected(detail::cancelled_error("connection status"));

        auto init = co_await initialize(stop);
        if (!init && init.error().is_cancelled())
            co_return detail::make_unexpected(std::move(init).error());

        const auto current = tokens_.snapshot();
        if (!current.has_tokens())
            co_return connection_status::of(connection_state::no_tokens);
        if (current.is_expired(std::chrono::system_clock::now()))
            co_return connection_status::of(connection_state::expired);

        auto probe = co_await probe_connectivity(stop);
        if (!probe)
            co_return detail::make_unexpected(std::move(probe).error());
        if (*probe)
            co_return connection_status::of(connection_state::connected, realm_id());
        co_return connection_status::of(connection_state::connection_test_failed);
    }

    qboauth::asio::awaitable<result<bool>> test_connection_now(std::stop_token stop)
    {
        auto init = co_await initialize(stop);
        if (!init)
        {
            if (init.error().is_cancelled())
                co_return detail::make_unexpected(std::move(init).error());
            co_return false;
        }
        co_return co_await probe_connectivity(stop);
    }

    [[nodiscard]] result_void init_outcome() const
    {
        std::lock_guard<std::mutex> guard(mutex_);
        if (init_error_)
            return fail(*init_error_);
        return ok();
    }

    void finish_initialization(std::optional<error_info> err)
    {
        {
            std::lock_guard<std::mutex> guard(mutex_);
            init_error_ = std::move(err);
        }
        initialized_.store(true, std::memory_order_release);
    }

    /// Caller holds token_gate_
    qboauth::asio::awaitable<result_void> refresh_locked(std::stop_token stop)
    {
        auto refreshed = co_await refresh_engine_->refresh(tokens_.refresh_token(), stop);
        if (!refreshed)
        {
            if (refreshed.error().is_cancelled())
                co_return detail::make_unexpected(std::move(refreshed).error());

            QBOAUTH_WARN(std::format("Clearing token state after refresh failure: {}", refreshed.error().to_string()));
            auto cleared = tokens_.clear();
            if (!cleared)
                QBOAUTH_ERROR(std::format("Clearing token state failed: {}", cleared.error().to_string()));
            co_return detail::make_unexpected(std::move(refreshed).error());
        }

        auto committed = tokens_.commit(*refreshed);
        if (!committed)
            QBOAUTH_WARN(std::format("Refreshed tokens not persisted: {}", committed.error().to_string()));
        QBOAUTH_INFO("Access token refreshed");
        co_return ok();
    }

    /// Caller holds token_gate_
    qboauth::asio::awaitable<result<oauth2::flow_outcome>> run_flow(std::stop_token stop)
    {
        auto creds = credentials();
        if (!creds)
            co_return fail<oauth2::flow_outcome>(errc::internal_error, "credentials not initialized");
        creds->realm_id = realm_id();

        auto flow_options = options_.flow;
        auto observer = flow_options.on_state;
        flow_options.on_state = [this, observer](oauth2::flow_state state)
        {
            last_flow_state_.store(state, std::memory_order_release);
            if (observer)
                observer(state);
        };

        oauth2::authorization_flow flow(strand_, *creds, options_.endpoints, *token_client_, tokens_,
            store_, &tunnel_, std::move(flow_options));
        auto outcome = co_await flow.run(stop);
        if (outcome && outcome->realm_id)
        {
            std::lock_guard<std::mutex> guard(mutex_);
            realm_id_ = outcome->realm_id;
        }
        co_return outcome;
    }

    /// Only cancellation is an error; transport failures read as a failed probe
    qboauth::asio::awaitable<result<bool>> probe_connectivity(std::stop_token stop)
    {
        api::session s;
        s.access_token = tokens_.access_token();
        s.realm_id = realm_id();
        if (const auto creds = credentials())
            s.env = creds->env;

        auto probe = co_await data_api_->test_connectivity(std::move(s), stop);
        if (!probe)
        {
            if (probe.error().is_cancelled() || stop.stop_requested())
                co_return detail::make_unexpected(detail::cancelled_error("connection test"));
            QBOAUTH_WARN(std::format("Connection test failed: {}", probe.error().to_string()));
            co_return false;
        }
        co_return *probe;
    }

    qboauth::asio::io_context& ioc_;
    /// Every public operation runs here
    qboauth::asio::any_io_executor strand_;
    lifecycle_options options_;
    env_lookup env_;
    secrets::secret_store* store_;
    oauth2::token_state tokens_;
    net::http_client http_;
    api::qbo_data_api own_api_;
    api::data_api* data_api_;
    tunnel::tunnel_supervisor tunnel_;

    detail::async_mutex init_gate_;
    detail::async_mutex token_gate_;
    std::atomic<bool> initialized_{false};
    std::atomic<std::size_t> resolutions_{0};
    std::atomic<oauth2::flow_state> last_flow_state_{oauth2::flow_state::idle};

    mutable std::mutex mutex_;
    std::optional<error_info> init_error_;
    std::optional<oauth2::credentials> credentials_;
    std::optional<std::string> realm_id_;
    std::optional<oauth2::token_client> token_client_;
    std::optional<oauth2::refresh_engine> refresh_engine_;
};

} // namespace qboauth::lifecycle
