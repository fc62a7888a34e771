/*

authorization_flow.hpp
----------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Interactive OAuth2 authorization code flow: a loopback listener receives the provider
redirect after the user consented in the browser, then the code is exchanged for tokens.

*/

#pragma once

#include <atomic>
#include <chrono>
#include <format>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include <qboauth/codec/percent.hpp>
#include <qboauth/detail/asio_decl.hpp>
#include <qboauth/detail/cancellation.hpp>
#include <qboauth/detail/error_detail.hpp>
#include <qboauth/detail/log.hpp>
#include <qboauth/detail/random.hpp>
#include <qboauth/detail/result.hpp>
#include <qboauth/net/callback_listener.hpp>
#include <qboauth/net/url.hpp>
#include <qboauth/oauth2/credentials.hpp>
#include <qboauth/oauth2/token_client.hpp>
#include <qboauth/oauth2/token_state.hpp>
#include <qboauth/platform/browser.hpp>
#include <qboauth/platform/listener_permission.hpp>
#include <qboauth/secrets/secret_store.hpp>
#include <qboauth/tunnel/tunnel_supervisor.hpp>

namespace qboauth::oauth2
{

inline constexpr std::string_view FALLBACK_PREFIX = "http://localhost:8080/";
inline constexpr std::string_view REALM_SECRET_NAME = "QBO-REALM-ID";

enum class flow_state
{
    idle,
    preparing,
    listener_bound,
    browser_launched,
    awaiting_callback,
    succeeded,
    failed,
    timed_out
};

[[nodiscard]] constexpr std::string_view to_string(flow_state state) noexcept
{
    switch (state)
    {
        case flow_state::idle: return "idle";
        case flow_state::preparing: return "preparing";
        case flow_state::listener_bound: return "listener_bound";
        case flow_state::browser_launched: return "browser_launched";
        case flow_state::awaiting_callback: return "awaiting_callback";
        case flow_state::succeeded: return "succeeded";
        case flow_state::failed: return "failed";
        case flow_state::timed_out: return "timed_out";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool is_terminal(flow_state state) noexcept
{
    return state == flow_state::succeeded || state == flow_state::failed || state == flow_state::timed_out;
}

/**
Build the provider consent URL.

Scopes are joined with a space, then every parameter value is percent-encoded over the
RFC 3986 unreserved set.
**/
[[nodiscard]] inline std::string build_authorization_url(std::string_view endpoint, std::string_view client_id,
    const std::vector<std::string>& scopes, std::string_view redirect_uri, std::string_view state)
{
    const std::string scope = boost::algorithm::join(scopes, " ");
    return std::format("{}{}client_id={}&response_type=code&scope={}&redirect_uri={}&state={}",
        endpoint, endpoint.find('?') == std::string_view::npos ? "?" : "&",
        codec::percent_encode(client_id), codec::percent_encode(scope),
        codec::percent_encode(redirect_uri), codec::percent_encode(state));
}

[[nodiscard]] inline std::string html_escape(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    for (char ch : text)
    {
        switch (ch)
        {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default: out.push_back(ch);
        }
    }
    return out;
}

/// Minimal page shown in the browser tab that received the redirect
[[nodiscard]] inline std::string render_callback_page(std::string_view title, std::string_view message)
{
    return std::format("<html><body><h2>{}</h2><p>{}</p></body></html>", html_escape(title), html_escape(message));
}

/// Redirect URI with a trailing '/', then the fallback, without case-insensitive duplicates
[[nodiscard]] inline std::vector<std::string> listener_prefixes(std::string_view redirect_uri, std::string_view fallback)
{
    std::vector<std::string> prefixes;
    auto add = [&prefixes](std::string prefix)
    {
        if (prefix.empty())
            return;
        if (prefix.back() != '/')
            prefix.push_back('/');
        for (const auto& existing : prefixes)
        {
            if (boost::algorithm::iequals(existing, prefix))
                return;
        }
        prefixes.push_back(std::move(prefix));
    };
    add(std::string(redirect_uri));
    add(std::string(fallback));
    return prefixes;
}

/// `account_id_hint` query parameter of a provider pre-login URL
[[nodiscard]] inline std::optional<std::string> account_id_hint(std::string_view prelogin_url)
{
    auto parsed = net::parse_url(prelogin_url);
    if (!parsed)
        return std::nullopt;
    auto query = net::parse_query(parsed->query);
    if (!query)
        return std::nullopt;
    auto it = query->find("account_id_hint");
    if (it == query->end() || it->second.empty())
        return std::nullopt;
    return it->second;
}

struct flow_options
{
    /// Always served besides the redirect URI; empty disables it
    std::string fallback_prefix{FALLBACK_PREFIX};
    std::chrono::steady_clock::duration callback_timeout = std::chrono::minutes{5};
    /// Budget of the optional tunnel step
    std::chrono::steady_clock::duration tunnel_budget = std::chrono::seconds{30};
    bool use_tunnel = true;
    /// Try to acquire the OS permission to serve the redirect prefix
    bool grant_permission = true;
    /// Empty: the desktop default browser
    platform::browser_launcher launcher;
    /// Observer of every state transition
    std::function<void(flow_state)> on_state;
    /// Receives the consent URL before the browser opens, e.g. to print it
    std::function<void(const std::string&)> on_authorization_url;
    std::string page_title{"QuickBooks authorization"};
    /// Named in the callback pages
    std::string application_name{"the application"};
};

struct flow_outcome
{
    flow_state state = flow_state::idle;
    /// Realm captured from the callback, or from the pre-login hint when none was known
    std::optional<std::string> realm_id;
    std::string authorization_url;
};

/**
One interactive authorization attempt. Not reusable: run() may be called once.
**/
class authorization_flow
{
public:
    /**
    @param executor Executor of the callback listener.
    @param creds    Client registration; `realm_id` is the realm known before the flow.
    @param eps      Provider endpoints and scopes.
    @param client   Token endpoint client used for the code exchange.
    @param tokens   Receives the exchanged tokens.
    @param store    Optional; the captured realm is saved there.
    @param tunnel   Optional tunnel started before the browser.
    **/
    authorization_flow(qboauth::asio::any_io_executor executor, credentials creds, endpoints eps,
        token_client& client, token_state& tokens, secrets::secret_store* store,
        tunnel::tunnel_supervisor* tunnel, flow_options options = {})
        : executor_(std::move(executor)), creds_(std::move(creds)), endpoints_(std::move(eps)),
          client_(client), tokens_(tokens), store_(store), tunnel_(tunnel), options_(std::move(options))
    {
    }

    authorization_flow(const authorization_flow&) = delete;
    authorization_flow& operator=(const authorization_flow&) = delete;

    [[nodiscard]] flow_state state() const noexcept
    {
        return state_.load(std::memory_order_acquire);
    }

    /**
    Run the flow to a terminal state.

    @return The outcome on success. Otherwise `listener_bind_failed` (with remediation),
            `listener_timeout`, `auth_state_mismatch`, `auth_denied`, the code exchange
            error, or `cancelled`.
    **/
    qboauth::asio::awaitable<result<flow_outcome>> run(std::stop_token stop = {})
    {
        if (state() != flow_state::idle)
            co_return fail<flow_outcome>(errc::invalid_argument, "authorization flow already ran");

        transition(flow_state::preparing);
        auto csrf = detail::random_hex_token();
        if (!csrf)
            co_return finish_failed(std::move(csrf).error());

        net::callback_listener listener(executor_);
        const auto prefixes = listener_prefixes(creds_.redirect_uri, options_.fallback_prefix);
        for (const auto& prefix : prefixes)
        {
            auto added = listener.add_prefix(prefix);
            if (!added)
                QBOAUTH_WARN(std::format("Ignoring listener prefix {}: {}", prefix, added.error().to_string()));
        }

        if (prefixes.empty())
            co_return finish_failed(make_error(errc::listener_bind_failed,
                "no callback prefix to listen on", "the redirect URI and the fallback prefix are both empty"));

        const std::string primary = prefixes.front();
        if (!platform::check_listener_permission(primary))
        {
            const bool granted = options_.grant_permission && platform::grant_listener_permission(primary);
            QBOAUTH_INFO(std::format("Listener permission for {} missing, grant attempted: {}", primary, granted));
        }

        auto started = listener.start();
        if (!started)
            co_return finish_failed(std::move(started).error());
        transition(flow_state::listener_bound);

        if (options_.use_tunnel && tunnel_ != nullptr)
        {
            const bool ready = co_await tunnel_->ensure_tunnel(std::chrono::steady_clock::now() + options_.tunnel_budget, stop);
            if (ready)
                QBOAUTH_INFO(std::format("Tunnel ready{}", tunnel_->public_url() ? " at " + *tunnel_->public_url() : std::string{}));
            else
                QBOAUTH_DEBUG("Tunnel step skipped, continuing with the local callback");
        }
        if (stop.stop_requested())
        {
            co_await listener.close();
            co_return finish_failed(detail::cancelled_error("authorization flow"));
        }

        outcome_.authorization_url = build_authorization_url(endpoints_.authorization, creds_.client_id,
            endpoints_.scopes, creds_.redirect_uri, *csrf);
        if (options_.on_authorization_url)
            options_.on_authorization_url(outcome_.authorization_url);

        launch_browser();
        transition(flow_state::browser_launched);

        transition(flow_state::awaiting_callback);
        auto exchange = co_await listener.next_request(options_.callback_timeout, stop);
        co_await listener.close();
        if (!exchange)
        {
            if (exchange.error().is(errc::listener_timeout))
            {
                QBOAUTH_WARN("Timed out waiting for the authorization redirect");
                transition(flow_state::timed_out);
                co_return detail::make_unexpected(std::move(exchange).error());
            }
            co_return finish_failed(std::move(exchange).error());
        }

        co_return co_await complete(*exchange, *csrf, stop);
    }

private:
    qboauth::asio::awaitable<result<flow_outcome>> complete(net::callback_exchange& exchange, const std::string& csrf,
        std::stop_token stop)
    {
        const auto code = exchange.param("code");
        const auto returned_state = exchange.param("state");
        const auto error = exchange.param("error");

        std::optional<error_info> rejected;
        if (!exchange.query_valid())
            rejected = make_error(errc::protocol_malformed_response, "authorization callback has a malformed query");
        else if (error && !error->empty())
        {
            QBOAUTH_WARN(std::format("Authorization provider returned error {}", *error));
            rejected = make_error(errc::auth_denied, std::format("authorization denied: {}", *error),
                detail::error_detail().add("error", *error)
                    .add("error_description", exchange.param("error_description").value_or("")).str());
        }
        else if (!code || code->empty())
            rejected = make_error(errc::auth_not_completed, "authorization callback carries no code");
        else if (!returned_state || *returned_state != csrf)
            rejected = make_error(errc::auth_state_mismatch, "authorization callback state does not match");

        if (rejected)
        {
            co_await answer(exchange, std::format("Authorization failed. You can close this window and return to {}.",
                options_.application_name));
            co_return finish_failed(std::move(*rejected));
        }

        auto tokens = co_await client_.exchange_code(*code, creds_.redirect_uri, stop);
        if (!tokens)
        {
            QBOAUTH_ERROR(std::format("Failed to exchange authorization code for tokens: {}", tokens.error().to_string()));
            co_await answer(exchange, "Authorization encountered an error. Check application logs for details.");
            co_return finish_failed(std::move(tokens).error());
        }

        auto committed = tokens_.commit(*tokens);
        if (!committed)
            QBOAUTH_WARN(std::format("Tokens acquired but not persisted: {}", committed.error().to_string()));

        co_await capture_realm(exchange.param("realmId"));

        QBOAUTH_INFO("Tokens acquired interactively");
        co_await answer(exchange, std::format("Authorization complete. You may close this tab and return to {}.",
            options_.application_name));
        transition(flow_state::succeeded);
        outcome_.state = flow_state::succeeded;
        co_return outcome_;
    }

    qboauth::asio::awaitable<void> capture_realm(std::optional<std::string> from_callback)
    {
        std::optional<std::string> realm;
        if (from_callback && !from_callback->empty())
            realm = std::move(from_callback);
        else if ((!creds_.realm_id || creds_.realm_id->empty()) && creds_.prelogin_url)
        {
            realm = account_id_hint(*creds_.prelogin_url);
            if (realm)
                QBOAUTH_INFO(std::format("Captured realm id {} from the pre-login account hint", *realm));
            else
                QBOAUTH_DEBUG("Pre-login URL carries no account_id_hint");
        }

        if (!realm)
            co_return;
        outcome_.realm_id = realm;

        if (store_ == nullptr)
            co_return;
        auto saved = co_await store_->set(std::string(REALM_SECRET_NAME), *realm);
        if (!saved)
            QBOAUTH_WARN(std::format("Could not save the realm id: {}", saved.error().to_string()));
    }

    void launch_browser()
    {
        const auto launcher = options_.launcher ? options_.launcher : platform::default_browser_launcher();

        if (creds_.prelogin_url && !creds_.prelogin_url->empty())
        {
            if (!launcher(*creds_.prelogin_url))
                QBOAUTH_WARN("Failed to open the pre-login URL, continuing with authorization");
        }

        QBOAUTH_WARN(std::format("Launching QuickBooks authorization{}",
            creds_.realm_id ? std::format(" for realm {}", *creds_.realm_id) : std::string{}));
        if (!launcher(outcome_.authorization_url))
            QBOAUTH_WARN(std::format("Could not open a browser. Open this URL to continue: {}", outcome_.authorization_url));
    }

    qboauth::asio::awaitable<void> answer(net::callback_exchange& exchange, std::string_view message)
    {
        auto sent = co_await exchange.respond(200, render_callback_page(options_.page_title, message));
        if (!sent)
            QBOAUTH_DEBUG(std::format("Could not answer the authorization callback: {}", sent.error().to_string()));
    }

    result<flow_outcome> finish_failed(error_info err)
    {
        transition(flow_state::failed);
        outcome_.state = flow_state::failed;
        if (!err.is_cancelled())
            QBOAUTH_ERROR(std::format("Authorization failed: {}", err.to_string()));
        return fail<flow_outcome>(std::move(err));
    }

    void transition(flow_state next)
    {
        state_.store(next, std::memory_order_release);
        QBOAUTH_DEBUG(std::format("Authorization flow: {}", to_string(next)));
        if (options_.on_state)
            options_.on_state(next);
    }

    qboauth::asio::any_io_executor executor_;
    credentials creds_;
    endpoints endpoints_;
    token_client& client_;
    token_state& tokens_;
    secrets::secret_store* store_;
    tunnel::tunnel_supervisor* tunnel_;
    flow_options options_;
    std::atomic<flow_state> state_{flow_state::idle};
    flow_outcome outcome_;
};

} // namespace qboauth::oauth2
