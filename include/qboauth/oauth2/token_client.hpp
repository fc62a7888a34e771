/*

token_client.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Single requests to the OAuth2 token endpoint: refresh_token and authorization_code grants.
The client authenticates with HTTP Basic (RFC 6749 section 2.3.1).

*/

#pragma once

#include <chrono>
#include <charconv>
#include <cstdint>
#include <format>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <boost/beast/core/detail/base64.hpp>
#include <nlohmann/json.hpp>

#include <qboauth/codec/percent.hpp>
#include <qboauth/detail/asio_decl.hpp>
#include <qboauth/detail/error_detail.hpp>
#include <qboauth/detail/log.hpp>
#include <qboauth/detail/result.hpp>
#include <qboauth/net/http_client.hpp>
#include <qboauth/oauth2/token.hpp>

namespace qboauth::oauth2
{

[[nodiscard]] inline std::string base64_encode(std::string_view data)
{
    namespace b64 = boost::beast::detail::base64;
    std::string out(b64::encoded_size(data.size()), '\0');
    out.resize(b64::encode(out.data(), data.data(), data.size()));
    return out;
}

namespace token_json
{

[[nodiscard]] inline std::optional<std::int64_t> seconds_field(const nlohmann::json& doc, const char* key)
{
    auto it = doc.find(key);
    if (it == doc.end())
        return std::nullopt;
    if (it->is_number_integer())
        return it->get<std::int64_t>();
    if (it->is_number_float())
        return static_cast<std::int64_t>(it->get<double>());
    if (it->is_string())
    {
        const auto& text = it->get_ref<const std::string&>();
        std::int64_t value = 0;
        const auto res = std::from_chars(text.data(), text.data() + text.size(), value);
        if (res.ec == std::errc{} && res.ptr == text.data() + text.size())
            return value;
    }
    return std::nullopt;
}

[[nodiscard]] inline std::optional<std::string> string_field(const nlohmann::json& doc, const char* key)
{
    auto it = doc.find(key);
    if (it == doc.end() || !it->is_string())
        return std::nullopt;
    return it->get<std::string>();
}

} // namespace token_json

/**
Parse a 2xx token endpoint body.

@return The reply, or `protocol_malformed_response` when the body is not JSON or lacks
        `access_token` / `expires_in`.
**/
[[nodiscard]] inline result<token_response> parse_token_response(std::string_view body)
{
    const auto doc = nlohmann::json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object())
    {
        return fail<token_response>(errc::protocol_malformed_response, "token response is not a JSON object",
            detail::error_detail().add_body("body", body).str());
    }

    auto access = token_json::string_field(doc, "access_token");
    if (!access || access->empty())
    {
        return fail<token_response>(errc::protocol_malformed_response, "token response has no access_token",
            detail::error_detail().add_body("body", body).str());
    }

    auto expires_in = token_json::seconds_field(doc, "expires_in");
    if (!expires_in)
    {
        return fail<token_response>(errc::protocol_malformed_response, "token response has no expires_in",
            detail::error_detail().add_body("body", body).str());
    }

    token_response response;
    response.access_token = std::move(*access);
    response.expires_in = std::chrono::seconds(*expires_in);
    response.refresh_token = token_json::string_field(doc, "refresh_token");
    if (auto refresh_expires = token_json::seconds_field(doc, "x_refresh_token_expires_in"))
        response.refresh_expires_in = std::chrono::seconds(*refresh_expires);
    response.token_type = token_json::string_field(doc, "token_type").value_or("bearer");
    return response;
}

class token_client
{
public:
    token_client(net::http_client& http, std::string token_endpoint, std::string client_id, std::string client_secret)
        : http_(http), endpoint_(std::move(token_endpoint)),
          client_id_(std::move(client_id)), client_secret_(std::move(client_secret))
    {
    }

    [[nodiscard]] const std::string& endpoint() const noexcept { return endpoint_; }

    /// `Basic base64(client_id:client_secret)`
    [[nodiscard]] std::string basic_authorization() const
    {
        return "Basic " + base64_encode(client_id_ + ":" + client_secret_);
    }

    /**
    One refresh_token grant.

    400 is a permanent rejection (`auth_reauthorization_required`); any other non-2xx is
    `http_status_error`; transport failures keep their network code.
    **/
    qboauth::asio::awaitable<result<token_response>> refresh(std::string_view refresh_token, std::stop_token stop = {})
    {
        const codec::form_fields form{
            {"grant_type", "refresh_token"},
            {"refresh_token", std::string(refresh_token)}
        };

        auto reply = co_await http_.post_form(endpoint_, form, headers(), stop);
        if (!reply)
            co_return detail::make_unexpected(std::move(reply).error());

        if (reply->status == 400)
        {
            co_return fail<token_response>(errc::auth_reauthorization_required,
                "refresh token rejected, re-authorization required", status_detail(*reply));
        }
        if (!reply->is_success())
        {
            co_return fail<token_response>(errc::http_status_error,
                std::format("token endpoint returned HTTP {}", reply->status), status_detail(*reply));
        }
        co_return parse_token_response(reply->body);
    }

    /// One authorization_code grant; a reply without refresh_token is malformed here
    qboauth::asio::awaitable<result<token_response>> exchange_code(std::string_view code, std::string_view redirect_uri,
        std::stop_token stop = {})
    {
        const codec::form_fields form{
            {"grant_type", "authorization_code"},
            {"code", std::string(code)},
            {"redirect_uri", std::string(redirect_uri)}
        };

        auto reply = co_await http_.post_form(endpoint_, form, headers(), stop);
        if (!reply)
            co_return detail::make_unexpected(std::move(reply).error());

        if (!reply->is_success())
        {
            co_return fail<token_response>(errc::auth_exchange_failed,
                std::format("authorization code exchange returned HTTP {}", reply->status), status_detail(*reply));
        }

        auto parsed = parse_token_response(reply->body);
        if (parsed && (!parsed->refresh_token || parsed->refresh_token->empty()))
        {
            co_return fail<token_response>(errc::protocol_malformed_response,
                "authorization code exchange returned no refresh_token");
        }
        co_return parsed;
    }

private:
    [[nodiscard]] net::header_list headers() const
    {
        return {
            {"Authorization", basic_authorization()},
            {"Accept", "application/json"}
        };
    }

    [[nodiscard]] static std::string status_detail(const net::http_response& reply)
    {
        return detail::error_detail()
            .add_int("status", reply.status)
            .add_body("body", reply.body)
            .str();
    }

    net::http_client& http_;
    std::string endpoint_;
    std::string client_id_;
    std::string client_secret_;
};

} // namespace qboauth::oauth2
