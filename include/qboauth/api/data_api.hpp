/*

data_api.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <format>
#include <optional>
#include <stop_token>
#include <string>
#include <utility>

#include <qboauth/codec/percent.hpp>
#include <qboauth/detail/asio_decl.hpp>
#include <qboauth/detail/log.hpp>
#include <qboauth/detail/result.hpp>
#include <qboauth/net/http_client.hpp>
#include <qboauth/oauth2/credentials.hpp>

namespace qboauth::api
{

inline constexpr std::string_view SANDBOX_BASE_URL = "https://sandbox-quickbooks.api.intuit.com";
inline constexpr std::string_view PRODUCTION_BASE_URL = "https://quickbooks.api.intuit.com";

/// What a data call needs from the lifecycle
struct session
{
    std::string access_token;
    std::optional<std::string> realm_id;
    oauth2::environment env = oauth2::environment::sandbox;
};

/// Remote accounting API, reduced to the connectivity probe
class data_api
{
public:
    virtual ~data_api() = default;

    /// true when an authenticated call succeeds; transport failures are errors
    virtual qboauth::asio::awaitable<result<bool>> test_connectivity(session s, std::stop_token stop = {}) = 0;
};

struct data_api_options
{
    std::string sandbox_base{SANDBOX_BASE_URL};
    std::string production_base{PRODUCTION_BASE_URL};

    [[nodiscard]] const std::string& base_for(oauth2::environment env) const noexcept
    {
        return env == oauth2::environment::production ? production_base : sandbox_base;
    }
};

/// Probes with `select * from CompanyInfo` on the company of the session
class qbo_data_api : public data_api
{
public:
    qbo_data_api(net::http_client& http, data_api_options options = {})
        : http_(http), options_(std::move(options))
    {
    }

    [[nodiscard]] std::string query_url(const session& s, std::string_view query) const
    {
        return std::format("{}/v3/company/{}/query?query={}", options_.base_for(s.env),
            codec::percent_encode(s.realm_id.value_or("")), codec::percent_encode(query));
    }

    qboauth::asio::awaitable<result<bool>> test_connectivity(session s, std::stop_token stop = {}) override
    {
        if (!s.realm_id || s.realm_id->empty())
        {
            QBOAUTH_WARN("Connection test skipped: no realm id known");
            co_return false;
        }
        if (s.access_token.empty())
            co_return false;

        const net::header_list headers{
            {"Authorization", "Bearer " + s.access_token},
            {"Accept", "application/json"}
        };
        auto reply = co_await http_.get(query_url(s, "select * from CompanyInfo"), headers, stop);
        if (!reply)
            co_return detail::make_unexpected(std::move(reply).error());

        if (!reply->is_success())
        {
            QBOAUTH_WARN(std::format("Connection test for realm {} returned HTTP {}", *s.realm_id, reply->status));
            co_return false;
        }
        QBOAUTH_DEBUG(std::format("Connection test for realm {} succeeded", *s.realm_id));
        co_return true;
    }

private:
    net::http_client& http_;
    data_api_options options_;
};

} // namespace qboauth::api
