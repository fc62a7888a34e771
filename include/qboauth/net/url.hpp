/*

url.hpp
-------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Minimal absolute URL parser for http/https endpoints and query-string decoding.

*/

#pragma once

#include <charconv>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>

#include <boost/algorithm/string/case_conv.hpp>

#include <qboauth/codec/percent.hpp>
#include <qboauth/detail/result.hpp>

namespace qboauth::net
{

struct url
{
    std::string scheme;
    std::string host;
    std::uint16_t port = 0;
    std::string path = "/";
    std::string query;

    [[nodiscard]] bool is_https() const noexcept { return scheme == "https"; }

    /// Request target: path plus query
    [[nodiscard]] std::string target() const
    {
        return query.empty() ? path : path + "?" + query;
    }

    /// Host header value, the port is omitted when it is the scheme default
    [[nodiscard]] std::string host_header() const
    {
        const bool default_port = (is_https() && port == 443) || (!is_https() && port == 80);
        return default_port ? host : host + ":" + std::to_string(port);
    }

    [[nodiscard]] std::string service() const { return std::to_string(port); }
};

/**
Parse an absolute `http` or `https` URL.

@param text URL such as `https://oauth.platform.intuit.com/oauth2/v1/tokens/bearer`.
@return     Parsed URL or `http_bad_url`.
**/
[[nodiscard]] inline result<url> parse_url(std::string_view text)
{
    url out;
    const auto scheme_end = text.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0)
        return fail<url>(errc::http_bad_url, "URL has no scheme", "url=" + std::string(text));

    out.scheme = boost::algorithm::to_lower_copy(std::string(text.substr(0, scheme_end)));
    if (out.scheme != "http" && out.scheme != "https")
        return fail<url>(errc::http_bad_url, "unsupported URL scheme", "scheme=" + out.scheme);

    std::string_view rest = text.substr(scheme_end + 3);
    const auto fragment = rest.find('#');
    if (fragment != std::string_view::npos)
        rest = rest.substr(0, fragment);

    const auto authority_end = rest.find_first_of("/?");
    std::string_view authority = rest.substr(0, authority_end);
    std::string_view tail = authority_end == std::string_view::npos ? std::string_view{} : rest.substr(authority_end);

    const auto at = authority.rfind('@');
    if (at != std::string_view::npos)
        authority.remove_prefix(at + 1);

    std::string_view host = authority;
    std::string_view port_text;
    if (!authority.empty() && authority.front() == '[')
    {
        const auto close = authority.find(']');
        if (close == std::string_view::npos)
            return fail<url>(errc::http_bad_url, "unterminated IPv6 host", "url=" + std::string(text));
        host = authority.substr(1, close - 1);
        if (close + 1 < authority.size() && authority[close + 1] == ':')
            port_text = authority.substr(close + 2);
    }
    else
    {
        const auto colon = authority.rfind(':');
        if (colon != std::string_view::npos)
        {
            host = authority.substr(0, colon);
            port_text = authority.substr(colon + 1);
        }
    }

    if (host.empty())
        return fail<url>(errc::http_bad_url, "URL has no host", "url=" + std::string(text));
    out.host = boost::algorithm::to_lower_copy(std::string(host));

    if (port_text.empty())
        out.port = out.is_https() ? 443 : 80;
    else
    {
        unsigned int value = 0;
        const auto res = std::from_chars(port_text.data(), port_text.data() + port_text.size(), value);
        if (res.ec != std::errc{} || res.ptr != port_text.data() + port_text.size() || value == 0 || value > 65535)
            return fail<url>(errc::http_bad_url, "invalid URL port", "port=" + std::string(port_text));
        out.port = static_cast<std::uint16_t>(value);
    }

    const auto q = tail.find('?');
    if (q != std::string_view::npos)
    {
        out.query = std::string(tail.substr(q + 1));
        tail = tail.substr(0, q);
    }
    if (!tail.empty())
        out.path = std::string(tail);
    return out;
}

using query_map = std::map<std::string, std::string, std::less<>>;

/// Decode `a=1&b=2`; the first occurrence of a name wins, a name without `=` maps to ""
[[nodiscard]] inline result<query_map> parse_query(std::string_view query)
{
    query_map params;
    while (!query.empty())
    {
        const auto amp = query.find('&');
        const std::string_view pair = query.substr(0, amp);
        if (!pair.empty())
        {
            const auto eq = pair.find('=');
            auto name = codec::percent_decode(pair.substr(0, eq));
            if (!name)
                return detail::make_unexpected(std::move(name).error());
            auto value = codec::percent_decode(eq == std::string_view::npos ? std::string_view{} : pair.substr(eq + 1));
            if (!value)
                return detail::make_unexpected(std::move(value).error());
            params.emplace(std::move(*name), std::move(*value));
        }
        if (amp == std::string_view::npos)
            break;
        query.remove_prefix(amp + 1);
    }
    return params;
}

} // namespace qboauth::net
