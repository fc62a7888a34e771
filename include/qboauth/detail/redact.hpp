/*

redact.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Masking of credentials in HTTP traces, form bodies and token endpoint replies.

*/

#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

namespace qboauth::detail
{

inline constexpr std::string_view REDACTED = "<redacted>";

[[nodiscard]] inline bool iequals_ascii(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i)
    {
        char ca = a[i];
        char cb = b[i];
        if (ca >= 'a' && ca <= 'z')
            ca = static_cast<char>(ca - ('a' - 'A'));
        if (cb >= 'a' && cb <= 'z')
            cb = static_cast<char>(cb - ('a' - 'A'));
        if (ca != cb)
            return false;
    }
    return true;
}

[[nodiscard]] inline bool starts_with_ci(std::string_view text, std::string_view prefix) noexcept
{
    if (text.size() < prefix.size())
        return false;
    return iequals_ascii(text.substr(0, prefix.size()), prefix);
}

[[nodiscard]] inline bool contains_ci(std::string_view text, std::string_view needle) noexcept
{
    if (needle.empty())
        return true;
    if (text.size() < needle.size())
        return false;
    for (std::size_t i = 0; i + needle.size() <= text.size(); ++i)
    {
        if (iequals_ascii(text.substr(i, needle.size()), needle))
            return true;
    }
    return false;
}

/// Field names whose values are never written to logs or error details
inline constexpr std::array<std::string_view, 7> SECRET_FIELDS{
    "access_token", "refresh_token", "id_token", "code", "client_secret", "password", "assertion"};

[[nodiscard]] inline bool is_secret_field(std::string_view name) noexcept
{
    for (auto field : SECRET_FIELDS)
    {
        if (iequals_ascii(name, field))
            return true;
    }
    return false;
}

/// Keep a short prefix of an identifier for diagnostics, e.g. "ABcd1234..."
[[nodiscard]] inline std::string mask_prefix(std::string_view value, std::size_t keep = 8)
{
    if (value.size() <= keep)
        return std::string(value);
    std::string out(value.substr(0, keep));
    out += "...";
    return out;
}

/// Redact "Authorization: ..." style header lines, other lines are returned unchanged
[[nodiscard]] inline std::string redact_header_line(std::string_view line)
{
    const auto colon = line.find(':');
    if (colon == std::string_view::npos)
        return std::string(line);

    const std::string_view name = line.substr(0, colon);
    if (!iequals_ascii(name, "Authorization") && !iequals_ascii(name, "Proxy-Authorization")
        && !iequals_ascii(name, "Cookie") && !iequals_ascii(name, "Set-Cookie"))
        return std::string(line);

    std::string_view value = line.substr(colon + 1);
    while (!value.empty() && value.front() == ' ')
        value.remove_prefix(1);

    std::string result(name);
    result += ": ";
    const auto space = value.find(' ');
    if (space != std::string_view::npos && (iequals_ascii(value.substr(0, space), "Basic")
        || iequals_ascii(value.substr(0, space), "Bearer")))
    {
        result.append(value.substr(0, space));
        result.push_back(' ');
    }
    result.append(REDACTED);
    return result;
}

/**
Redact secret values in a `key=value&key=value` sequence (form bodies, query strings).

@param text Form or query text, without the leading `?`.
@return     Text with the values of secret fields replaced.
**/
[[nodiscard]] inline std::string redact_form(std::string_view text)
{
    std::string result;
    result.reserve(text.size());
    while (true)
    {
        const auto amp = text.find('&');
        const std::string_view pair = text.substr(0, amp);
        const auto eq = pair.find('=');
        if (eq != std::string_view::npos && is_secret_field(pair.substr(0, eq)))
        {
            result.append(pair.substr(0, eq + 1));
            result.append(REDACTED);
        }
        else
            result.append(pair);

        if (amp == std::string_view::npos)
            break;
        result.push_back('&');
        text.remove_prefix(amp + 1);
    }
    return result;
}

/// Redact the query part of a request target, the path is kept
[[nodiscard]] inline std::string redact_target(std::string_view target)
{
    const auto q = target.find('?');
    if (q == std::string_view::npos)
        return std::string(target);
    std::string result(target.substr(0, q + 1));
    result += redact_form(target.substr(q + 1));
    return result;
}

/**
Redact string values of secret members in a JSON text without parsing it.
Malformed input is handled best-effort: anything after an unterminated secret string is dropped.
**/
[[nodiscard]] inline std::string redact_json(std::string_view json)
{
    std::string result;
    result.reserve(json.size());
    std::size_t i = 0;
    while (i < json.size())
    {
        if (json[i] != '"')
        {
            result.push_back(json[i++]);
            continue;
        }

        // string literal: member name or value
        std::size_t end = i + 1;
        while (end < json.size() && json[end] != '"')
            end += (json[end] == '\\') ? 2 : 1;
        if (end >= json.size())
        {
            result.append(json.substr(i));
            break;
        }

        const std::string_view name = json.substr(i + 1, end - i - 1);
        result.append(json.substr(i, end - i + 1));
        i = end + 1;

        std::size_t colon = i;
        while (colon < json.size() && (json[colon] == ' ' || json[colon] == '\t' || json[colon] == '\n' || json[colon] == '\r'))
            ++colon;
        if (colon >= json.size() || json[colon] != ':' || !is_secret_field(name))
            continue;

        std::size_t value = colon + 1;
        while (value < json.size() && (json[value] == ' ' || json[value] == '\t' || json[value] == '\n' || json[value] == '\r'))
            ++value;
        if (value >= json.size() || json[value] != '"')
            continue;

        std::size_t value_end = value + 1;
        while (value_end < json.size() && json[value_end] != '"')
            value_end += (json[value_end] == '\\') ? 2 : 1;

        result.append(json.substr(i, value - i));
        result.push_back('"');
        result.append(REDACTED);
        result.push_back('"');
        if (value_end >= json.size())
            return result;
        i = value_end + 1;
    }
    return result;
}

} // namespace qboauth::detail
