/*

error_detail.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Header-only helper to build structured error_detail strings without throwing
(except potential allocation failures).

Each entry is formatted as key=value\n to ease parsing and redaction.

*/

#pragma once

#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

#include <qboauth/detail/redact.hpp>
#include <qboauth/detail/result.hpp>

namespace qboauth::detail
{

class error_detail
{
public:
    error_detail() = default;

    error_detail& add(std::string_view key, std::string_view value)
    {
        append_key(key);
        append_single_line(value);
        out_.push_back('\n');
        return *this;
    }

    error_detail& add_int(std::string_view key, std::uint64_t v)
    {
        append_key(key);
        append_int(v);
        out_.push_back('\n');
        return *this;
    }

    error_detail& add_ec(std::string_view key, std::error_code ec)
    {
        append_key(key);
        append_int(static_cast<std::uint64_t>(ec.value()));

        const std::string msg = ec.message();
        if (!msg.empty())
        {
            out_.push_back(' ');
            append_single_line(msg);
        }
        out_.push_back('\n');
        return *this;
    }

    /// Response body of a token or API endpoint; JSON secrets are masked and long bodies cut
    error_detail& add_body(std::string_view key, std::string_view body, std::size_t max_len = 512)
    {
        std::string masked = redact_json(body);
        if (masked.size() > max_len)
        {
            masked.resize(max_len);
            masked += "...";
        }
        return add(key, masked);
    }

    /// Nested failure: code and message of the underlying cause
    error_detail& add_cause(const error_info& cause)
    {
        add("cause", to_string(cause.code));
        add("cause_message", cause.message);
        if (!cause.detail.empty())
        {
            for (std::size_t pos = 0; pos < cause.detail.size();)
            {
                const auto nl = cause.detail.find('\n', pos);
                const auto line = std::string_view(cause.detail).substr(pos,
                    nl == std::string::npos ? std::string::npos : nl - pos);
                if (!line.empty())
                {
                    out_.append("cause.");
                    out_.append(line.data(), line.size());
                    out_.push_back('\n');
                }
                if (nl == std::string::npos)
                    break;
                pos = nl + 1;
            }
        }
        return *this;
    }

    [[nodiscard]] std::string str() const
    {
        return out_;
    }

private:
    std::string out_;

    void append_key(std::string_view key)
    {
        out_.append(key.data(), key.size());
        out_.push_back('=');
    }

    void append_single_line(std::string_view value)
    {
        for (char ch : value)
            out_.push_back((ch == '\r' || ch == '\n') ? ' ' : ch);
    }

    void append_int(std::uint64_t v)
    {
        char buffer[32]{};
        const auto res = std::to_chars(std::begin(buffer), std::end(buffer), v);
        if (res.ec == std::errc{})
            out_.append(buffer, static_cast<std::size_t>(res.ptr - buffer));
        else
            out_.append("0");
    }
};

} // namespace qboauth::detail
