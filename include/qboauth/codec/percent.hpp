/*

percent.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <qboauth/detail/result.hpp>


namespace qboauth::codec
{


inline constexpr char PERCENT_HEX_FLAG = '%';

[[nodiscard]] constexpr bool is_unreserved(char ch) noexcept
{
    return (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9')
        || ch == '-' || ch == '_' || ch == '.' || ch == '~';
}

[[nodiscard]] constexpr int hex_digit_to_int(char ch) noexcept
{
    if (ch >= '0' && ch <= '9')
        return ch - '0';
    if (ch >= 'A' && ch <= 'F')
        return ch - 'A' + 10;
    if (ch >= 'a' && ch <= 'f')
        return ch - 'a' + 10;
    return -1;
}


/**
Percent encoding of a URI component as described in RFC 3986 section 2.

Everything outside the unreserved set is escaped, a space becomes `%20`.

@param txt String to encode.
@return    Encoded string.
**/
[[nodiscard]] inline std::string percent_encode(std::string_view txt)
{
    static constexpr char hex[] = "0123456789ABCDEF";
    std::string enc_text;
    enc_text.reserve(txt.size() * 3);
    for (char ch : txt)
    {
        if (is_unreserved(ch))
            enc_text.push_back(ch);
        else
        {
            const auto byte = static_cast<unsigned char>(ch);
            enc_text.push_back(PERCENT_HEX_FLAG);
            enc_text.push_back(hex[byte >> 4]);
            enc_text.push_back(hex[byte & 0x0F]);
        }
    }
    return enc_text;
}


/**
Decoding a percent encoded string.

@param txt        String to decode.
@param plus_space Decode `+` as a space, as forms and query strings do.
@return           Decoded string or `invalid_argument` on a bad escape.
**/
[[nodiscard]] inline result<std::string> percent_decode(std::string_view txt, bool plus_space = true)
{
    std::string dec_text;
    dec_text.reserve(txt.size());
    for (std::size_t i = 0; i < txt.size(); ++i)
    {
        const char ch = txt[i];
        if (ch == PERCENT_HEX_FLAG)
        {
            if (i + 2 >= txt.size())
                return fail<std::string>(errc::invalid_argument, "truncated percent escape");
            const int hi = hex_digit_to_int(txt[i + 1]);
            const int lo = hex_digit_to_int(txt[i + 2]);
            if (hi < 0 || lo < 0)
                return fail<std::string>(errc::invalid_argument, "bad character in percent escape");
            dec_text.push_back(static_cast<char>((hi << 4) + lo));
            i += 2;
        }
        else if (ch == '+' && plus_space)
            dec_text.push_back(' ');
        else
            dec_text.push_back(ch);
    }
    return dec_text;
}


using form_fields = std::vector<std::pair<std::string, std::string>>;

/// application/x-www-form-urlencoded body, also used for query strings
[[nodiscard]] inline std::string form_encode(const form_fields& fields)
{
    std::string body;
    for (const auto& [name, value] : fields)
    {
        if (!body.empty())
            body.push_back('&');
        body += percent_encode(name);
        body.push_back('=');
        body += percent_encode(value);
    }
    return body;
}


} // namespace qboauth::codec
