/*

random.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <array>
#include <string>

#include <openssl/err.h>
#include <openssl/rand.h>

#include <qboauth/detail/result.hpp>

namespace qboauth::detail
{

/// 128 bits from the OpenSSL CSPRNG encoded as 32 lowercase hex characters
[[nodiscard]] inline result<std::string> random_hex_token()
{
    std::array<unsigned char, 16> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1)
    {
        const unsigned long err = ERR_get_error();
        return fail<std::string>(errc::internal_error, "RAND_bytes failed",
            "openssl_error=" + std::to_string(err));
    }

    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (unsigned char b : bytes)
    {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

} // namespace qboauth::detail
