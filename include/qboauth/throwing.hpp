/*

throwing.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Helpers to bridge qboauth::result into exceptions for users who prefer
exception-based error handling.

*/

#pragma once

#include <stdexcept>
#include <utility>

#include <qboauth/config.hpp>
#include <qboauth/detail/result.hpp>

namespace qboauth
{

#if !QBOAUTH_THROWING_ENABLED
#error "QBOAUTH_NO_EXCEPTIONS is defined; throwing.hpp is disabled."
#endif

class exception : public std::runtime_error
{
public:
    explicit exception(error_info info)
        : std::runtime_error(info.to_string()),
          info_(std::move(info))
    {
    }

    [[nodiscard]] const error_info& info() const noexcept { return info_; }

    [[nodiscard]] errc code() const noexcept { return info_.code; }

    [[nodiscard]] error_kind kind() const noexcept { return info_.kind(); }

    /// Token refresh was rejected permanently, the user must authorize again
    [[nodiscard]] bool requires_reauthorization() const noexcept
    {
        return info_.kind() == error_kind::auth_permanent;
    }

private:
    error_info info_;
};

template<class T>
[[nodiscard]] inline T unwrap(result<T>&& r)
{
    if (!r)
        throw exception(std::move(r.error()));
    return std::move(*r);
}

inline void unwrap(result<void>&& r)
{
    if (!r)
        throw exception(std::move(r.error()));
}

} // namespace qboauth
