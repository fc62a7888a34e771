/*

config.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Global build configuration for qboauth.

Define QBOAUTH_NO_EXCEPTIONS to disable exception-based wrappers.
Define QBOAUTH_USE_STD_REGEX=1 to match tunnel output with std::regex instead of Boost.Regex.

*/

#pragma once

#if defined(QBOAUTH_NO_EXCEPTIONS)
#define QBOAUTH_THROWING_ENABLED 0
#else
#define QBOAUTH_THROWING_ENABLED 1
#endif

#if !defined(QBOAUTH_USE_STD_REGEX)
#define QBOAUTH_USE_STD_REGEX 0
#endif
