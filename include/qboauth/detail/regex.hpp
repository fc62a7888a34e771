/*

regex.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <string>
#include <qboauth/config.hpp>

#if QBOAUTH_USE_STD_REGEX
#include <regex>
#else
#include <boost/regex.hpp>
#endif

namespace qboauth::detail
{
#if QBOAUTH_USE_STD_REGEX
using regex = std::regex;
using smatch = std::smatch;

inline regex make_icase_regex(const char* pattern)
{
    return regex(pattern, std::regex_constants::ECMAScript | std::regex_constants::icase);
}

inline bool regex_search(const std::string& input, smatch& matches, const regex& pattern)
{
    return std::regex_search(input, matches, pattern);
}
#else
using regex = boost::regex;
using smatch = boost::smatch;

inline regex make_icase_regex(const char* pattern)
{
    return regex(pattern, boost::regex::perl | boost::regex::icase);
}

inline bool regex_search(const std::string& input, smatch& matches, const regex& pattern)
{
    return boost::regex_search(input, matches, pattern);
}
#endif
} // namespace qboauth::detail
