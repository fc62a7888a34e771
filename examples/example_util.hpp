/*

example_util.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <iostream>
#include <qboauth/detail/result.hpp>

inline void print_error(const qboauth::error_info& err)
{
    std::cout << "Error: " << qboauth::to_string(err.code) << " (" << qboauth::to_string(err.kind()) << ") - "
              << err.message << "\n";
    if (!err.detail.empty())
        std::cout << "Detail:\n" << err.detail;
    if (err.sys)
        std::cout << "Sys: " << err.sys.message() << "\n";
    std::cout << "Where: " << err.where.file_name() << ":" << err.where.line()
              << " " << err.where.function_name() << "\n";
}
