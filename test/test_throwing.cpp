/*

test_throwing.cpp
-----------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE throwing_test

#include <boost/test/unit_test.hpp>

#include <string>

#include <qboauth/detail/result.hpp>
#include <qboauth/throwing.hpp>


BOOST_AUTO_TEST_CASE(unwrap_value)
{
    qboauth::result<std::string> r = std::string("token");
    BOOST_TEST(qboauth::unwrap(std::move(r)) == "token");
    BOOST_CHECK_NO_THROW(qboauth::unwrap(qboauth::result<void>{}));
}

BOOST_AUTO_TEST_CASE(unwrap_error)
{
    BOOST_CHECK_EXCEPTION(
        qboauth::unwrap(qboauth::fail<int>(qboauth::errc::auth_reauthorization_required, "refresh token rejected")),
        qboauth::exception,
        [](const qboauth::exception& e)
        {
            return e.code() == qboauth::errc::auth_reauthorization_required && e.requires_reauthorization()
                && std::string(e.what()).find("refresh token rejected") != std::string::npos;
        });

    BOOST_CHECK_EXCEPTION(
        qboauth::unwrap(qboauth::fail_void(qboauth::errc::net_timeout, "slow")),
        qboauth::exception,
        [](const qboauth::exception& e)
        {
            return e.kind() == qboauth::error_kind::auth_transient && !e.requires_reauthorization();
        });
}
