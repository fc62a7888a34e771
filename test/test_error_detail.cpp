/*

test_error_detail.cpp
---------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE error_detail_test

#include <boost/test/unit_test.hpp>

#include <string>

#include <qboauth/detail/error_detail.hpp>


BOOST_AUTO_TEST_CASE(error_detail_single_line_values)
{
    qboauth::detail::error_detail detail;
    detail.add("prefix", "http://localhost:8080/\r\n").add_int("status", 400);
    BOOST_TEST(detail.str() == "prefix=http://localhost:8080/  \nstatus=400\n");
}

BOOST_AUTO_TEST_CASE(error_detail_body_is_redacted_and_cut)
{
    qboauth::detail::error_detail detail;
    detail.add_body("body", R"({"error":"invalid_grant","refresh_token":"RT-secret"})");
    BOOST_TEST(detail.str().find("RT-secret") == std::string::npos);
    BOOST_TEST(detail.str().find("invalid_grant") != std::string::npos);

    qboauth::detail::error_detail long_detail;
    long_detail.add_body("body", std::string(2000, 'x'), 16);
    BOOST_TEST(long_detail.str() == "body=" + std::string(16, 'x') + "...\n");
}

BOOST_AUTO_TEST_CASE(error_detail_cause_lines)
{
    const auto cause = qboauth::make_error(qboauth::errc::http_status_error, "token endpoint returned HTTP 500",
        "status=500\nbody=oops\n");

    qboauth::detail::error_detail detail;
    detail.add_int("attempts", 3);
    detail.add_cause(cause);
    BOOST_TEST(detail.str() ==
        "attempts=3\n"
        "cause=http_status_error\n"
        "cause_message=token endpoint returned HTTP 500\n"
        "cause.status=500\n"
        "cause.body=oops\n");
}
