/*

test_percent_url.cpp
--------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE percent_url_test

#include <boost/test/unit_test.hpp>

#include <string>
#include <vector>

#include <qboauth/codec/percent.hpp>
#include <qboauth/net/url.hpp>
#include <qboauth/oauth2/authorization_flow.hpp>


BOOST_AUTO_TEST_CASE(percent_encode_unreserved_set)
{
    BOOST_TEST(qboauth::codec::percent_encode("AZaz09-_.~") == "AZaz09-_.~");
    BOOST_TEST(qboauth::codec::percent_encode("a b") == "a%20b");
    BOOST_TEST(qboauth::codec::percent_encode("http://localhost:8080/callback/") ==
        "http%3A%2F%2Flocalhost%3A8080%2Fcallback%2F");
    BOOST_TEST(qboauth::codec::percent_encode("\xC3\xA9") == "%C3%A9");
}

BOOST_AUTO_TEST_CASE(percent_decode_escapes)
{
    auto plain = qboauth::codec::percent_decode("a%20b+c");
    BOOST_TEST(plain.has_value());
    BOOST_TEST(*plain == "a b c");

    auto keep_plus = qboauth::codec::percent_decode("a+b", false);
    BOOST_TEST(*keep_plus == "a+b");

    BOOST_TEST(!qboauth::codec::percent_decode("%4").has_value());
    BOOST_TEST(!qboauth::codec::percent_decode("%zz").has_value());
}

BOOST_AUTO_TEST_CASE(form_encode_fields)
{
    const qboauth::codec::form_fields fields{
        {"grant_type", "authorization_code"},
        {"redirect_uri", "http://localhost:8080/callback/"}
    };
    BOOST_TEST(qboauth::codec::form_encode(fields) ==
        "grant_type=authorization_code&redirect_uri=http%3A%2F%2Flocalhost%3A8080%2Fcallback%2F");
}

BOOST_AUTO_TEST_CASE(parse_url_parts)
{
    auto u = qboauth::net::parse_url("HTTPS://Oauth.Platform.Intuit.com/oauth2/v1/tokens/bearer?x=1#frag");
    BOOST_TEST(u.has_value());
    BOOST_TEST(u->scheme == "https");
    BOOST_TEST(u->host == "oauth.platform.intuit.com");
    BOOST_TEST(u->port == 443);
    BOOST_TEST(u->path == "/oauth2/v1/tokens/bearer");
    BOOST_TEST(u->query == "x=1");
    BOOST_TEST(u->target() == "/oauth2/v1/tokens/bearer?x=1");
    BOOST_TEST(u->host_header() == "oauth.platform.intuit.com");

    auto local = qboauth::net::parse_url("http://localhost:8080");
    BOOST_TEST(local->port == 8080);
    BOOST_TEST(local->path == "/");
    BOOST_TEST(local->host_header() == "localhost:8080");

    auto v6 = qboauth::net::parse_url("http://[::1]:9000/cb/");
    BOOST_TEST(v6->host == "::1");
    BOOST_TEST(v6->port == 9000);
}

BOOST_AUTO_TEST_CASE(parse_url_rejects)
{
    BOOST_TEST(!qboauth::net::parse_url("localhost:8080/").has_value());
    BOOST_TEST(!qboauth::net::parse_url("ftp://host/").has_value());
    BOOST_TEST(!qboauth::net::parse_url("http://:80/").has_value());
    BOOST_TEST(!qboauth::net::parse_url("http://host:99999/").has_value());
    BOOST_TEST(qboauth::to_string(qboauth::net::parse_url("nope").error().code) == "http_bad_url");
}

BOOST_AUTO_TEST_CASE(parse_query_first_wins)
{
    auto q = qboauth::net::parse_query("code=AB%2Fc&state=S1&state=S2&realmId=123&flag");
    BOOST_TEST(q.has_value());
    BOOST_TEST(q->at("code") == "AB/c");
    BOOST_TEST(q->at("state") == "S1");
    BOOST_TEST(q->at("realmId") == "123");
    BOOST_TEST(q->at("flag") == "");
    BOOST_TEST(!qboauth::net::parse_query("code=%G1").has_value());
}

BOOST_AUTO_TEST_CASE(authorization_url_joins_scopes)
{
    const std::vector<std::string> scopes{"a b", "c"};
    const auto url = qboauth::oauth2::build_authorization_url("https://appcenter.intuit.com/connect/oauth2",
        "client 1", scopes, "http://localhost:8080/callback/", "S1");

    BOOST_TEST(url.find("scope=a%20b%20c&") != std::string::npos);
    BOOST_TEST(url ==
        "https://appcenter.intuit.com/connect/oauth2?client_id=client%201&response_type=code&scope=a%20b%20c"
        "&redirect_uri=http%3A%2F%2Flocalhost%3A8080%2Fcallback%2F&state=S1");
}

BOOST_AUTO_TEST_CASE(authorization_url_default_scope)
{
    const qboauth::oauth2::endpoints eps;
    const auto url = qboauth::oauth2::build_authorization_url(eps.authorization, "id", eps.scopes,
        "http://localhost:8080/callback/", "S1");
    BOOST_TEST(url.find("scope=com.intuit.quickbooks.accounting&") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(listener_prefixes_normalized)
{
    auto prefixes = qboauth::oauth2::listener_prefixes("http://localhost:8080/callback", "http://localhost:8080/");
    BOOST_TEST(prefixes.size() == 2u);
    BOOST_TEST(prefixes[0] == "http://localhost:8080/callback/");
    BOOST_TEST(prefixes[1] == "http://localhost:8080/");

    auto same = qboauth::oauth2::listener_prefixes("HTTP://LOCALHOST:8080/", "http://localhost:8080/");
    BOOST_TEST(same.size() == 1u);

    auto no_fallback = qboauth::oauth2::listener_prefixes("http://127.0.0.1:9000/cb/", "");
    BOOST_TEST(no_fallback.size() == 1u);
}

BOOST_AUTO_TEST_CASE(prelogin_account_hint)
{
    auto hint = qboauth::oauth2::account_id_hint("https://accounts.intuit.com/app/sign-in?app_group=QBO&account_id_hint=9130351");
    BOOST_TEST(hint.value_or("") == "9130351");
    BOOST_TEST(!qboauth::oauth2::account_id_hint("https://accounts.intuit.com/app/sign-in").has_value());
    BOOST_TEST(!qboauth::oauth2::account_id_hint("not a url").has_value());
}

BOOST_AUTO_TEST_CASE(callback_page_escapes_message)
{
    BOOST_TEST(qboauth::oauth2::render_callback_page("Title", "a < b & \"c\"") ==
        "<html><body><h2>Title</h2><p>a &lt; b &amp; &quot;c&quot;</p></body></html>");
}
