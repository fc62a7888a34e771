/*

tls_options.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <boost/asio/ssl/host_name_verification.hpp>

#include <qboauth/detail/asio_decl.hpp>
#include <qboauth/detail/result.hpp>

namespace qboauth::net
{

enum class verify_mode
{
    none,
    peer
};

struct tls_options
{
    verify_mode verify = verify_mode::peer;
    bool verify_host = true;
    std::optional<int> min_tls_version = TLS1_2_VERSION;
    std::string cipher_list;
    bool use_default_verify_paths = true;
    std::vector<std::string> ca_files;
    std::vector<std::string> ca_paths;
};

[[nodiscard]] inline std::string openssl_error_message()
{
    const unsigned long err = ERR_get_error();
    if (err == 0)
        return {};
    char buffer[256];
    ERR_error_string_n(err, buffer, sizeof(buffer));
    return std::string(buffer);
}

/**
Configure the trust store and protocol floor of a client context.
**/
[[nodiscard]] inline result_void configure_context(qboauth::asio::ssl::context& ctx, const tls_options& options)
{
    qboauth::asio::error_code ec;
    if (options.use_default_verify_paths)
    {
        ctx.set_default_verify_paths(ec);
        if (ec)
            return fail(make_error(errc::tls_verify_failed, "TLS trust store configuration failed.", ec.message(), ec));
    }

    for (const auto& file : options.ca_files)
    {
        if (file.empty())
            continue;
        ctx.load_verify_file(file, ec);
        if (ec)
            return fail(make_error(errc::tls_verify_failed, "TLS trust store configuration failed.", "file=" + file, ec));
    }

    for (const auto& path : options.ca_paths)
    {
        if (path.empty())
            continue;
        ctx.add_verify_path(path, ec);
        if (ec)
            return fail(make_error(errc::tls_verify_failed, "TLS trust store configuration failed.", "path=" + path, ec));
    }

    if (options.min_tls_version.has_value()
        && SSL_CTX_set_min_proto_version(ctx.native_handle(), options.min_tls_version.value()) != 1)
    {
        return fail(errc::tls_handshake_failed, "TLS min version configuration failed.", openssl_error_message());
    }

    if (!options.cipher_list.empty() && SSL_CTX_set_cipher_list(ctx.native_handle(), options.cipher_list.c_str()) != 1)
        return fail(errc::tls_handshake_failed, "TLS cipher list configuration failed.", openssl_error_message());

    return ok();
}

/**
Set SNI and the peer verification policy on a stream before its handshake.

@param stream Any Asio/Beast SSL stream exposing `native_handle()` and the verify setters.
@param host   Host name sent as SNI and checked against the certificate.
**/
template<typename Stream>
[[nodiscard]] result_void prepare_client_stream(Stream& stream, const std::string& host, const tls_options& options)
{
    if (!host.empty() && SSL_set_tlsext_host_name(stream.native_handle(), host.c_str()) != 1)
        return fail(errc::tls_handshake_failed, "TLS SNI configuration failed.", openssl_error_message());

    if (options.verify == verify_mode::none)
    {
        stream.set_verify_mode(qboauth::asio::ssl::verify_none);
        return ok();
    }

    stream.set_verify_mode(qboauth::asio::ssl::verify_peer);
    if (options.verify_host)
    {
        if (host.empty())
            return fail(errc::tls_verify_failed, "TLS hostname verification requires a host name.");
        stream.set_verify_callback(qboauth::asio::ssl::host_name_verification(host));
    }
    return ok();
}

} // namespace qboauth::net
