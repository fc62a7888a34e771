/*

qboauth.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <qboauth/config.hpp>
#include <qboauth/detail/log.hpp>
#include <qboauth/detail/result.hpp>

#include <qboauth/codec/percent.hpp>

#include <qboauth/net/http_client.hpp>
#include <qboauth/net/callback_listener.hpp>
#include <qboauth/net/tls_options.hpp>

#include <qboauth/settings/settings_store.hpp>
#include <qboauth/secrets/secret_store.hpp>
#include <qboauth/secrets/secret_resolver.hpp>

#include <qboauth/oauth2/credentials.hpp>
#include <qboauth/oauth2/token.hpp>
#include <qboauth/oauth2/token_state.hpp>
#include <qboauth/oauth2/token_client.hpp>
#include <qboauth/oauth2/refresh_engine.hpp>
#include <qboauth/oauth2/authorization_flow.hpp>

#include <qboauth/tunnel/tunnel_supervisor.hpp>
#include <qboauth/api/data_api.hpp>

// Entry point
#include <qboauth/lifecycle/coordinator.hpp>

#if QBOAUTH_THROWING_ENABLED
#include <qboauth/throwing.hpp>
#endif
