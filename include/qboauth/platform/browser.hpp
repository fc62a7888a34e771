/*

browser.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <format>
#include <functional>
#include <string>
#include <vector>

#include <qboauth/detail/log.hpp>
#include <qboauth/platform/process.hpp>

namespace qboauth::platform
{

/// Opens a URL for the user; returns false if nothing could be launched
using browser_launcher = std::function<bool(const std::string& url)>;

/// Hand the URL to the desktop's default browser. Advisory: failures are logged, never raised.
inline bool open_in_browser(const std::string& url)
{
#if defined(_WIN32)
    const char* program = "rundll32";
    const std::vector<std::string> args{"url.dll,FileProtocolHandler", url};
#elif defined(__APPLE__)
    const char* program = "open";
    const std::vector<std::string> args{url};
#else
    const char* program = "xdg-open";
    const std::vector<std::string> args{url};
#endif

    auto launched = launch_detached(program, args);
    if (!launched)
    {
        QBOAUTH_WARN(std::format("Cannot open browser with '{}': {}. Open the URL manually.", program,
            launched.error().to_string()));
        return false;
    }
    return true;
}

[[nodiscard]] inline browser_launcher default_browser_launcher()
{
    return [](const std::string& url) { return open_in_browser(url); };
}

} // namespace qboauth::platform
