/*

env.hpp
-------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Process environment access. Callers take an `env_lookup` so tests can inject a map.

*/

#pragma once

#include <cstdlib>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace qboauth
{

using env_lookup = std::function<std::optional<std::string>(std::string_view)>;

namespace detail
{

[[nodiscard]] inline std::optional<std::string> getenv_nonempty(std::string_view name)
{
    const std::string key(name);
    const char* value = std::getenv(key.c_str());
    if (value == nullptr || *value == '\0')
        return std::nullopt;
    return std::string(value);
}

} // namespace detail

[[nodiscard]] inline env_lookup process_env()
{
    return [](std::string_view name) { return detail::getenv_nonempty(name); };
}

/// Lookup backed by a fixed map, empty values count as absent
[[nodiscard]] inline env_lookup map_env(std::map<std::string, std::string, std::less<>> values)
{
    return [values = std::move(values)](std::string_view name) -> std::optional<std::string>
    {
        auto it = values.find(name);
        if (it == values.end() || it->second.empty())
            return std::nullopt;
        return it->second;
    };
}

} // namespace qboauth
