/*

secret_resolver.hpp
-------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <qboauth/detail/asio_decl.hpp>
#include <qboauth/detail/env.hpp>
#include <qboauth/detail/log.hpp>
#include <qboauth/secrets/secret_store.hpp>

namespace qboauth::secrets
{

/**
Resolves named credentials: the secret store first, then the environment.

Absence is a normal outcome, resolution never fails. Store errors are logged and
treated as absence so the environment still gets a chance.
**/
class secret_resolver
{
public:
    /// @param store Optional store, may be null.
    secret_resolver(secret_store* store, env_lookup env)
        : store_(store), env_(std::move(env))
    {
    }

    /// Environment variable consulted for a secret name: upper case, `-` becomes `_`
    [[nodiscard]] static std::string env_name(std::string_view secret_name)
    {
        std::string out;
        out.reserve(secret_name.size());
        for (char ch : secret_name)
        {
            if (ch == '-' || ch == '.' || ch == ' ')
                out.push_back('_');
            else if (ch >= 'a' && ch <= 'z')
                out.push_back(static_cast<char>(ch - ('a' - 'A')));
            else
                out.push_back(ch);
        }
        return out;
    }

    qboauth::asio::awaitable<std::optional<std::string>> resolve(std::string_view name)
    {
        co_return co_await resolve_any({std::string(name)});
    }

    /**
    Try each name against the store in priority order, then the environment variable
    derived from the first name. The first non-empty value wins.
    **/
    qboauth::asio::awaitable<std::optional<std::string>> resolve_any(std::vector<std::string> names)
    {
        if (names.empty())
            co_return std::nullopt;

        if (store_ != nullptr)
        {
            for (const auto& name : names)
            {
                auto found = co_await store_->get(name);
                if (!found)
                {
                    QBOAUTH_WARN(std::format("Secret store lookup of {} failed: {}", name, found.error().to_string()));
                    continue;
                }
                if (found->has_value() && !(*found)->empty())
                {
                    QBOAUTH_DEBUG(std::format("Secret {} resolved from the secret store", name));
                    co_return std::move(**found);
                }
            }
        }

        const std::string variable = env_name(names.front());
        if (env_)
        {
            if (auto value = env_(variable); value && !value->empty())
            {
                QBOAUTH_DEBUG(std::format("Secret {} resolved from environment variable {}", names.front(), variable));
                co_return value;
            }
        }

        QBOAUTH_DEBUG(std::format("Secret {} not found (store or {})", names.front(), variable));
        co_return std::nullopt;
    }

    [[nodiscard]] secret_store* store() const noexcept { return store_; }

private:
    secret_store* store_;
    env_lookup env_;
};

} // namespace qboauth::secrets
