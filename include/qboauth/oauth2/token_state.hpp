/*

token_state.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Token pair owned by the lifecycle coordinator; every mutation is persisted at once.

*/

#pragma once

#include <chrono>
#include <format>
#include <mutex>
#include <string>
#include <utility>

#include <qboauth/detail/log.hpp>
#include <qboauth/detail/result.hpp>
#include <qboauth/oauth2/token.hpp>
#include <qboauth/settings/settings_store.hpp>

namespace qboauth::oauth2
{

class token_state
{
public:
    explicit token_state(settings::settings_store& store)
        : store_(store)
    {
    }

    token_state(const token_state&) = delete;
    token_state& operator=(const token_state&) = delete;

    /// Replace the in-memory token with the persisted record
    result_void load()
    {
        auto record = store_.load();
        if (!record)
            return fail(std::move(record).error());

        std::lock_guard<std::mutex> lock(mutex_);
        current_.access_token = std::move(record->access_token);
        current_.refresh_token = std::move(record->refresh_token);
        current_.expires_at = record->token_expiry;
        current_.refresh_expires_at = record->refresh_token_expiry;
        return ok();
    }

    [[nodiscard]] token snapshot() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return current_;
    }

    [[nodiscard]] bool is_valid(std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return current_.is_valid(now);
    }

    [[nodiscard]] std::string refresh_token() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return current_.refresh_token;
    }

    [[nodiscard]] std::string access_token() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return current_.access_token;
    }

    /**
    Apply a token endpoint reply and persist it.

    A reply without `refresh_token` keeps the current one. The in-memory state is updated
    even when the save fails; the save error is returned.
    **/
    result_void commit(const token_response& response,
        std::chrono::system_clock::time_point now = std::chrono::system_clock::now())
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current_.access_token = response.access_token;
        if (response.refresh_token && !response.refresh_token->empty())
            current_.refresh_token = *response.refresh_token;
        current_.expires_at = now + response.expires_in;
        if (response.refresh_expires_in)
            current_.refresh_expires_at = now + *response.refresh_expires_in;
        return persist_locked();
    }

    /// Reset every field to empty/unset and persist
    result_void clear()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current_ = token{};
        return persist_locked();
    }

private:
    result_void persist_locked()
    {
        settings::token_settings record;
        record.access_token = current_.access_token;
        record.refresh_token = current_.refresh_token;
        record.token_expiry = current_.expires_at;
        record.refresh_token_expiry = current_.refresh_expires_at;

        auto saved = store_.save(record);
        if (!saved)
            QBOAUTH_ERROR(std::format("Persisting token state failed: {}", saved.error().to_string()));
        return saved;
    }

    settings::settings_store& store_;
    mutable std::mutex mutex_;
    token current_;
};

} // namespace qboauth::oauth2
