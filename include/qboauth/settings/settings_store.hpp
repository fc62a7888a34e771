/*

settings_store.hpp
------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Persisted token record. save() is synchronous and durable once it returns.

*/

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

#include <qboauth/detail/exception_bridge.hpp>
#include <qboauth/detail/log.hpp>
#include <qboauth/detail/result.hpp>
#include <qboauth/platform/private_file.hpp>

namespace qboauth::settings
{

struct token_settings
{
    std::string access_token;
    std::string refresh_token;
    /// nullopt: no token was ever obtained
    std::optional<std::chrono::system_clock::time_point> token_expiry;
    std::optional<std::chrono::system_clock::time_point> refresh_token_expiry;

    friend bool operator==(const token_settings&, const token_settings&) = default;
};

class settings_store
{
public:
    virtual ~settings_store() = default;

    virtual result<token_settings> load() = 0;

    virtual result_void save(const token_settings& record) = 0;
};

/// In-process store, used when persistence is handled elsewhere and in tests
class memory_settings_store : public settings_store
{
public:
    memory_settings_store() = default;

    explicit memory_settings_store(token_settings initial)
        : record_(std::move(initial))
    {
    }

    result<token_settings> load() override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return record_;
    }

    result_void save(const token_settings& record) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        record_ = record;
        ++saves_;
        return ok();
    }

    [[nodiscard]] token_settings current() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return record_;
    }

    [[nodiscard]] std::size_t save_count() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return saves_;
    }

private:
    mutable std::mutex mutex_;
    token_settings record_;
    std::size_t saves_ = 0;
};

namespace json_fields
{

[[nodiscard]] inline nlohmann::json time_to_json(const std::optional<std::chrono::system_clock::time_point>& tp)
{
    if (!tp)
        return nullptr;
    return std::chrono::duration_cast<std::chrono::seconds>(tp->time_since_epoch()).count();
}

[[nodiscard]] inline std::optional<std::chrono::system_clock::time_point> time_from_json(const nlohmann::json& value)
{
    if (!value.is_number_integer())
        return std::nullopt;
    return std::chrono::system_clock::time_point(std::chrono::seconds(value.get<std::int64_t>()));
}

[[nodiscard]] inline std::string string_from_json(const nlohmann::json& object, const char* key)
{
    auto it = object.find(key);
    if (it == object.end() || !it->is_string())
        return {};
    return it->get<std::string>();
}

} // namespace json_fields

/**
Token record kept in a JSON file:

    {"access_token": "...", "refresh_token": "...", "token_expiry": 1735689600, "refresh_token_expiry": null}

Times are seconds since the Unix epoch, `null` when unset. The file is written to a
sibling temporary and renamed over the original.
**/
class json_settings_store : public settings_store
{
public:
    explicit json_settings_store(std::filesystem::path path)
        : path_(std::move(path))
    {
    }

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    result<token_settings> load() override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::error_code ec;
        if (!std::filesystem::exists(path_, ec))
            return token_settings{};

        std::ifstream in(path_, std::ios::binary);
        if (!in)
            return fail<token_settings>(errc::settings_load_failed, "cannot open settings file", "path=" + path_.string());
        std::stringstream buffer;
        buffer << in.rdbuf();

        const auto doc = nlohmann::json::parse(buffer.str(), nullptr, false);
        if (doc.is_discarded() || !doc.is_object())
            return fail<token_settings>(errc::settings_load_failed, "settings file is not a JSON object", "path=" + path_.string());

        token_settings record;
        record.access_token = json_fields::string_from_json(doc, "access_token");
        record.refresh_token = json_fields::string_from_json(doc, "refresh_token");
        if (auto it = doc.find("token_expiry"); it != doc.end())
            record.token_expiry = json_fields::time_from_json(*it);
        if (auto it = doc.find("refresh_token_expiry"); it != doc.end())
            record.refresh_token_expiry = json_fields::time_from_json(*it);
        return record;
    }

    result_void save(const token_settings& record) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        nlohmann::json doc = {
            {"access_token", record.access_token},
            {"refresh_token", record.refresh_token},
            {"token_expiry", json_fields::time_to_json(record.token_expiry)},
            {"refresh_token_expiry", json_fields::time_to_json(record.refresh_token_expiry)}
        };

        return protect([&]()
        {
            if (path_.has_parent_path())
                std::filesystem::create_directories(path_.parent_path());

            auto temp = path_;
            temp += ".tmp";
            platform::write_private_file(temp, doc.dump(2));
            std::filesystem::rename(temp, path_);
        }, errc::settings_save_failed);
    }

private:
    std::filesystem::path path_;
    std::mutex mutex_;
};

} // namespace qboauth::settings
