/*

secret_store.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Named secret storage consumed by the resolver. Failures are reported, never fatal to callers.

*/

#pragma once

#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

#include <qboauth/detail/asio_decl.hpp>
#include <qboauth/detail/exception_bridge.hpp>
#include <qboauth/detail/result.hpp>
#include <qboauth/platform/private_file.hpp>

namespace qboauth::secrets
{

class secret_store
{
public:
    virtual ~secret_store() = default;

    /// nullopt when the secret does not exist
    virtual qboauth::asio::awaitable<result<std::optional<std::string>>> get(std::string name) = 0;

    virtual qboauth::asio::awaitable<result_void> set(std::string name, std::string value) = 0;
};

class memory_secret_store : public secret_store
{
public:
    memory_secret_store() = default;

    explicit memory_secret_store(std::map<std::string, std::string> values)
        : values_(std::move(values))
    {
    }

    qboauth::asio::awaitable<result<std::optional<std::string>>> get(std::string name) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = values_.find(name);
        if (it == values_.end())
            co_return std::optional<std::string>{};
        co_return std::optional<std::string>{it->second};
    }

    qboauth::asio::awaitable<result_void> set(std::string name, std::string value) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        values_[std::move(name)] = std::move(value);
        co_return ok();
    }

    [[nodiscard]] std::optional<std::string> peek(const std::string& name) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = values_.find(name);
        if (it == values_.end())
            return std::nullopt;
        return it->second;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> values_;
};

/**
Secrets kept as a flat JSON object in a file readable by the owner only.

Values are stored in clear text; encryption at rest is not provided.
**/
class file_secret_store : public secret_store
{
public:
    explicit file_secret_store(std::filesystem::path path)
        : path_(std::move(path))
    {
    }

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    qboauth::asio::awaitable<result<std::optional<std::string>>> get(std::string name) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto doc = read();
        if (!doc)
            co_return detail::make_unexpected(std::move(doc).error());

        auto it = doc->find(name);
        if (it == doc->end() || !it->is_string())
            co_return std::optional<std::string>{};
        co_return std::optional<std::string>{it->get<std::string>()};
    }

    qboauth::asio::awaitable<result_void> set(std::string name, std::string value) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto doc = read();
        if (!doc)
            co_return detail::make_unexpected(std::move(doc).error());
        (*doc)[name] = value;

        co_return protect([&]()
        {
            if (path_.has_parent_path())
                std::filesystem::create_directories(path_.parent_path());
            platform::write_private_file(path_, doc->dump(2));
        }, errc::secret_store_failed);
    }

private:
    [[nodiscard]] result<nlohmann::json> read() const
    {
        std::error_code ec;
        if (!std::filesystem::exists(path_, ec))
            return nlohmann::json::object();

        std::ifstream in(path_, std::ios::binary);
        if (!in)
            return fail<nlohmann::json>(errc::secret_store_failed, "cannot open secret file", "path=" + path_.string());
        std::stringstream buffer;
        buffer << in.rdbuf();

        auto doc = nlohmann::json::parse(buffer.str(), nullptr, false);
        if (doc.is_discarded() || !doc.is_object())
            return fail<nlohmann::json>(errc::secret_store_failed, "secret file is not a JSON object", "path=" + path_.string());
        return doc;
    }

    std::filesystem::path path_;
    mutable std::mutex mutex_;
};

} // namespace qboauth::secrets
