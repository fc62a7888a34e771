/*

test_stores.cpp
---------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE stores_test

#include <boost/test/unit_test.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

#include <boost/filesystem/operations.hpp>

#include <csignal>
#include <sys/resource.h>
#include <sys/stat.h>

#include <qboauth/detail/asio_decl.hpp>
#include <qboauth/secrets/secret_store.hpp>
#include <qboauth/settings/settings_store.hpp>
#include "support/fake_http_server.hpp"

using namespace std::chrono_literals;

namespace
{

struct temp_dir
{
    temp_dir()
        : path((std::filesystem::temp_directory_path() /
            boost::filesystem::unique_path("qboauth-%%%%-%%%%-%%%%").string()))
    {
        std::filesystem::create_directories(path);
    }

    ~temp_dir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::filesystem::path path;
};

/// Any write past zero bytes fails with EFBIG while alive
struct no_file_growth
{
    no_file_growth()
    {
        ::getrlimit(RLIMIT_FSIZE, &saved);
        previous_handler = std::signal(SIGXFSZ, SIG_IGN);
        previous_mask = ::umask(022);
        rlimit none = saved;
        none.rlim_cur = 0;
        ::setrlimit(RLIMIT_FSIZE, &none);
    }

    ~no_file_growth()
    {
        ::setrlimit(RLIMIT_FSIZE, &saved);
        std::signal(SIGXFSZ, previous_handler);
        ::umask(previous_mask);
    }

    rlimit saved{};
    void (*previous_handler)(int) = nullptr;
    mode_t previous_mask = 0;
};

} // namespace


BOOST_AUTO_TEST_CASE(json_settings_missing_file_is_empty)
{
    temp_dir dir;
    qboauth::settings::json_settings_store store(dir.path / "tokens.json");
    auto record = store.load();
    BOOST_TEST(record.has_value());
    BOOST_TEST((*record == qboauth::settings::token_settings{}));
}

BOOST_AUTO_TEST_CASE(json_settings_save_then_load)
{
    temp_dir dir;
    const auto path = dir.path / "nested" / "tokens.json";
    qboauth::settings::json_settings_store store(path);

    const auto expiry = std::chrono::system_clock::time_point(std::chrono::seconds(1735689600));
    qboauth::settings::token_settings record{"A", "R", expiry, std::nullopt};
    BOOST_TEST(store.save(record).has_value());

    const auto perms = std::filesystem::status(path).permissions();
    BOOST_TEST(((perms & std::filesystem::perms::group_all) == std::filesystem::perms::none));
    BOOST_TEST(((perms & std::filesystem::perms::others_all) == std::filesystem::perms::none));
    BOOST_TEST(!std::filesystem::exists(path.string() + ".tmp"));

    qboauth::settings::json_settings_store reopened(path);
    auto loaded = reopened.load();
    BOOST_TEST(loaded.has_value());
    BOOST_TEST((*loaded == record));
}

BOOST_AUTO_TEST_CASE(json_settings_temp_file_private_before_write)
{
    temp_dir dir;
    const auto path = dir.path / "tokens.json";
    qboauth::settings::json_settings_store store(path);

    qboauth::result_void saved;
    {
        no_file_growth limit;
        saved = store.save(qboauth::settings::token_settings{"A", "R", std::nullopt, std::nullopt});
    }
    BOOST_TEST(!saved.has_value());
    BOOST_TEST(qboauth::to_string(saved.error().code) == "settings_save_failed");

    const auto temp = path.string() + ".tmp";
    BOOST_TEST(std::filesystem::exists(temp));
    const auto perms = std::filesystem::status(temp).permissions();
    BOOST_TEST(((perms & std::filesystem::perms::group_all) == std::filesystem::perms::none));
    BOOST_TEST(((perms & std::filesystem::perms::others_all) == std::filesystem::perms::none));
}

BOOST_AUTO_TEST_CASE(json_settings_save_restricts_stale_temp_file)
{
    temp_dir dir;
    const auto path = dir.path / "tokens.json";
    const auto temp = path.string() + ".tmp";
    std::ofstream(temp) << "left over";
    std::filesystem::permissions(temp, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write |
        std::filesystem::perms::group_read | std::filesystem::perms::others_read, std::filesystem::perm_options::replace);

    qboauth::settings::json_settings_store store(path);
    BOOST_TEST(store.save(qboauth::settings::token_settings{"A", "R", std::nullopt, std::nullopt}).has_value());

    const auto perms = std::filesystem::status(path).permissions();
    BOOST_TEST(((perms & std::filesystem::perms::others_all) == std::filesystem::perms::none));
    auto loaded = store.load();
    BOOST_TEST(loaded.has_value());
    BOOST_TEST(loaded->access_token == "A");
}

BOOST_AUTO_TEST_CASE(json_settings_corrupt_file)
{
    temp_dir dir;
    const auto path = dir.path / "tokens.json";
    std::ofstream(path) << "not json";
    qboauth::settings::json_settings_store store(path);
    auto loaded = store.load();
    BOOST_TEST(!loaded.has_value());
    BOOST_TEST(qboauth::to_string(loaded.error().code) == "settings_load_failed");
}

BOOST_AUTO_TEST_CASE(json_settings_unwritable_directory)
{
    temp_dir dir;
    // a regular file where a directory is needed
    std::ofstream(dir.path / "blocker") << "x";
    qboauth::settings::json_settings_store store(dir.path / "blocker" / "tokens.json");
    auto saved = store.save(qboauth::settings::token_settings{"A", "R", std::nullopt, std::nullopt});
    BOOST_TEST(!saved.has_value());
    BOOST_TEST(qboauth::to_string(saved.error().code) == "settings_save_failed");
}

BOOST_AUTO_TEST_CASE(file_secret_store_roundtrip)
{
    temp_dir dir;
    qboauth::asio::io_context ctx;
    qboauth::secrets::file_secret_store store(dir.path / "secrets.json");

    qboauth::test::run_coroutine(ctx, [&]() -> qboauth::asio::awaitable<void>
    {
        auto absent = co_await store.get("QBO-REALM-ID");
        BOOST_TEST(absent.has_value());
        BOOST_TEST(!absent->has_value());

        auto saved = co_await store.set("QBO-REALM-ID", "9130351");
        BOOST_TEST(saved.has_value());
        auto other = co_await store.set("QBO-CLIENT-ID", "client");
        BOOST_TEST(other.has_value());

        auto found = co_await store.get("QBO-REALM-ID");
        BOOST_TEST(found.has_value());
        BOOST_TEST(found->value_or("") == "9130351");
        co_return;
    });

    const auto perms = std::filesystem::status(dir.path / "secrets.json").permissions();
    BOOST_TEST(((perms & std::filesystem::perms::others_all) == std::filesystem::perms::none));
}

BOOST_AUTO_TEST_CASE(file_secret_store_corrupt)
{
    temp_dir dir;
    std::ofstream(dir.path / "secrets.json") << "[1,2,3]";
    qboauth::asio::io_context ctx;
    qboauth::secrets::file_secret_store store(dir.path / "secrets.json");

    qboauth::test::run_coroutine(ctx, [&]() -> qboauth::asio::awaitable<void>
    {
        auto found = co_await store.get("QBO-CLIENT-ID");
        BOOST_TEST(!found.has_value());
        BOOST_TEST(qboauth::to_string(found.error().code) == "secret_store_failed");
        co_return;
    });
}
