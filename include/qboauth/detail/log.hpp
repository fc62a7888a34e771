/*

log.hpp
-------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Lightweight, header-only logging infrastructure for qboauth.
Supports multiple log levels, optional callbacks, and protocol tracing.

QBOAUTH_LOG_LEVEL (trace|debug|info|warn|error|fatal|off) and QBOAUTH_TRACE (1|true|on)
are read by configure_from_env().

*/

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <format>
#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

#include <qboauth/detail/env.hpp>

namespace qboauth::log
{

/// Log severity levels
enum class level : std::uint8_t
{
    trace = 0,   ///< Protocol-level tracing (very verbose)
    debug = 1,   ///< Debug information
    info = 2,    ///< Informational messages
    warn = 3,    ///< Warnings (non-fatal issues)
    error = 4,   ///< Errors (operation failures)
    fatal = 5,   ///< Fatal errors (unrecoverable)
    off = 6      ///< Logging disabled
};

/// Direction for protocol tracing
enum class direction : std::uint8_t
{
    send,
    receive
};

struct entry
{
    level lvl;
    std::chrono::system_clock::time_point timestamp;
    std::string message;
    std::source_location location;

    struct trace_info_t
    {
        direction dir;
        std::string protocol;  // "HTTP", "TUNNEL"
        std::string data;      // already redacted by the caller
    };
    std::optional<trace_info_t> trace_info;
};

using callback_t = std::function<void(const entry&)>;

[[nodiscard]] constexpr std::string_view level_to_string(level lvl) noexcept
{
    switch (lvl)
    {
        case level::trace: return "TRACE";
        case level::debug: return "DEBUG";
        case level::info:  return "INFO";
        case level::warn:  return "WARN";
        case level::error: return "ERROR";
        case level::fatal: return "FATAL";
        case level::off:   return "OFF";
    }
    return "UNKNOWN";
}

/// Case-insensitive level name, nullopt if unknown
[[nodiscard]] inline std::optional<level> parse_level(std::string_view name) noexcept
{
    constexpr level all[] = {level::trace, level::debug, level::info, level::warn, level::error, level::fatal, level::off};
    for (level lvl : all)
    {
        const std::string_view text = level_to_string(lvl);
        if (text.size() != name.size())
            continue;
        bool same = true;
        for (std::size_t i = 0; i < text.size() && same; ++i)
        {
            char c = name[i];
            if (c >= 'a' && c <= 'z')
                c = static_cast<char>(c - ('a' - 'A'));
            same = c == text[i];
        }
        if (same)
            return lvl;
    }
    if (name == "warning" || name == "WARNING")
        return level::warn;
    return std::nullopt;
}

/// Global logger configuration (thread-safe singleton)
class logger
{
public:
    static logger& instance() noexcept
    {
        static logger inst;
        return inst;
    }

    void set_level(level lvl) noexcept
    {
        min_level_.store(static_cast<std::uint8_t>(lvl), std::memory_order_relaxed);
    }

    [[nodiscard]] level get_level() const noexcept
    {
        return static_cast<level>(min_level_.load(std::memory_order_relaxed));
    }

    [[nodiscard]] bool is_enabled(level lvl) const noexcept
    {
        return static_cast<std::uint8_t>(lvl) >= min_level_.load(std::memory_order_relaxed);
    }

    /// Set custom log callback (replaces default stderr output)
    void set_callback(callback_t cb)
    {
        std::lock_guard lock(mutex_);
        callback_ = std::move(cb);
    }

    void clear_callback()
    {
        std::lock_guard lock(mutex_);
        callback_ = nullptr;
    }

    void set_trace_enabled(bool enabled) noexcept
    {
        trace_enabled_.store(enabled, std::memory_order_relaxed);
    }

    [[nodiscard]] bool is_trace_enabled() const noexcept
    {
        return trace_enabled_.load(std::memory_order_relaxed);
    }

    void log(level lvl, std::string_view message,
             std::source_location loc = std::source_location::current())
    {
        if (!is_enabled(lvl))
            return;

        entry e{
            .lvl = lvl,
            .timestamp = std::chrono::system_clock::now(),
            .message = std::string(message),
            .location = loc,
            .trace_info = std::nullopt
        };

        dispatch(e);
    }

    void trace_protocol(std::string_view protocol, direction dir, std::string_view data,
                       std::source_location loc = std::source_location::current())
    {
        if (!is_trace_enabled())
            return;

        entry e{
            .lvl = level::trace,
            .timestamp = std::chrono::system_clock::now(),
            .message = {},
            .location = loc,
            .trace_info = entry::trace_info_t{
                .dir = dir,
                .protocol = std::string(protocol),
                .data = std::string(data)
            }
        };

        dispatch(e);
    }

private:
    logger() = default;

    void dispatch(const entry& e)
    {
        std::lock_guard lock(mutex_);
        if (callback_)
            callback_(e);
        else
            default_output(e);
    }

    static void default_output(const entry& e)
    {
        auto time = std::chrono::system_clock::to_time_t(e.timestamp);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            e.timestamp.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &time);
#else
        localtime_r(&time, &tm_buf);
#endif

        if (e.trace_info)
        {
            const char* dir_str = (e.trace_info->dir == direction::send) ? ">>>" : "<<<";
            std::cerr << std::format("[{:02}:{:02}:{:02}.{:03}] {} {} {}\n",
                tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, ms.count(),
                e.trace_info->protocol, dir_str, sanitize_trace(e.trace_info->data));
        }
        else
        {
            std::cerr << std::format("[{:02}:{:02}:{:02}.{:03}] [{}] qboauth: {}\n",
                tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, ms.count(),
                level_to_string(e.lvl), e.message);
        }
    }

    /// Truncate long payloads and mask control characters
    [[nodiscard]] static std::string sanitize_trace(std::string_view data)
    {
        std::string result(data);

        constexpr std::size_t max_len = 1000;
        if (result.size() > max_len)
        {
            result.resize(max_len);
            result += "... [truncated]";
        }

        for (char& c : result)
        {
            if (static_cast<unsigned char>(c) < 32 && c != '\r' && c != '\n')
                c = '.';
        }

        while (!result.empty() && (result.back() == '\r' || result.back() == '\n'))
            result.pop_back();

        return result;
    }

    std::atomic<std::uint8_t> min_level_{static_cast<std::uint8_t>(level::info)};
    std::atomic<bool> trace_enabled_{false};
    std::mutex mutex_;
    callback_t callback_;
};

/// Apply QBOAUTH_LOG_LEVEL and QBOAUTH_TRACE; unknown values are reported and ignored
inline void configure_from_env(const env_lookup& env = process_env())
{
    if (!env)
        return;
    auto& inst = logger::instance();

    if (auto name = env("QBOAUTH_LOG_LEVEL"))
    {
        if (auto lvl = parse_level(*name))
            inst.set_level(*lvl);
        else
            inst.log(level::warn, std::format("Ignoring unknown QBOAUTH_LOG_LEVEL '{}'", *name));
    }

    if (auto trace = env("QBOAUTH_TRACE"))
    {
        const bool on = *trace == "1" || *trace == "true" || *trace == "on";
        inst.set_trace_enabled(on);
        if (on && !inst.is_enabled(level::trace))
            inst.set_level(level::trace);
    }
}

/**
Collects every entry while alive, in place of the configured output, then restores the
default stderr sink. Meant for tests asserting on log content.
**/
class scoped_capture
{
public:
    explicit scoped_capture(level lvl = level::trace, bool trace = true)
        : previous_level_(logger::instance().get_level()),
          previous_trace_(logger::instance().is_trace_enabled())
    {
        auto& inst = logger::instance();
        inst.set_level(lvl);
        inst.set_trace_enabled(trace);
        inst.set_callback([this](const entry& e)
        {
            std::lock_guard lock(mutex_);
            entries_.push_back(e);
        });
    }

    scoped_capture(const scoped_capture&) = delete;
    scoped_capture& operator=(const scoped_capture&) = delete;

    ~scoped_capture()
    {
        auto& inst = logger::instance();
        inst.clear_callback();
        inst.set_level(previous_level_);
        inst.set_trace_enabled(previous_trace_);
    }

    [[nodiscard]] std::vector<entry> entries() const
    {
        std::lock_guard lock(mutex_);
        return entries_;
    }

    /// True if any message or trace payload contains `needle`
    [[nodiscard]] bool contains(std::string_view needle) const
    {
        std::lock_guard lock(mutex_);
        for (const auto& e : entries_)
        {
            if (e.message.find(needle) != std::string::npos)
                return true;
            if (e.trace_info && e.trace_info->data.find(needle) != std::string::npos)
                return true;
        }
        return false;
    }

private:
    level previous_level_;
    bool previous_trace_;
    mutable std::mutex mutex_;
    std::vector<entry> entries_;
};

#define QBOAUTH_LOG(lvl, msg) \
    ::qboauth::log::logger::instance().log(lvl, msg, std::source_location::current())

#define QBOAUTH_TRACE(msg)  QBOAUTH_LOG(::qboauth::log::level::trace, msg)
#define QBOAUTH_DEBUG(msg)  QBOAUTH_LOG(::qboauth::log::level::debug, msg)
#define QBOAUTH_INFO(msg)   QBOAUTH_LOG(::qboauth::log::level::info, msg)
#define QBOAUTH_WARN(msg)   QBOAUTH_LOG(::qboauth::log::level::warn, msg)
#define QBOAUTH_ERROR(msg)  QBOAUTH_LOG(::qboauth::log::level::error, msg)
#define QBOAUTH_FATAL(msg)  QBOAUTH_LOG(::qboauth::log::level::fatal, msg)

#define QBOAUTH_TRACE_SEND(protocol, data) \
    ::qboauth::log::logger::instance().trace_protocol(protocol, ::qboauth::log::direction::send, data)

#define QBOAUTH_TRACE_RECV(protocol, data) \
    ::qboauth::log::logger::instance().trace_protocol(protocol, ::qboauth::log::direction::receive, data)

} // namespace qboauth::log
