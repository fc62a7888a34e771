/*

tunnel_supervisor.hpp
---------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Supervision of a `cloudflared` quick tunnel exposing the local webhook port under a
public trycloudflare.com URL. The tunnel is optional infrastructure: every failure is
logged and reported as `false`.

*/

#pragma once

#include <algorithm>
#include <atomic>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/process/args.hpp>
#include <boost/process/async_pipe.hpp>
#include <boost/process/child.hpp>
#include <boost/process/exe.hpp>
#include <boost/process/io.hpp>

#include <qboauth/detail/asio_decl.hpp>
#include <qboauth/detail/async_mutex.hpp>
#include <qboauth/detail/cancellation.hpp>
#include <qboauth/detail/env.hpp>
#include <qboauth/detail/log.hpp>
#include <qboauth/detail/one_shot.hpp>
#include <qboauth/detail/redact.hpp>
#include <qboauth/detail/regex.hpp>
#include <qboauth/platform/process.hpp>

namespace qboauth::tunnel
{

inline constexpr std::uint16_t DEFAULT_WEBHOOKS_PORT = 7207;
inline constexpr const char* PUBLIC_URL_PATTERN = R"(https?://[\w\-\.]+\.trycloudflare\.com)";
inline constexpr std::string_view ERROR_MARKER = "error";

struct tunnel_options
{
    /// Executable name (searched in PATH) or path
    std::string executable = "cloudflared";
    /// Appended after the generated arguments
    std::vector<std::string> extra_args;
    /// Local HTTPS port the tunnel forwards to
    std::uint16_t target_port = DEFAULT_WEBHOOKS_PORT;
    /// Upper bound of a readiness wait, whatever the caller's deadline
    std::chrono::steady_clock::duration readiness_ceiling = std::chrono::seconds{25};

    [[nodiscard]] std::string target_url() const
    {
        return std::format("https://localhost:{}", target_port);
    }

    [[nodiscard]] std::vector<std::string> arguments() const
    {
        std::vector<std::string> args{"tunnel", "--no-autoupdate", "--loglevel", "info", "--url", target_url()};
        args.insert(args.end(), extra_args.begin(), extra_args.end());
        return args;
    }

    /// CLOUDFLARED_EXE, CLOUDFLARED_ARGS (whitespace separated) and WEBHOOKS_PORT
    static tunnel_options from_env(const env_lookup& env)
    {
        tunnel_options options;
        if (!env)
            return options;

        if (auto exe = env("CLOUDFLARED_EXE"))
            options.executable = *exe;

        if (auto extra = env("CLOUDFLARED_ARGS"))
        {
            boost::algorithm::split(options.extra_args, *extra, boost::algorithm::is_space(),
                boost::algorithm::token_compress_on);
            options.extra_args.erase(std::remove(options.extra_args.begin(), options.extra_args.end(), std::string{}),
                options.extra_args.end());
        }

        if (auto port = env("WEBHOOKS_PORT"))
        {
            unsigned int value = 0;
            const auto res = std::from_chars(port->data(), port->data() + port->size(), value);
            if (res.ec == std::errc{} && res.ptr == port->data() + port->size() && value > 0 && value <= 65535)
                options.target_port = static_cast<std::uint16_t>(value);
            else
                QBOAUTH_WARN(std::format("Ignoring invalid WEBHOOKS_PORT '{}', using {}", *port, DEFAULT_WEBHOOKS_PORT));
        }
        return options;
    }
};

class tunnel_supervisor
{
public:
    tunnel_supervisor(qboauth::asio::io_context& ioc, tunnel_options options = {})
        : ioc_(ioc), strand_(qboauth::asio::make_strand(ioc)), options_(std::move(options)), gate_(strand_)
    {
    }

    tunnel_supervisor(const tunnel_supervisor&) = delete;
    tunnel_supervisor& operator=(const tunnel_supervisor&) = delete;

    ~tunnel_supervisor()
    {
        shutdown();
    }

    [[nodiscard]] const tunnel_options& options() const noexcept { return options_; }

    [[nodiscard]] std::string target_url() const { return options_.target_url(); }

    /// Public URL announced by the running process, if any yet
    [[nodiscard]] std::optional<std::string> public_url() const
    {
        std::lock_guard<std::mutex> lock(handle_mutex_);
        if (!handle_)
            return std::nullopt;
        std::lock_guard<std::mutex> output_lock(handle_->output->mutex);
        return handle_->output->url;
    }

    [[nodiscard]] bool is_running() const
    {
        std::lock_guard<std::mutex> lock(handle_mutex_);
        return running_locked();
    }

    /// A running process that printed no error line
    [[nodiscard]] bool is_usable() const
    {
        std::lock_guard<std::mutex> lock(handle_mutex_);
        return usable_locked();
    }

    /// Processes started over the supervisor's lifetime
    [[nodiscard]] std::size_t spawn_count() const noexcept
    {
        return spawns_.load(std::memory_order_acquire);
    }

    /**
    Make sure a tunnel process is running.

    A live process that reported no error makes this return true at once. Otherwise one
    process is started and its output watched for the public URL or an error line,
    waiting at most `min(deadline - now, readiness_ceiling)`. Nothing is started when that
    budget is already spent.

    @return true when a process is live with its URL announced, or was already live.
            false on spawn failure, error line (process terminated, also when the line came
            after an earlier wait gave up), timeout (process kept for the next call) or
            cancellation.
    **/
    qboauth::asio::awaitable<bool> ensure_tunnel(std::chrono::steady_clock::time_point deadline, std::stop_token stop = {})
    {
        if (live_.load(std::memory_order_acquire) && is_usable())
            co_return true;
        co_return co_await detail::run_on(strand_, ensure_on_strand(deadline, std::move(stop)));
    }

    /// Terminate the process and release the handle
    void shutdown() noexcept
    {
        std::lock_guard<std::mutex> lock(handle_mutex_);
        reset_locked();
    }

private:
    struct readiness
    {
        bool ok = false;
        /// Public URL when ok, the offending line otherwise
        std::string text;
    };

    /// Shared with the output readers, which may outlive a wait or the handle
    struct output_state
    {
        explicit output_state(qboauth::asio::any_io_executor ex)
            : ready(std::move(ex))
        {
        }

        detail::one_shot<readiness> ready;
        std::mutex mutex;
        std::optional<std::string> url;
        /// Set by the first error line, whether or not a wait was pending
        std::atomic<bool> errored{false};
    };

    struct handle
    {
        boost::process::child child;
        std::shared_ptr<boost::process::async_pipe> out;
        std::shared_ptr<boost::process::async_pipe> err;
        std::shared_ptr<output_state> output;
    };

    /// Runs on strand_, like the output readers
    qboauth::asio::awaitable<bool> ensure_on_strand(std::chrono::steady_clock::time_point deadline, std::stop_token stop)
    {
        auto lock = co_await gate_.lock(stop);
        if (!lock)
        {
            QBOAUTH_DEBUG(std::format("Tunnel start abandoned: {}", lock.error().to_string()));
            co_return false;
        }

        std::shared_ptr<output_state> output;
        {
            std::lock_guard<std::mutex> guard(handle_mutex_);
            if (usable_locked())
            {
                std::lock_guard<std::mutex> output_lock(handle_->output->mutex);
                if (handle_->output->url)
                    co_return true;
            }
            else if (handle_)
            {
                if (handle_->output->errored.load(std::memory_order_acquire))
                    QBOAUTH_INFO("Tunnel process reported an error since the last check, replacing it");
                else
                    QBOAUTH_INFO("Tunnel process exited, starting a new one");
                reset_locked();
            }
            if (handle_)
                output = handle_->output;
        }

        const auto budget = std::min<std::chrono::steady_clock::duration>(deadline - std::chrono::steady_clock::now(),
            options_.readiness_ceiling);
        if (budget <= std::chrono::steady_clock::duration::zero())
        {
            QBOAUTH_WARN("Tunnel readiness deadline already passed");
            co_return false;
        }

        if (!output)
        {
            auto started = spawn();
            if (!started)
            {
                QBOAUTH_WARN(std::format("Tunnel unavailable: {}", started.error().to_string()));
                co_return false;
            }
            output = *started;
        }

        auto event = co_await output->ready.async_wait(budget, stop, errc::tunnel_timeout, "tunnel readiness");
        if (!event)
        {
            if (event.error().is_cancelled())
                QBOAUTH_DEBUG("Tunnel readiness wait cancelled");
            else
                QBOAUTH_WARN(std::format("Tunnel did not report a public URL in time, keeping process for reuse ({})",
                    event.error().to_string()));
            co_return false;
        }

        if (!event->ok)
        {
            QBOAUTH_WARN(std::format("Tunnel reported an error, stopping it: {}", event->text));
            std::lock_guard<std::mutex> guard(handle_mutex_);
            reset_locked();
            co_return false;
        }

        QBOAUTH_INFO(std::format("Tunnel ready: {} -> {}", event->text, options_.target_url()));
        co_return true;
    }

    [[nodiscard]] bool usable_locked() const
    {
        return running_locked() && !handle_->output->errored.load(std::memory_order_acquire);
    }

    [[nodiscard]] bool running_locked() const
    {
        if (!handle_)
            return false;
        std::error_code ec;
        const bool running = handle_->child.running(ec);
        return running && !ec;
    }

    void reset_locked() noexcept
    {
        live_.store(false, std::memory_order_release);
        if (!handle_)
            return;

        std::error_code ec;
        if (handle_->child.running(ec))
        {
            handle_->child.terminate(ec);
            if (ec)
                QBOAUTH_WARN(std::format("Terminating tunnel process failed: {}", ec.message()));
        }
        if (handle_->child.valid() && !ec)
            handle_->child.wait(ec);

        qboauth::asio::dispatch(strand_, [out = handle_->out, err = handle_->err]()
        {
            qboauth::asio::error_code ignored;
            out->close(ignored);
            err->close(ignored);
        });
        handle_.reset();
    }

    result<std::shared_ptr<output_state>> spawn()
    {
        namespace bp = boost::process;

        const auto exe = platform::find_executable(options_.executable);
        if (exe.empty())
            return fail<std::shared_ptr<output_state>>(errc::tunnel_start_failed,
                std::format("tunnel executable '{}' not found", options_.executable));

        auto out = std::make_shared<bp::async_pipe>(ioc_);
        auto err = std::make_shared<bp::async_pipe>(ioc_);
        auto output = std::make_shared<output_state>(strand_);

        std::error_code ec;
        bp::child child(bp::exe = exe, bp::args = options_.arguments(),
            bp::std_out > *out, bp::std_err > *err, bp::std_in < bp::null, ec);
        if (ec)
        {
            return fail<std::shared_ptr<output_state>>(make_error(errc::tunnel_start_failed,
                std::format("failed to start '{}'", exe.string()), {}, ec));
        }

        spawns_.fetch_add(1, std::memory_order_acq_rel);
        QBOAUTH_INFO(std::format("Started tunnel process {} (pid {}) for {}", exe.string(), child.id(), options_.target_url()));

        qboauth::asio::co_spawn(strand_, read_lines(out, output), qboauth::asio::detached);
        qboauth::asio::co_spawn(strand_, read_lines(err, output), qboauth::asio::detached);

        std::lock_guard<std::mutex> guard(handle_mutex_);
        handle_ = std::make_unique<handle>(handle{std::move(child), std::move(out), std::move(err), output});
        live_.store(true, std::memory_order_release);
        return output;
    }

    /// Consume one output stream line by line until EOF or close
    static qboauth::asio::awaitable<void> read_lines(std::shared_ptr<boost::process::async_pipe> pipe,
        std::shared_ptr<output_state> output)
    {
        static const detail::regex url_pattern = detail::make_icase_regex(PUBLIC_URL_PATTERN);

        std::string buffer;
        while (true)
        {
            auto [ec, n] = co_await qboauth::asio::async_read_until(*pipe, qboauth::asio::dynamic_buffer(buffer), '\n',
                qboauth::asio::use_nothrow_awaitable);
            if (ec)
            {
                if (!buffer.empty())
                    inspect(buffer, *output, url_pattern);
                co_return;
            }

            std::string line = buffer.substr(0, n);
            buffer.erase(0, n);
            while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
                line.pop_back();
            inspect(line, *output, url_pattern);
        }
    }

    static void inspect(const std::string& line, output_state& output, const detail::regex& url_pattern)
    {
        if (line.empty())
            return;
        QBOAUTH_TRACE_RECV("TUNNEL", line);

        detail::smatch match;
        if (detail::regex_search(line, match, url_pattern))
        {
            const std::string url = match.str(0);
            {
                std::lock_guard<std::mutex> lock(output.mutex);
                if (!output.url)
                    output.url = url;
            }
            output.ready.resolve(readiness{true, url});
            return;
        }

        if (detail::contains_ci(line, ERROR_MARKER))
        {
            QBOAUTH_WARN(std::format("cloudflared: {}", line));
            output.errored.store(true, std::memory_order_release);
            output.ready.resolve(readiness{false, line});
        }
    }

    qboauth::asio::io_context& ioc_;
    /// Readers, readiness waits and pipe closes
    qboauth::asio::any_io_executor strand_;
    tunnel_options options_;
    detail::async_mutex gate_;
    mutable std::mutex handle_mutex_;
    std::unique_ptr<handle> handle_;
    std::atomic<bool> live_{false};
    std::atomic<std::size_t> spawns_{0};
};

} // namespace qboauth::tunnel
