/*

qbo_connect.cpp
---------------

Connects an application to QuickBooks Online and keeps its tokens in a JSON file.

    qbo_connect [status|connect|refresh|disconnect|authorize] [tokens.json]

Credentials come from QBO_CLIENT_ID, QBO_CLIENT_SECRET, QBO_REALM_ID, QBO_REDIRECT_URI,
QBO_ENVIRONMENT and QBO_PRELOGIN_URL, or from the JSON secret file named by QBO_SECRETS_FILE.
QBOAUTH_LOG_LEVEL and QBOAUTH_TRACE control the log output.

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <csignal>
#include <iostream>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <boost/asio/signal_set.hpp>
#include "example_util.hpp"
#include <qboauth/qboauth.hpp>


using std::cout;
using std::endl;


int main(int argc, char* argv[])
{
    const std::string command = argc > 1 ? argv[1] : "status";
    const std::string tokens_path = argc > 2 ? argv[2] : "qbo_tokens.json";

    qboauth::log::configure_from_env();

    boost::asio::io_context io_ctx;
    qboauth::settings::json_settings_store settings(tokens_path);

    std::unique_ptr<qboauth::secrets::file_secret_store> secrets;
    if (auto file = qboauth::detail::getenv_nonempty("QBO_SECRETS_FILE"))
        secrets = std::make_unique<qboauth::secrets::file_secret_store>(*file);

    qboauth::lifecycle::lifecycle_options options;
    options.flow.application_name = "qbo_connect";
    options.flow.on_authorization_url = [](const std::string& url)
    {
        cout << "If no browser opens, visit:" << endl << "  " << url << endl;
    };

    qboauth::lifecycle::coordinator qbo(io_ctx, settings, secrets.get(), nullptr, options);

    // Ctrl-C cancels whatever is in progress
    std::stop_source stop;
    boost::asio::signal_set signals(io_ctx, SIGINT, SIGTERM);
    signals.async_wait([&stop](const boost::system::error_code& ec, int)
    {
        if (!ec)
            stop.request_stop();
    });

    int exit_code = 0;
    boost::asio::co_spawn(io_ctx,
        [&]() -> boost::asio::awaitable<void>
        {
            const auto token = stop.get_token();
            if (command == "status")
            {
                auto status = co_await qbo.status(token);
                if (!status)
                {
                    print_error(status.error());
                    exit_code = 1;
                    co_return;
                }
                cout << status->message;
                if (status->company)
                    cout << " (company " << *status->company << ")";
                cout << endl;
            }
            else if (command == "connect")
            {
                auto connected = co_await qbo.connect(token);
                if (!connected)
                {
                    print_error(connected.error());
                    exit_code = 1;
                    co_return;
                }
                cout << (*connected ? "Connected" : "Not connected") << endl;
                exit_code = *connected ? 0 : 2;
            }
            else if (command == "refresh" || command == "authorize" || command == "disconnect")
            {
                qboauth::result_void done;
                if (command == "refresh")
                    done = co_await qbo.refresh_token(token);
                else if (command == "authorize")
                    done = co_await qbo.authorize(token);
                else
                    done = co_await qbo.disconnect(token);
                if (!done)
                {
                    print_error(done.error());
                    exit_code = 1;
                    co_return;
                }
                cout << command << ": done" << endl;
            }
            else
            {
                cout << "usage: qbo_connect [status|connect|refresh|disconnect|authorize] [tokens.json]" << endl;
                exit_code = 64;
            }
        },
        [&](std::exception_ptr e)
        {
            signals.cancel();
            qbo.tunnel().shutdown();
            if (e)
            {
                try
                {
                    std::rethrow_exception(e);
                }
                catch (const std::exception& exc)
                {
                    std::cerr << "Unhandled exception: " << exc.what() << endl;
                    exit_code = 70;
                }
            }
        });

    io_ctx.run();
    return exit_code;
}
