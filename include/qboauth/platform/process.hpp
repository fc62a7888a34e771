/*

process.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Thin helpers over Boost.Process for short-lived platform commands.

*/

#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include <boost/filesystem/path.hpp>
#include <boost/process/args.hpp>
#include <boost/process/child.hpp>
#include <boost/process/exe.hpp>
#include <boost/process/io.hpp>
#include <boost/process/pipe.hpp>
#include <boost/process/search_path.hpp>

#include <qboauth/detail/result.hpp>

namespace qboauth::platform
{

/// Resolve an executable name through PATH, a name containing a separator is taken as is
[[nodiscard]] inline boost::filesystem::path find_executable(std::string_view name)
{
    const std::string text(name);
    if (text.find('/') != std::string::npos || text.find('\\') != std::string::npos)
        return boost::filesystem::path(text);
    return boost::process::search_path(text);
}

struct command_output
{
    int exit_code = -1;
    std::string output;
};

/// Run a command to completion and capture its standard output
[[nodiscard]] inline result<command_output> run_command(std::string_view program, const std::vector<std::string>& args)
{
    namespace bp = boost::process;

    const auto exe = find_executable(program);
    if (exe.empty())
        return fail<command_output>(errc::internal_error, "executable not found", "program=" + std::string(program));

    bp::ipstream out;
    std::error_code ec;
    bp::child child(bp::exe = exe, bp::args = args, bp::std_out > out, bp::std_err > bp::null, ec);
    if (ec)
        return fail<command_output>(make_error(errc::internal_error, "failed to start command",
            "program=" + std::string(program), ec));

    command_output captured;
    std::string line;
    while (std::getline(out, line))
    {
        captured.output += line;
        captured.output.push_back('\n');
    }

    child.wait(ec);
    if (ec)
        return fail<command_output>(make_error(errc::internal_error, "failed to wait for command",
            "program=" + std::string(program), ec));
    captured.exit_code = child.exit_code();
    return captured;
}

/**
Start a command without waiting for it.

A background thread waits for the child so that it does not linger as a zombie.

@return The process id.
**/
[[nodiscard]] inline result<int> launch_detached(std::string_view program, const std::vector<std::string>& args)
{
    namespace bp = boost::process;

    const auto exe = find_executable(program);
    if (exe.empty())
        return fail<int>(errc::internal_error, "executable not found", "program=" + std::string(program));

    std::error_code ec;
    bp::child child(bp::exe = exe, bp::args = args, bp::std_out > bp::null, bp::std_err > bp::null, ec);
    if (ec)
        return fail<int>(make_error(errc::internal_error, "failed to start command", "program=" + std::string(program), ec));

    const int pid = child.id();
    std::thread([reaped = std::move(child)]() mutable
    {
        std::error_code wait_ec;
        reaped.wait(wait_ec);
    }).detach();
    return pid;
}

} // namespace qboauth::platform
