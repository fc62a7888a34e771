/*

private_file.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Owner-only file writes for token and secret files.

*/

#pragma once

#include <filesystem>
#include <string_view>
#include <system_error>

#if defined(_WIN32)
#include <fstream>
#else
#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace qboauth::platform
{

/**
Replace the contents of `path` with `data`, the file readable and writable by the owner only.

The file is created with mode 0600, or restricted to it when it already existed, before the
first byte is written.

@throw std::filesystem::filesystem_error On any failure; the file may then be left partially written.
**/
inline void write_private_file(const std::filesystem::path& path, std::string_view data)
{
#if defined(_WIN32)
    {
        std::ofstream create(path, std::ios::binary | std::ios::app);
        if (!create)
            throw std::filesystem::filesystem_error("cannot create file", path,
                std::make_error_code(std::errc::permission_denied));
    }
    std::filesystem::permissions(path, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
        std::filesystem::perm_options::replace);

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
        throw std::filesystem::filesystem_error("cannot open file for writing", path,
            std::make_error_code(std::errc::permission_denied));
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    out.flush();
    if (!out)
        throw std::filesystem::filesystem_error("short write", path, std::make_error_code(std::errc::io_error));
#else
    auto failure = [&path](const char* what, int err)
    {
        return std::filesystem::filesystem_error(what, path, std::error_code(err, std::generic_category()));
    };

    const int fd = ::open(path.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, S_IRUSR | S_IWUSR);
    if (fd < 0)
        throw failure("cannot open file for writing", errno);

    // an existing file keeps its mode through open()
    if (::fchmod(fd, S_IRUSR | S_IWUSR) != 0)
    {
        const int err = errno;
        ::close(fd);
        throw failure("cannot restrict file permissions", err);
    }

    const char* p = data.data();
    std::size_t left = data.size();
    while (left > 0)
    {
        const ssize_t n = ::write(fd, p, left);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            const int err = errno;
            ::close(fd);
            throw failure("short write", err);
        }
        p += n;
        left -= static_cast<std::size_t>(n);
    }

    if (::fsync(fd) != 0)
    {
        const int err = errno;
        ::close(fd);
        throw failure("cannot flush file", err);
    }
    if (::close(fd) != 0)
        throw failure("cannot close file", errno);
#endif
}

} // namespace qboauth::platform
