// This file Copyright © Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#include <array>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <string_view>
#include <vector>

#include <fcntl.h>
#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>

#include <fmt/core.h>
#include <fmt/format.h>

#include "libseedctl/error.h"
#include "libseedctl/file.h"
#include "libseedctl/log.h"
#include "libseedctl/utils.h"

using namespace std::literals;

namespace
{
void set_system_error(sc_error* error, int code)
{
    if (error != nullptr)
    {
        error->set_from_errno(code);
    }
}

void set_system_error_if_file_found(sc_error* error, int code)
{
    if (code != ENOENT)
    {
        set_system_error(error, code);
    }
}
} // namespace

bool sc_sys_path_exists(std::string_view path, sc_error* error)
{
    auto const szpath = std::string{ path };

    bool const ret = access(szpath.c_str(), F_OK) != -1;

    if (!ret)
    {
        set_system_error_if_file_found(error, errno);
    }

    return ret;
}

bool sc_sys_path_is_relative(std::string_view path)
{
    return std::empty(path) || path.front() != '/';
}

std::string_view sc_sys_path_basename(std::string_view path)
{
    // As per the basename() manpage:
    // If path [is] an empty string, then basename() return[s] the string "."
    if (std::empty(path))
    {
        return "."sv;
    }

    // Remove all trailing slashes.
    // If nothing is left, return "/"
    if (auto pos = path.find_last_not_of('/'); pos != std::string_view::npos)
    {
        path = path.substr(0, pos + 1);
    }
    else // all slashes
    {
        return "/"sv;
    }

    if (auto pos = path.find_last_of('/'); pos != std::string_view::npos)
    {
        path.remove_prefix(pos + 1);
    }

    return std::empty(path) ? "/"sv : path;
}

std::string_view sc_sys_path_dirname(std::string_view path)
{
    auto const len = std::size(path);

    if (len == 0U)
    {
        return "."sv;
    }

    auto const has_root = path[0] == '/';
    auto end = std::string_view::npos;
    auto matched_slash = bool{ true };

    for (auto i = len - 1; i >= 1U; --i)
    {
        if (path[i] == '/')
        {
            if (!matched_slash)
            {
                end = i;
                break;
            }
        }
        else
        {
            // We saw the first non-path separator
            matched_slash = false;
        }
    }

    if (end == std::string_view::npos)
    {
        return has_root ? "/"sv : "."sv;
    }

    return path.substr(0, end);
}

std::string sc_sys_path_normalize(std::string_view path)
{
    if (std::empty(path))
    {
        return "."s;
    }

    auto const is_absolute = path.front() == '/';
    auto parts = std::vector<std::string_view>{};

    auto token = std::string_view{};
    while (sc_strv_sep(&path, &token, '/'))
    {
        if (std::empty(token) || token == "."sv)
        {
            continue;
        }

        if (token == ".."sv)
        {
            if (!std::empty(parts) && parts.back() != ".."sv)
            {
                parts.pop_back();
            }
            else if (!is_absolute)
            {
                parts.emplace_back(token);
            }

            continue;
        }

        parts.emplace_back(token);
    }

    auto ret = std::string{ is_absolute ? "/" : "" };
    ret += fmt::format("{}", fmt::join(parts, "/"));
    return std::empty(ret) ? "."s : ret;
}

std::string sc_sys_path_home()
{
    if (auto home = sc_env_get_string("HOME"sv); !std::empty(home))
    {
        return home;
    }

    if (auto const* const pw = getpwuid(getuid()); pw != nullptr && pw->pw_dir != nullptr)
    {
        return pw->pw_dir;
    }

    return {};
}

std::string sc_sys_path_expanduser(std::string_view path)
{
    if (path == "~"sv)
    {
        return sc_sys_path_home();
    }

    if (sc_strv_starts_with(path, "~/"sv))
    {
        path.remove_prefix(1);
        return sc_sys_path_home() + std::string{ path };
    }

    return std::string{ path };
}

bool sc_sys_dir_create(std::string_view path, int permissions, sc_error* error)
{
    auto const normalized = sc_sys_path_normalize(path);

    for (auto pos = normalized.find('/', 1U);; pos = normalized.find('/', pos + 1U))
    {
        auto const partial = normalized.substr(0, pos);

        if (struct stat sb = {}; stat(partial.c_str(), &sb) == -1)
        {
            if (mkdir(partial.c_str(), static_cast<mode_t>(permissions)) == -1 && errno != EEXIST)
            {
                set_system_error(error, errno);
                sc_logAddDebug(fmt::format("Couldn't create directory '{:s}': {:s}", partial, sc_strerror(errno)));
                return false;
            }
        }
        else if (!S_ISDIR(sb.st_mode))
        {
            sc_error_set(error, ENOTDIR, fmt::format("File exists: {:s}", partial));
            return false;
        }

        if (pos == std::string::npos)
        {
            break;
        }
    }

    return true;
}

// ---

bool sc_file_read(std::string_view filename, std::vector<char>& contents, sc_error* error)
{
    auto const szfilename = std::string{ filename };

    auto const fd = open(szfilename.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd == -1)
    {
        set_system_error(error, errno);
        return false;
    }

    contents.clear();

    auto buf = std::array<char, 4096>{};
    for (;;)
    {
        auto const n_read = read(fd, std::data(buf), std::size(buf));

        if (n_read == 0)
        {
            break;
        }

        if (n_read == -1)
        {
            if (errno == EINTR)
            {
                continue;
            }

            set_system_error(error, errno);
            close(fd);
            return false;
        }

        contents.insert(std::end(contents), std::data(buf), std::data(buf) + n_read);
    }

    close(fd);
    return true;
}

bool sc_file_save(std::string_view filename, std::string_view contents, sc_error* error)
{
    // Write it to a temp file first.
    // This is a safeguard against edge cases, e.g. disk full, crash while writing, etc.
    auto tmp = fmt::format("{:s}.tmp.XXXXXX", filename);
    auto const fd = mkstemp(std::data(tmp));
    if (fd == -1)
    {
        set_system_error(error, errno);
        return false;
    }

    // set file mode per settings umask()
    {
        auto const val = ::umask(0);
        ::umask(val);
        fchmod(fd, 0666 & ~val);
    }

    // Save the contents. This might take >1 pass.
    auto ok = true;
    while (!std::empty(contents))
    {
        auto const n_written = write(fd, std::data(contents), std::size(contents));
        if (n_written == -1)
        {
            if (errno == EINTR)
            {
                continue;
            }

            set_system_error(error, errno);
            ok = false;
            break;
        }

        contents.remove_prefix(static_cast<size_t>(n_written));
    }

    if (close(fd) == -1 && ok)
    {
        set_system_error(error, errno);
        ok = false;
    }

    // If we saved it to disk successfully, move it from '.tmp' to the correct filename
    auto const szfilename = std::string{ filename };
    if (!ok || rename(tmp.c_str(), szfilename.c_str()) == -1)
    {
        if (ok)
        {
            set_system_error(error, errno);
        }

        unlink(tmp.c_str());
        return false;
    }

    sc_logAddTrace(fmt::format("Saved '{}'", filename));
    return true;
}
